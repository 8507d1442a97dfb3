#pragma once
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace lspc {

/// Receives each line the child writes to its stderr, without the newline.
using StderrSink = std::function<void(std::string_view line)>;

/// ChildProcess owns one child whose standard streams are pipes.
///
/// stdin and stdout are handed to a transport with take_stdin() /
/// take_stdout(); stderr stays with the process and is forwarded line by
/// line to a sink on a background thread.
class ChildProcess {
public:
    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::optional<std::string> working_directory;
    };

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// Fork and exec. Throws LspSpawnError if the pipes cannot be created,
    /// the fork fails, or the command cannot be executed.
    void spawn(const Options& opts, StderrSink sink = nullptr);

    /// Transfer ownership of the write end of the child's stdin.
    [[nodiscard]] int take_stdin() noexcept;
    /// Transfer ownership of the read end of the child's stdout.
    [[nodiscard]] int take_stdout() noexcept;

    /// Wait up to grace for the child to exit on its own, then SIGTERM, then
    /// SIGKILL. Reaps the child and stops stderr forwarding. Idempotent.
    void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(500));

    [[nodiscard]] bool is_running();
    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /// Exit code, or 128 + signal number, once the child has been reaped.
    [[nodiscard]] std::optional<int> exit_status() const;

private:
    bool reap(bool block);
    bool wait_for_exit(std::chrono::milliseconds timeout);
    void stderr_loop(StderrSink sink);
    void close_fds();

    pid_t pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    mutable std::mutex mutex_;
    std::optional<int> exit_status_;
    bool terminated_{false};

    std::atomic<bool> stop_forwarding_{false};
    std::thread stderr_thread_;
};

} // namespace lspc
