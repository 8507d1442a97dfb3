#pragma once
#include "transport.hpp"
#include "../framer.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>

namespace lspc {

/// StdioTransport exchanges Content-Length framed messages over a pair of
/// file descriptors. The receive loop runs on the thread that calls start();
/// a background writer drains a queue so concurrent senders never
/// interleave partial frames.
class StdioTransport : public ITransport {
public:
    /// Create transport using the process's own stdin/stdout.
    StdioTransport();

    /// Create transport over the given descriptors, which it takes ownership of.
    StdioTransport(int read_fd, int write_fd,
                   std::size_t max_content_length = DEFAULT_MAX_CONTENT_LENGTH);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const Message& msg) override;
    void shutdown() override;
    bool is_connected() const override;

    /// Write raw bytes, bypassing the framer. Used to exercise peers with
    /// malformed input.
    void send_raw(std::string bytes);

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void write_loop();
    void wake_reader();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    Framer framer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> closed_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for interrupting poll() in the reader
};

} // namespace lspc
