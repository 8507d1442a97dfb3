#include "lspc/process.hpp"
#include "lspc/error.hpp"
#include "lspc/log.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <cerrno>
#include <csignal>
#include <cstring>

namespace lspc {

namespace {

constexpr int kStderrPollIntervalMs = 100;

void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

} // anonymous namespace

ChildProcess::~ChildProcess() {
    terminate(std::chrono::milliseconds(0));
}

void ChildProcess::spawn(const Options& opts, StderrSink sink) {
    if (pid_ > 0) {
        throw LspSpawnError("Process already spawned");
    }
    if (opts.command.empty()) {
        throw LspSpawnError("No command configured");
    }

    int in_pipe[2] = {-1, -1}, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // carries errno if exec fails
    if (::pipe2(in_pipe, O_CLOEXEC) < 0 || ::pipe2(out_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) < 0 || ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        throw LspSpawnError(std::string("Failed to create pipes: ") + strerror(err));
    }

    // argv is built before fork; only async-signal-safe calls happen in the child.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(opts.command);
    argv_storage.insert(argv_storage.end(), opts.args.begin(), opts.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);
    const char* cwd = opts.working_directory ? opts.working_directory->c_str() : nullptr;

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        throw LspSpawnError(std::string("Failed to fork: ") + strerror(err));
    }
    if (pid == 0) {
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        if (cwd && ::chdir(cwd) < 0) {
            int err = errno;
            ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    // exec_pipe is close-on-exec: EOF means exec succeeded.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n > 0) {
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        throw LspSpawnError("Failed to start '" + opts.command + "': " + strerror(child_errno));
    }

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    terminated_ = false;
    stop_forwarding_ = false;
    logger()->info("spawned '{}' (pid {})", opts.command, pid_);

    if (!sink) {
        sink = [](std::string_view line) {
            logger()->info("server stderr: {}", line);
        };
    }
    stderr_thread_ = std::thread([this, s = std::move(sink)]() { stderr_loop(s); });
}

int ChildProcess::take_stdin() noexcept {
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ChildProcess::take_stdout() noexcept {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

void ChildProcess::stderr_loop(StderrSink sink) {
    std::string pending;
    char chunk[4096];

    auto flush_lines = [&](bool all) {
        size_t pos = 0;
        while (true) {
            size_t nl = pending.find('\n', pos);
            if (nl == std::string::npos) break;
            std::string_view line(pending.data() + pos, nl - pos);
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            sink(line);
            pos = nl + 1;
        }
        pending.erase(0, pos);
        if (all && !pending.empty()) {
            sink(pending);
            pending.clear();
        }
    };

    while (true) {
        struct pollfd pfd;
        pfd.fd = stderr_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ret = ::poll(&pfd, 1, kStderrPollIntervalMs);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) {
            if (stop_forwarding_) break;
            continue;
        }
        ssize_t n = ::read(stderr_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;
        pending.append(chunk, static_cast<size_t>(n));
        flush_lines(false);
    }
    flush_lines(true);
}

bool ChildProcess::reap(bool block) {
    if (pid_ <= 0 || exit_status_) return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == 0) return false;
    if (r < 0) {
        // Already reaped elsewhere; nothing left to wait for.
        exit_status_ = -1;
        return true;
    }
    if (WIFEXITED(status)) {
        exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status_ = 128 + WTERMSIG(status);
    } else {
        return false;
    }
    return true;
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (reap(false)) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool ChildProcess::is_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0) return false;
    return !reap(false);
}

std::optional<int> ChildProcess::exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_status_;
}

void ChildProcess::close_fds() {
    if (stdin_fd_ >= 0)  { ::close(stdin_fd_);  stdin_fd_ = -1; }
    if (stdout_fd_ >= 0) { ::close(stdout_fd_); stdout_fd_ = -1; }
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || terminated_) return;
    terminated_ = true;

    // Closing stdin lets a well-behaved server exit on EOF.
    close_fds();

    if (!wait_for_exit(grace)) {
        logger()->debug("pid {} still running, sending SIGTERM", pid_);
        ::kill(pid_, SIGTERM);
        if (!wait_for_exit(std::chrono::milliseconds(500))) {
            logger()->warn("pid {} ignored SIGTERM, sending SIGKILL", pid_);
            ::kill(pid_, SIGKILL);
            reap(true);
        }
    }
    logger()->info("pid {} exited with status {}", pid_, exit_status_.value_or(-1));

    stop_forwarding_ = true;
    if (stderr_thread_.joinable()) stderr_thread_.join();
    if (stderr_fd_ >= 0) { ::close(stderr_fd_); stderr_fd_ = -1; }
}

} // namespace lspc
