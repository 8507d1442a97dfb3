#include "lspc/transport/stdio_transport.hpp"
#include "lspc/error.hpp"
#include "lspc/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <string>

namespace lspc {

namespace {

constexpr int kWritePollIntervalMs = 100;

void make_wakeup_pipe(int fds[2]) {
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw LspTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
    make_wakeup_pipe(wakeup_pipe_);
}

StdioTransport::StdioTransport(int read_fd, int write_fd, std::size_t max_content_length)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true), framer_(max_content_length) {
    try {
        make_wakeup_pipe(wakeup_pipe_);
    } catch (const LspTransportError&) {
        // The destructor will not run; the descriptors are ours already.
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
        throw;
    }
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // If shutdown() was called before start(), don't block.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;

    writer_thread_ = std::thread([this]() { write_loop(); });
    read_loop(on_message, on_error);

    connected_ = false;
    closed_ = true;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        running_ = false;
    }
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    char chunk[8192];

    while (running_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    LspTransportError(std::string("poll failed: ") + strerror(errno))));
            }
            break;
        }

        // Wakeup pipe has data: shutdown() was called.
        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    LspTransportError(std::string("Read error: ") + strerror(errno))));
            }
            break;
        }
        if (n == 0) {
            logger()->debug("transport: peer closed its output stream");
            break;
        }

        try {
            framer_.feed(std::string_view(chunk, static_cast<size_t>(n)), on_message, on_error);
        } catch (const LspFramingError& e) {
            logger()->error("transport: {}", e.what());
            if (on_error) on_error(std::current_exception());
            break;
        } catch (const std::exception& e) {
            logger()->error("transport: message handler failed: {}", e.what());
            if (on_error) on_error(std::current_exception());
        }
    }
}

void StdioTransport::write_loop() {
    // A peer that exits must surface as EPIPE on this thread, not kill the process.
    sigset_t block;
    sigemptyset(&block);
    sigaddset(&block, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &block, nullptr);

    while (true) {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || !running_;
            });
            if (write_queue_.empty()) break;
            frame = std::move(write_queue_.front());
            write_queue_.pop();
        }

        const char* data = frame.data();
        size_t remaining = frame.size();
        while (remaining > 0) {
            struct pollfd pfd;
            pfd.fd = write_fd_;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            int ready = ::poll(&pfd, 1, kWritePollIntervalMs);
            if (ready < 0 && errno != EINTR) break;
            if (ready <= 0) {
                // A stalled peer must not keep a shut-down transport alive.
                if (shutdown_requested_) break;
                continue;
            }
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                logger()->warn("transport: write failed: {}", strerror(errno));
                connected_ = false;
                std::lock_guard<std::mutex> lock(write_mutex_);
                write_queue_ = {};
                return;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
        if (remaining > 0) {
            logger()->warn("transport: dropped {} unwritten bytes on shutdown", remaining);
            return;
        }
    }
}

void StdioTransport::send(const Message& msg) {
    send_raw(Framer::encode(msg));
}

void StdioTransport::send_raw(std::string bytes) {
    if (shutdown_requested_.load()) {
        throw LspTransportError("Transport shut down");
    }
    if (closed_.load()) {
        throw LspTransportError("Transport closed by peer");
    }
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(bytes));
    }
    write_cv_.notify_one();
}

void StdioTransport::wake_reader() {
    char b = 1;
    if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
        logger()->warn("transport: failed to signal reader: {}", strerror(errno));
    }
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    connected_ = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        running_ = false;
    }
    write_cv_.notify_all();
    wake_reader();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace lspc
