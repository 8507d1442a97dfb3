#include <gtest/gtest.h>
#include "lspc/transport/stdio_transport.hpp"
#include "lspc/codec.hpp"
#include "lspc/error.hpp"
#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace lspc;
using namespace std::chrono_literals;

namespace {

// A transport whose far ends are plain pipe descriptors owned by the test.
class PipePeer {
public:
    PipePeer() {
        int to_transport[2], from_transport[2];
        if (pipe(to_transport) < 0 || pipe(from_transport) < 0) {
            throw std::runtime_error("pipe failed");
        }
        write_fd_ = to_transport[1];
        read_fd_ = from_transport[0];
        transport_ = std::make_unique<StdioTransport>(to_transport[0], from_transport[1]);
    }

    ~PipePeer() {
        close_write();
        if (read_fd_ >= 0) ::close(read_fd_);
    }

    StdioTransport& transport() { return *transport_; }

    void write(const std::string& bytes) {
        ASSERT_EQ(::write(write_fd_, bytes.data(), bytes.size()),
                  static_cast<ssize_t>(bytes.size()));
    }

    void close_write() {
        if (write_fd_ >= 0) ::close(write_fd_);
        write_fd_ = -1;
    }

    /// Read until n complete frames have arrived.
    std::vector<Message> read_frames(size_t n) {
        std::vector<Message> out;
        Framer framer;
        char buf[4096];
        while (out.size() < n) {
            ssize_t r = ::read(read_fd_, buf, sizeof(buf));
            if (r <= 0) break;
            framer.feed(std::string_view(buf, static_cast<size_t>(r)),
                        [&out](Message m) { out.push_back(std::move(m)); });
        }
        return out;
    }

private:
    int write_fd_{-1};
    int read_fd_{-1};
    std::unique_ptr<StdioTransport> transport_;
};

struct Inbox {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Message> messages;
    std::vector<std::string> errors;

    void push(Message m) {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(std::move(m));
        cv.notify_all();
    }
    void error(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex);
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& ex) {
            errors.emplace_back(ex.what());
        }
        cv.notify_all();
    }
    bool wait_for(size_t n, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return messages.size() >= n; });
    }
};

} // anonymous namespace

TEST(StdioTransport, ReceivesFramedMessages) {
    PipePeer peer;
    Inbox inbox;
    std::thread reader([&] {
        peer.transport().start([&](Message m) { inbox.push(std::move(m)); });
    });

    Notification notif;
    notif.method = "window/logMessage";
    std::string wire = Framer::encode(notif);
    peer.write(wire.substr(0, 10));
    std::this_thread::sleep_for(50ms);
    peer.write(wire.substr(10) + Framer::frame(R"({"jsonrpc":"2.0","id":1,"result":null})"));

    ASSERT_TRUE(inbox.wait_for(2));
    EXPECT_TRUE(std::holds_alternative<Notification>(inbox.messages[0]));
    EXPECT_TRUE(std::holds_alternative<Response>(inbox.messages[1]));

    peer.transport().shutdown();
    reader.join();
}

TEST(StdioTransport, SendWritesOneFramePerMessage) {
    PipePeer peer;
    std::thread reader([&] { peer.transport().start([](Message) {}); });

    std::vector<std::thread> senders;
    for (int t = 0; t < 4; ++t) {
        senders.emplace_back([&, t] {
            for (int i = 0; i < 25; ++i) {
                Request req;
                req.id = RequestId{int64_t{t * 100 + i}};
                req.method = "test/echo";
                req.params = nlohmann::json{{"payload", std::string(500, static_cast<char>('a' + t))}};
                peer.transport().send(req);
            }
        });
    }
    for (auto& s : senders) s.join();

    auto frames = peer.read_frames(100);
    ASSERT_EQ(frames.size(), 100u);
    for (const auto& f : frames) {
        ASSERT_TRUE(std::holds_alternative<Request>(f));
    }

    peer.transport().shutdown();
    reader.join();
}

TEST(StdioTransport, StartReturnsOnPeerEof) {
    PipePeer peer;
    std::thread reader([&] { peer.transport().start([](Message) {}); });
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(peer.transport().is_connected());

    peer.close_write();
    reader.join();
    EXPECT_FALSE(peer.transport().is_connected());

    Notification late;
    late.method = "exit";
    EXPECT_THROW(peer.transport().send(late), LspTransportError);
}

TEST(StdioTransport, MalformedBodyIsReportedAndSkipped) {
    PipePeer peer;
    Inbox inbox;
    std::thread reader([&] {
        peer.transport().start([&](Message m) { inbox.push(std::move(m)); },
                               [&](std::exception_ptr e) { inbox.error(e); });
    });

    peer.write(Framer::frame("{oops") + Framer::frame(R"({"jsonrpc":"2.0","method":"ok"})"));
    ASSERT_TRUE(inbox.wait_for(1));
    {
        std::lock_guard<std::mutex> lock(inbox.mutex);
        EXPECT_EQ(inbox.errors.size(), 1u);
    }
    EXPECT_TRUE(peer.transport().is_connected());

    peer.transport().shutdown();
    reader.join();
}

TEST(StdioTransport, FramingErrorClosesConnection) {
    PipePeer peer;
    Inbox inbox;
    std::thread reader([&] {
        peer.transport().start([&](Message m) { inbox.push(std::move(m)); },
                               [&](std::exception_ptr e) { inbox.error(e); });
    });

    peer.write("X-Bogus: yes\r\n\r\n{}");
    reader.join();  // the receive loop ends by itself
    EXPECT_FALSE(peer.transport().is_connected());
    ASSERT_EQ(inbox.errors.size(), 1u);
    EXPECT_NE(inbox.errors[0].find("Content-Length"), std::string::npos);
}

TEST(StdioTransport, NotConnectedBeforeStart) {
    PipePeer peer;
    EXPECT_FALSE(peer.transport().is_connected());
}

TEST(StdioTransport, ShutdownBeforeStart) {
    PipePeer peer;
    peer.transport().shutdown();
    peer.transport().start([](Message) {});  // returns immediately
    Notification n;
    n.method = "exit";
    EXPECT_THROW(peer.transport().send(n), LspTransportError);
}

TEST(StdioTransport, ConstructorFailureReleasesDescriptors) {
    int in[2], out[2];
    ASSERT_EQ(pipe(in), 0);
    ASSERT_EQ(pipe(out), 0);

    // Cap the descriptor table at its current high-water mark so the
    // transport cannot open its wakeup pipe.
    struct rlimit saved;
    ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &saved), 0);
    int lowest_free = ::dup(in[0]);
    ASSERT_GE(lowest_free, 0);
    ::close(lowest_free);
    struct rlimit tight = saved;
    tight.rlim_cur = static_cast<rlim_t>(lowest_free);
    ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &tight), 0);

    bool threw = false;
    try {
        StdioTransport transport(in[0], out[1]);
    } catch (const LspTransportError&) {
        threw = true;
    }
    EXPECT_EQ(setrlimit(RLIMIT_NOFILE, &saved), 0);

    EXPECT_TRUE(threw);
    EXPECT_EQ(fcntl(in[0], F_GETFD), -1);
    EXPECT_EQ(fcntl(out[1], F_GETFD), -1);
    ::close(in[1]);
    ::close(out[0]);
}
