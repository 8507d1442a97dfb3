#include <gtest/gtest.h>
#include "lspc/pending_requests.hpp"
#include "lspc/error.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace lspc;
using namespace std::chrono_literals;

namespace {

Response ok_response(int64_t id, nlohmann::json result) {
    Response resp;
    resp.id = RequestId{id};
    resp.result = std::move(result);
    return resp;
}

} // anonymous namespace

TEST(PendingRequests, IdsStartAtZeroAndIncrease) {
    PendingRequests table;
    auto a = table.add("a", 1s);
    auto b = table.add("b", 1s);
    auto c = table.add("c", 1s);
    EXPECT_EQ(a.id, 0);
    EXPECT_EQ(b.id, 1);
    EXPECT_EQ(c.id, 2);
    EXPECT_EQ(table.size(), 3u);
}

TEST(PendingRequests, CompleteDeliversResultAndRemovesEntry) {
    PendingRequests table;
    auto h = table.add("textDocument/hover", 1s);
    EXPECT_TRUE(table.contains(h.id));

    EXPECT_TRUE(table.complete(ok_response(h.id, {{"contents", "doc"}})));
    EXPECT_FALSE(table.contains(h.id));
    EXPECT_EQ(h.result.get()["contents"], "doc");
}

TEST(PendingRequests, CompleteWithRemoteError) {
    PendingRequests table;
    auto h = table.add("textDocument/definition", 1s);

    Response resp;
    resp.id = RequestId{h.id};
    resp.error = ResponseError{-32803, "failed", nlohmann::json{{"why", "x"}}};
    EXPECT_TRUE(table.complete(resp));

    try {
        (void)h.result.get();
        FAIL() << "expected LspRemoteError";
    } catch (const LspRemoteError& e) {
        EXPECT_EQ(e.code, -32803);
        EXPECT_STREQ(e.what(), "failed");
        ASSERT_TRUE(e.data.has_value());
        EXPECT_EQ((*e.data)["why"], "x");
    }
}

TEST(PendingRequests, UnknownIdIsIgnored) {
    PendingRequests table;
    auto h = table.add("a", 1s);
    EXPECT_FALSE(table.complete(ok_response(999, nullptr)));

    Response string_id;
    string_id.id = RequestId{std::string("0")};
    string_id.result = nullptr;
    EXPECT_FALSE(table.complete(string_id));

    EXPECT_TRUE(table.contains(h.id));
    EXPECT_EQ(h.result.wait_for(0ms), std::future_status::timeout);
}

TEST(PendingRequests, SecondResolutionIsRejected) {
    PendingRequests table;
    auto h = table.add("a", 1s);
    EXPECT_TRUE(table.complete(ok_response(h.id, 1)));
    EXPECT_FALSE(table.complete(ok_response(h.id, 2)));
    EXPECT_FALSE(table.expire(h.id));
    EXPECT_EQ(table.cancel_all("stop"), 0u);
    EXPECT_EQ(h.result.get(), 1);
}

TEST(PendingRequests, ExpireRejectsWithTimeout) {
    PendingRequests table;
    auto h = table.add("textDocument/hover", 50ms);
    EXPECT_TRUE(table.expire(h.id));
    EXPECT_FALSE(table.contains(h.id));
    EXPECT_THROW(h.result.get(), LspTimeoutError);
}

TEST(PendingRequests, DeadlineFollowsTimeout) {
    PendingRequests table;
    auto before = std::chrono::steady_clock::now();
    auto h = table.add("textDocument/completion", 10s);
    EXPECT_GE(h.deadline, before + 10s);
    EXPECT_LE(h.deadline, std::chrono::steady_clock::now() + 10s);
}

TEST(PendingRequests, CancelAllRejectsEverythingAndCloses) {
    PendingRequests table;
    auto a = table.add("a", 1s);
    auto b = table.add("b", 1s);

    EXPECT_EQ(table.cancel_all("session stopped"), 2u);
    EXPECT_EQ(table.size(), 0u);
    EXPECT_THROW(a.result.get(), LspCancelledError);
    EXPECT_THROW(b.result.get(), LspCancelledError);

    EXPECT_TRUE(table.closed());
    EXPECT_THROW((void)table.add("c", 1s), LspCancelledError);

    table.reopen();
    auto c = table.add("c", 1s);
    EXPECT_GT(c.id, b.id);
}

TEST(PendingRequests, RejectWithCustomError) {
    PendingRequests table;
    auto h = table.add("a", 1s);
    EXPECT_TRUE(table.reject(h.id, std::make_exception_ptr(LspTransportError("pipe closed"))));
    EXPECT_THROW(h.result.get(), LspTransportError);
}

TEST(PendingRequests, ConcurrentAddsGetUniqueIds) {
    PendingRequests table;
    std::vector<int64_t> ids;
    std::mutex ids_mutex;

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 100; ++j) {
                auto h = table.add("m", 1s);
                std::lock_guard<std::mutex> lock(ids_mutex);
                ids.push_back(h.id);
            }
        });
    }
    for (auto& t : threads) t.join();

    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(std::unique(ids.begin(), ids.end()), ids.end());
    EXPECT_EQ(table.size(), 800u);
}

// Response, expiry and cancellation race for the same entries; every entry
// must end up resolved exactly once.
TEST(PendingRequests, RacingResolutionsResolveExactlyOnce) {
    for (int round = 0; round < 50; ++round) {
        PendingRequests table;
        std::vector<PendingHandle> handles;
        for (int i = 0; i < 20; ++i) handles.push_back(table.add("m", 1s));

        std::atomic<int> wins{0};
        std::atomic<bool> go{false};
        auto wait_go = [&] { while (!go) std::this_thread::yield(); };

        std::thread responder([&] {
            wait_go();
            for (auto& h : handles) {
                if (table.complete(ok_response(h.id, h.id))) ++wins;
            }
        });
        std::thread expirer([&] {
            wait_go();
            for (auto it = handles.rbegin(); it != handles.rend(); ++it) {
                if (table.expire(it->id)) ++wins;
            }
        });
        std::thread canceller([&] {
            wait_go();
            wins += static_cast<int>(table.cancel_all("stop"));
        });
        go = true;
        responder.join();
        expirer.join();
        canceller.join();

        EXPECT_EQ(wins.load(), 20);
        for (auto& h : handles) {
            ASSERT_EQ(h.result.wait_for(0ms), std::future_status::ready);
        }
        EXPECT_EQ(table.size(), 0u);
    }
}
