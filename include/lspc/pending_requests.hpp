#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace lspc {

/// Outcome slot for one outgoing request.
struct PendingRequest {
    std::string method;
    std::chrono::steady_clock::time_point deadline;
    std::promise<nlohmann::json> result;
};

/// A registered request: its id and the future its caller waits on.
struct PendingHandle {
    int64_t id;
    std::chrono::steady_clock::time_point deadline;
    std::future<nlohmann::json> result;
};

/// Table of requests awaiting a response.
///
/// Every resolution path (response, expiry, cancellation) removes the entry
/// under the table's lock before touching its promise, so each request is
/// resolved exactly once no matter which path wins.
class PendingRequests {
public:
    /// Allocate the next id and record a pending entry.
    /// Throws LspCancelledError once the table has been closed.
    [[nodiscard]] PendingHandle add(const std::string& method,
                                    std::chrono::milliseconds timeout);

    /// Resolve the entry matching resp.id with its result or remote error.
    /// Returns false if no such entry is outstanding.
    bool complete(const Response& resp);

    /// Reject the entry with an arbitrary error. Returns false if it was
    /// already resolved.
    bool reject(int64_t id, std::exception_ptr error);

    /// Reject the entry with LspTimeoutError. Returns false if it was
    /// already resolved.
    bool expire(int64_t id);

    /// Reject every outstanding entry with LspCancelledError and refuse
    /// further additions until reopen().
    std::size_t cancel_all(const std::string& reason);

    /// Accept additions again. Ids keep increasing.
    void reopen();

    [[nodiscard]] bool contains(int64_t id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool closed() const;

private:
    std::optional<PendingRequest> take(int64_t id);

    mutable std::mutex mutex_;
    std::map<int64_t, PendingRequest> entries_;
    int64_t next_id_{0};
    bool closed_{false};
};

} // namespace lspc
