#include "lspc/pending_requests.hpp"
#include "lspc/error.hpp"

namespace lspc {

PendingHandle PendingRequests::add(const std::string& method,
                                   std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw LspCancelledError("Session stopped; request '" + method + "' not sent");
    }
    // Skip ids still held by an outstanding entry after wrap-around.
    int64_t id = next_id_;
    while (entries_.count(id) > 0) ++id;
    next_id_ = id == INT64_MAX ? 0 : id + 1;

    PendingRequest req;
    req.method = method;
    req.deadline = std::chrono::steady_clock::now() + timeout;

    PendingHandle handle;
    handle.id = id;
    handle.deadline = req.deadline;
    handle.result = req.result.get_future();
    entries_.emplace(id, std::move(req));
    return handle;
}

bool PendingRequests::complete(const Response& resp) {
    auto* int_id = std::get_if<int64_t>(&resp.id);
    if (!int_id) return false;  // this table never issues string ids

    auto req = take(*int_id);
    if (!req) return false;
    if (resp.error) {
        req->result.set_exception(std::make_exception_ptr(
            LspRemoteError(resp.error->code, resp.error->message, resp.error->data)));
    } else {
        req->result.set_value(resp.result ? *resp.result : nlohmann::json(nullptr));
    }
    return true;
}

std::optional<PendingRequest> PendingRequests::take(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    std::optional<PendingRequest> req(std::move(it->second));
    entries_.erase(it);
    return req;
}

bool PendingRequests::reject(int64_t id, std::exception_ptr error) {
    auto req = take(id);
    if (!req) return false;
    req->result.set_exception(std::move(error));
    return true;
}

bool PendingRequests::expire(int64_t id) {
    auto req = take(id);
    if (!req) return false;
    req->result.set_exception(std::make_exception_ptr(
        LspTimeoutError("Request timed out: " + req->method)));
    return true;
}

std::size_t PendingRequests::cancel_all(const std::string& reason) {
    std::map<int64_t, PendingRequest> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cancelled.swap(entries_);
    }
    for (auto& [id, req] : cancelled) {
        req.result.set_exception(std::make_exception_ptr(
            LspCancelledError("Request '" + req.method + "' cancelled: " + reason)));
    }
    return cancelled.size();
}

void PendingRequests::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

bool PendingRequests::contains(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

std::size_t PendingRequests::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool PendingRequests::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace lspc
