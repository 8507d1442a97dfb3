#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace lspc {

using HandlerResult = std::variant<nlohmann::json, ResponseError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;
using NotificationObserver = std::function<void(const std::string& method,
                                                const nlohmann::json& params)>;

/// Dispatches messages initiated by the remote side: notifications to their
/// handler and observers, requests to their handler. Responses are not
/// routed here; they belong to the pending request table.
class Router {
public:
    /// Register (or replace) the handler for a remote-initiated request.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register (or replace) the handler for a notification method.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Observe every notification, after its method handler ran.
    void add_observer(NotificationObserver observer);

    /// Dispatch an incoming message. Returns the response to send back for
    /// requests; nothing for notifications.
    [[nodiscard]] std::optional<Message> dispatch(const Message& msg);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
    std::vector<NotificationObserver> observers_;
};

} // namespace lspc
