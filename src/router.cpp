#include "lspc/router.hpp"
#include "lspc/error.hpp"
#include "lspc/log.hpp"

namespace lspc {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

void Router::add_observer(NotificationObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<Message> Router::dispatch(const Message& msg) {
    if (const auto* req = std::get_if<Request>(&msg)) {
        RequestHandler handler;
        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(req->method);
            if (it != request_handlers_.end()) handler = it->second;
        }

        Response resp;
        resp.id = req->id;
        if (!handler) {
            resp.error = ResponseError{error::MethodNotFound,
                                       "Method not found: " + req->method, std::nullopt};
            return resp;
        }
        // Handlers run without the lock so they may register further handlers.
        try {
            auto result = handler(params);
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                resp.result = std::move(*ok);
            } else {
                resp.error = std::get<ResponseError>(std::move(result));
            }
        } catch (const LspRemoteError& e) {
            resp.error = ResponseError{e.code, e.what(), e.data};
        } catch (const std::exception& e) {
            resp.error = ResponseError{error::InternalError, e.what(), std::nullopt};
        }
        return resp;
    }

    if (const auto* notif = std::get_if<Notification>(&msg)) {
        NotificationHandler handler;
        std::vector<NotificationObserver> observers;
        nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = notification_handlers_.find(notif->method);
            if (it != notification_handlers_.end()) handler = it->second;
            observers = observers_;
        }
        try {
            if (handler) handler(params);
            for (const auto& observer : observers) observer(notif->method, params);
        } catch (const std::exception& e) {
            logger()->warn("handler for notification '{}' failed: {}", notif->method, e.what());
        }
        return std::nullopt;
    }

    return std::nullopt;
}

} // namespace lspc
