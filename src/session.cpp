#include "lspc/session.hpp"
#include "lspc/error.hpp"
#include "lspc/log.hpp"
#include "lspc/pending_requests.hpp"
#include "lspc/transport/stdio_transport.hpp"

#include <unistd.h>

#include <condition_variable>
#include <mutex>
#include <thread>

namespace lspc {

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::NotStarted:   return "NotStarted";
        case SessionState::Initializing: return "Initializing";
        case SessionState::Ready:        return "Ready";
        case SessionState::Stopped:      return "Stopped";
    }
    return "Unknown";
}

nlohmann::json default_client_capabilities() {
    return {
        {"textDocument", {
            {"completion", {{"completionItem", {{"snippetSupport", true}}}}},
            {"hover", {{"contentFormat", {"markdown", "plaintext"}}}},
            {"definition", {{"linkSupport", true}}},
            {"references", nlohmann::json::object()},
            {"documentSymbol", nlohmann::json::object()}
        }},
        {"workspace", {{"workspaceFolders", true}}}
    };
}

namespace {

std::string folder_name(const std::string& uri) {
    std::string trimmed = uri;
    while (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
    auto slash = trimmed.find_last_of('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

spdlog::level::level_enum message_type_level(int type) {
    switch (type) {
        case 1:  return spdlog::level::err;
        case 2:  return spdlog::level::warn;
        case 3:  return spdlog::level::info;
        default: return spdlog::level::debug;
    }
}

} // anonymous namespace

struct Session::Impl {
    Options opts;
    PendingRequests pending;
    Router router;
    ChildProcess process;
    bool owns_process{false};

    std::thread transport_thread;

    // Serializes start() and stop() against each other.
    std::mutex lifecycle_mutex;

    mutable std::mutex state_mutex;
    mutable std::condition_variable state_cv;
    SessionState state{SessionState::NotStarted};
    bool stopping{false};
    bool torn_down{false};
    nlohmann::json server_caps = nlohmann::json::object();
    nlohmann::json server_info = nullptr;
    std::string root_uri;
    // Callers copy the transport under state_mutex; teardown clears it there.
    std::shared_ptr<ITransport> transport;
    std::thread::id reader_id;

    explicit Impl(Options o) : opts(std::move(o)) {
        install_default_handlers();
    }

    void set_state(SessionState s) {
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (state == s) return;
            logger()->debug("session: {} -> {}", to_string(state), to_string(s));
            state = s;
        }
        state_cv.notify_all();
    }

    void install_default_handlers() {
        router.on_request("window/workDoneProgress/create", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json(nullptr);
        });
        router.on_request("client/registerCapability", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json(nullptr);
        });
        router.on_request("client/unregisterCapability", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json(nullptr);
        });
        // No settings to offer: one null per requested section.
        router.on_request("workspace/configuration", [](const nlohmann::json& params) -> HandlerResult {
            nlohmann::json answer = nlohmann::json::array();
            if (params.contains("items") && params.at("items").is_array()) {
                for (std::size_t i = 0; i < params.at("items").size(); ++i) answer.push_back(nullptr);
            }
            return answer;
        });
        router.on_request("workspace/workspaceFolders", [this](const nlohmann::json&) -> HandlerResult {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (root_uri.empty()) return nlohmann::json(nullptr);
            return nlohmann::json::array({{{"uri", root_uri}, {"name", folder_name(root_uri)}}});
        });

        auto forward_message = [](const nlohmann::json& params) {
            int type = params.value("type", 4);
            logger()->log(message_type_level(type), "server: {}", params.value("message", ""));
        };
        router.on_notification("window/logMessage", forward_message);
        router.on_notification("window/showMessage", forward_message);
    }

    std::shared_ptr<ITransport> current_transport() const {
        std::lock_guard<std::mutex> lock(state_mutex);
        return transport;
    }

    // ---- Reader thread ----

    void on_message(Message msg) {
        if (auto* resp = std::get_if<Response>(&msg)) {
            if (!pending.complete(*resp)) {
                logger()->debug("session: discarding response for unknown id {}", to_string(resp->id));
            }
            return;
        }

        auto reply = router.dispatch(msg);
        auto t = current_transport();
        if (reply && t) {
            try {
                t->send(*reply);
            } catch (const LspTransportError& e) {
                logger()->warn("session: could not answer {}: {}", describe(msg), e.what());
            }
        }
    }

    void on_transport_error(std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const LspParseError& e) {
            logger()->warn("session: dropping malformed message: {}", e.what());
        } catch (const LspFramingError& e) {
            logger()->error("session: unrecoverable framing error: {}", e.what());
        } catch (const std::exception& e) {
            logger()->error("session: transport error: {}", e.what());
        }
    }

    /// The receive loop ended. Unless stop() is driving the shutdown, the
    /// server went away on its own and the session stops implicitly.
    void on_connection_closed() {
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (stopping) return;
        }
        logger()->warn("session: language server closed the connection");
        pending.cancel_all("language server exited");
        if (owns_process) process.terminate(std::chrono::milliseconds(200));
        set_state(SessionState::Stopped);
    }

    // ---- Sending ----

    nlohmann::json send_request(const std::string& method,
                                std::optional<nlohmann::json> params,
                                std::chrono::milliseconds timeout) {
        auto handle = pending.add(method, timeout);

        Request req;
        req.id = RequestId{handle.id};
        req.method = method;
        req.params = std::move(params);
        try {
            auto t = current_transport();
            if (!t) throw LspTransportError("session has no open transport");
            t->send(req);
        } catch (const LspTransportError& e) {
            pending.reject(handle.id, std::make_exception_ptr(
                LspCancelledError(std::string("Request '") + method + "' not sent: " + e.what())));
        }

        if (handle.result.wait_until(handle.deadline) == std::future_status::timeout &&
            pending.expire(handle.id)) {
            logger()->warn("session: request {} '{}' timed out after {} ms",
                           handle.id, method, timeout.count());
            if (opts.cancel_on_timeout) {
                try {
                    send_notification("$/cancelRequest", nlohmann::json{{"id", handle.id}});
                } catch (const LspError& e) {
                    logger()->debug("session: could not send $/cancelRequest: {}", e.what());
                }
            }
        }
        return handle.result.get();
    }

    void send_notification(const std::string& method, std::optional<nlohmann::json> params) {
        Notification notif;
        notif.method = method;
        notif.params = std::move(params);
        auto t = current_transport();
        if (!t) throw LspStateError("Cannot send '" + method + "': session is stopped");
        t->send(notif);
    }

    // ---- Lifecycle ----

    void handshake() {
        std::string root;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            root = root_uri;
        }

        nlohmann::json params = {
            {"processId", static_cast<int>(::getpid())},
            {"clientInfo", {{"name", opts.client_info.name}, {"version", opts.client_info.version}}},
            {"capabilities", opts.capabilities}
        };
        if (root.empty()) {
            params["rootUri"] = nullptr;
            params["workspaceFolders"] = nullptr;
        } else {
            params["rootUri"] = root;
            params["workspaceFolders"] = nlohmann::json::array({{{"uri", root}, {"name", folder_name(root)}}});
        }
        if (opts.initialization_options) {
            params["initializationOptions"] = *opts.initialization_options;
        }

        nlohmann::json result;
        try {
            result = send_request("initialize", std::move(params), opts.initialize_timeout);
        } catch (const LspError& e) {
            throw LspHandshakeError(std::string("initialize failed: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (result.is_object()) {
                if (result.contains("capabilities")) server_caps = result.at("capabilities");
                if (result.contains("serverInfo")) server_info = result.at("serverInfo");
            }
        }

        try {
            send_notification("initialized", nlohmann::json::object());
        } catch (const LspError& e) {
            throw LspHandshakeError(std::string("could not send initialized: ") + e.what());
        }

        std::string server_name = "language server";
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (stopping || state != SessionState::Initializing) {
                throw LspHandshakeError("session stopped during initialization");
            }
            state = SessionState::Ready;
            if (server_info.is_object()) server_name = server_info.value("name", server_name);
        }
        state_cv.notify_all();
        logger()->info("session: {} ready", server_name);
    }

    void run(std::shared_ptr<ITransport> t) {
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            transport = t;
        }
        set_state(SessionState::Initializing);
        transport_thread = std::thread([this, t]() {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                reader_id = std::this_thread::get_id();
            }
            t->start(
                [this](Message msg) { on_message(std::move(msg)); },
                [this](std::exception_ptr e) { on_transport_error(e); });
            on_connection_closed();
        });
    }

    void teardown() {
        bool graceful;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (torn_down) return;
            if (state == SessionState::NotStarted) {
                torn_down = true;
                state = SessionState::Stopped;
                state_cv.notify_all();
                return;
            }
            graceful = state == SessionState::Ready && !stopping;
            stopping = true;
        }

        std::size_t cancelled = pending.cancel_all("session stopped");
        if (cancelled > 0) {
            logger()->info("session: cancelled {} outstanding request(s)", cancelled);
        }

        auto t = current_transport();
        if (graceful && t && t->is_connected()) {
            pending.reopen();
            try {
                send_request("shutdown", std::nullopt, opts.shutdown_timeout);
                send_notification("exit", std::nullopt);
            } catch (const LspError& e) {
                logger()->debug("session: graceful shutdown incomplete: {}", e.what());
            }
            pending.cancel_all("session stopped");
        }

        if (t) t->shutdown();
        if (transport_thread.joinable()) transport_thread.join();
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            transport.reset();
            reader_id = std::thread::id();
        }
        // Closing the pipes delivers EOF to the server once no sender holds them.
        t.reset();
        if (owns_process) process.terminate(opts.shutdown_timeout);

        {
            std::lock_guard<std::mutex> lock(state_mutex);
            torn_down = true;
            state = SessionState::Stopped;
        }
        state_cv.notify_all();
    }
};

Session::Session(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {}

Session::~Session() {
    try {
        stop();
    } catch (const std::exception& e) {
        logger()->error("session: stop failed during destruction: {}", e.what());
    }
}

void Session::start(const std::string& root_uri) {
    {
        std::lock_guard<std::mutex> lifecycle(impl_->lifecycle_mutex);
        {
            std::lock_guard<std::mutex> lock(impl_->state_mutex);
            if (impl_->state != SessionState::NotStarted) {
                throw LspStateError(std::string("Session cannot start from state ") +
                                    to_string(impl_->state));
            }
            impl_->root_uri = root_uri;
        }

        ChildProcess::Options popts;
        popts.command = impl_->opts.command;
        popts.args = impl_->opts.args;
        popts.working_directory = impl_->opts.working_directory;

        auto abandon = [this]() {
            impl_->process.terminate(std::chrono::milliseconds(0));
            {
                std::lock_guard<std::mutex> lock(impl_->state_mutex);
                impl_->torn_down = true;
                impl_->state = SessionState::Stopped;
            }
            impl_->state_cv.notify_all();
        };

        std::unique_ptr<ITransport> transport;
        try {
            impl_->process.spawn(popts, impl_->opts.stderr_sink);
            impl_->owns_process = true;
            transport = std::make_unique<StdioTransport>(impl_->process.take_stdout(),
                                                         impl_->process.take_stdin(),
                                                         impl_->opts.max_content_length);
        } catch (const LspSpawnError& e) {
            logger()->error("session: {}", e.what());
            abandon();
            throw;
        } catch (const LspTransportError& e) {
            logger()->error("session: {}", e.what());
            abandon();
            throw LspSpawnError(e.what());
        }
        impl_->run(std::move(transport));
    }

    try {
        impl_->handshake();
    } catch (const LspHandshakeError& e) {
        logger()->error("session: {}", e.what());
        stop();
        throw;
    }
}

void Session::start(std::unique_ptr<ITransport> transport, const std::string& root_uri) {
    {
        std::lock_guard<std::mutex> lifecycle(impl_->lifecycle_mutex);
        {
            std::lock_guard<std::mutex> lock(impl_->state_mutex);
            if (impl_->state != SessionState::NotStarted) {
                throw LspStateError(std::string("Session cannot start from state ") +
                                    to_string(impl_->state));
            }
            impl_->root_uri = root_uri;
        }
        impl_->run(std::move(transport));
    }

    try {
        impl_->handshake();
    } catch (const LspHandshakeError& e) {
        logger()->error("session: {}", e.what());
        stop();
        throw;
    }
}

void Session::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (impl_->reader_id == std::this_thread::get_id()) {
            throw LspStateError("stop() must not be called from a message handler");
        }
    }
    std::lock_guard<std::mutex> lifecycle(impl_->lifecycle_mutex);
    impl_->teardown();
}

bool Session::wait_stopped(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(impl_->state_mutex);
    return impl_->state_cv.wait_for(lock, timeout, [this] {
        return impl_->state == SessionState::Stopped;
    });
}

nlohmann::json Session::request(const std::string& method, nlohmann::json params,
                                std::optional<std::chrono::milliseconds> timeout) {
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (impl_->state != SessionState::Ready || impl_->stopping) {
            throw LspStateError("Cannot send '" + method + "' while session is " +
                                (impl_->stopping ? std::string("stopping") : to_string(impl_->state)));
        }
    }
    return impl_->send_request(method, std::move(params), timeout.value_or(impl_->opts.request_timeout));
}

void Session::notify(const std::string& method, nlohmann::json params) {
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        bool open = impl_->state == SessionState::Initializing || impl_->state == SessionState::Ready;
        if (!open || impl_->stopping) {
            throw LspStateError("Cannot send '" + method + "' while session is " +
                                (impl_->stopping ? std::string("stopping") : to_string(impl_->state)));
        }
    }
    try {
        impl_->send_notification(method, std::move(params));
    } catch (const LspTransportError&) {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (impl_->stopping || impl_->state == SessionState::Stopped) {
            throw LspStateError("Cannot send '" + method + "': session stopped");
        }
        throw;
    }
}

void Session::on_notification(const std::string& method, NotificationHandler handler) {
    impl_->router.on_notification(method, std::move(handler));
}

void Session::on_any_notification(NotificationObserver observer) {
    impl_->router.add_observer(std::move(observer));
}

void Session::on_request(const std::string& method, RequestHandler handler) {
    impl_->router.on_request(method, std::move(handler));
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->state;
}

nlohmann::json Session::server_capabilities() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->server_caps;
}

nlohmann::json Session::server_info() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->server_info;
}

std::string Session::root_uri() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->root_uri;
}

std::size_t Session::pending_count() const {
    return impl_->pending.size();
}

bool Session::has_pending_request(int64_t id) const {
    return impl_->pending.contains(id);
}

} // namespace lspc
