#pragma once
#include "json_rpc.hpp"
#include "process.hpp"
#include "router.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lspc {

enum class SessionState {
    NotStarted,
    Initializing,
    Ready,
    Stopped
};

[[nodiscard]] const char* to_string(SessionState state) noexcept;

/// Client capabilities declared in the initialize request unless overridden.
[[nodiscard]] nlohmann::json default_client_capabilities();

/// Session drives one language server over its stdio: it spawns the
/// process, performs the initialize / initialized handshake, correlates
/// requests with responses, and dispatches everything the server initiates.
///
/// request(), notify() and stop() may be called from any thread. Handlers
/// registered with on_request / on_notification run on the reader thread
/// and must not call request().
class Session {
public:
    struct ClientInfo {
        std::string name = "lspc";
        std::string version = std::string(LIBRARY_VERSION);
    };

    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::optional<std::string> working_directory;

        ClientInfo client_info;
        nlohmann::json capabilities = default_client_capabilities();
        std::optional<nlohmann::json> initialization_options;

        std::chrono::milliseconds request_timeout{30000};
        std::chrono::milliseconds initialize_timeout{30000};
        std::chrono::milliseconds shutdown_timeout{2000};
        /// Send $/cancelRequest for a request whose deadline passed.
        bool cancel_on_timeout = true;

        std::size_t max_content_length = DEFAULT_MAX_CONTENT_LENGTH;
        /// Receives the server's stderr line by line; logs it when unset.
        StderrSink stderr_sink;
    };

    explicit Session(Options opts);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // ---- Lifecycle ----

    /// Spawn the configured command and complete the handshake.
    /// Throws LspSpawnError or LspHandshakeError; the session is Stopped then.
    void start(const std::string& root_uri);

    /// Run the handshake over an already connected transport.
    void start(std::unique_ptr<ITransport> transport, const std::string& root_uri);

    /// Reject outstanding requests with LspCancelledError, shut the server
    /// down and release the process. Idempotent.
    void stop();

    /// Block until the session is Stopped or the timeout passes.
    bool wait_stopped(std::chrono::milliseconds timeout) const;

    // ---- Messaging ----

    /// Send a request and wait for its outcome. Returns the raw result.
    /// Throws LspStateError unless Ready, LspRemoteError, LspTimeoutError
    /// or LspCancelledError.
    [[nodiscard]] nlohmann::json request(const std::string& method,
                                         nlohmann::json params = nlohmann::json::object(),
                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Send a notification. Throws LspStateError unless Initializing or Ready.
    void notify(const std::string& method, nlohmann::json params = nlohmann::json::object());

    // ---- Remote-initiated traffic ----

    void on_notification(const std::string& method, NotificationHandler handler);
    void on_any_notification(NotificationObserver observer);
    void on_request(const std::string& method, RequestHandler handler);

    // ---- State ----

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] nlohmann::json server_capabilities() const;
    [[nodiscard]] nlohmann::json server_info() const;
    [[nodiscard]] std::string root_uri() const;
    [[nodiscard]] std::size_t pending_count() const;
    [[nodiscard]] bool has_pending_request(int64_t id) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lspc
