#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace lspc {

class LspError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A body of the declared length did not decode into a JSON-RPC message.
class LspParseError : public LspError {
public:
    using LspError::LspError;
};

/// The header block cannot be used to find the end of the body.
/// Terminal for the stream it came from.
class LspFramingError : public LspError {
public:
    using LspError::LspError;
};

/// The remote answered a request with an error object.
class LspRemoteError : public LspError {
public:
    int code;
    std::optional<nlohmann::json> data;
    LspRemoteError(int code, const std::string& msg,
                   std::optional<nlohmann::json> data = std::nullopt)
        : LspError(msg), code(code), data(std::move(data)) {}
};

class LspTransportError : public LspError {
public:
    using LspError::LspError;
};

class LspSpawnError : public LspError {
public:
    using LspError::LspError;
};

class LspHandshakeError : public LspError {
public:
    using LspError::LspError;
};

class LspTimeoutError : public LspError {
public:
    using LspError::LspError;
};

class LspCancelledError : public LspError {
public:
    using LspError::LspError;
};

/// The caller used the session in a state that does not allow the operation.
class LspStateError : public LspError {
public:
    using LspError::LspError;
};

namespace error {
    constexpr int ParseError           = -32700;
    constexpr int InvalidRequest       = -32600;
    constexpr int MethodNotFound       = -32601;
    constexpr int InvalidParams        = -32602;
    constexpr int InternalError        = -32603;
    constexpr int ServerNotInitialized = -32002;
    constexpr int UnknownErrorCode     = -32001;
    constexpr int RequestFailed        = -32803;
    constexpr int ServerCancelled      = -32802;
    constexpr int ContentModified      = -32801;
    constexpr int RequestCancelled     = -32800;
} // namespace error

} // namespace lspc
