#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace lspc {

/// Converts between one JSON-RPC envelope and its textual body.
/// Framing is not the codec's concern; see Framer.
class Codec {
public:
    /// Parse one UTF-8 JSON body into a message.
    /// Throws LspParseError on invalid JSON or a malformed envelope.
    [[nodiscard]] static Message parse(std::string_view body);

    /// Serialize a message. Members are written in envelope order
    /// (jsonrpc, id, method, params / result / error).
    [[nodiscard]] static std::string serialize(const Message& msg);

private:
    static Message parse_object(const nlohmann::json& j);
};

} // namespace lspc
