#pragma once
#include <cstddef>
#include <string_view>

namespace lspc {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
constexpr std::string_view JSONRPC_VERSION     = "2.0";
constexpr std::string_view CONTENT_LENGTH      = "Content-Length";
constexpr std::string_view HEADER_SEPARATOR    = "\r\n\r\n";

constexpr std::size_t DEFAULT_MAX_CONTENT_LENGTH = 64u * 1024u * 1024u;
constexpr std::size_t MAX_HEADER_SIZE            = 8u * 1024u;

} // namespace lspc
