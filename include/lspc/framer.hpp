#pragma once
#include "json_rpc.hpp"
#include "version.hpp"
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace lspc {

/// Callback for decoded messages
using MessageCallback = std::function<void(Message)>;
/// Callback for per-message or connection errors
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Content-Length framing of the LSP base protocol.
///
/// Encoding is stateless. Decoding is incremental: bytes are appended to an
/// internal buffer and every complete frame is extracted. After feed() returns
/// the buffer holds at most a partial header or a partial body.
class Framer {
public:
    explicit Framer(std::size_t max_content_length = DEFAULT_MAX_CONTENT_LENGTH);

    /// Serialize msg and prefix it with its header block.
    [[nodiscard]] static std::string encode(const Message& msg);

    /// Prefix an already serialized body with its header block.
    [[nodiscard]] static std::string frame(std::string_view body);

    /// Append chunk and deliver every complete message, in stream order.
    ///
    /// A body that fails to decode is reported through on_error as an
    /// LspParseError and skipped. A header block without a usable
    /// Content-Length throws LspFramingError; the framer then stays failed.
    void feed(std::string_view chunk,
              const MessageCallback& on_message,
              const ErrorCallback& on_error = nullptr);

    /// Bytes held back waiting for the rest of a frame.
    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }

    [[nodiscard]] bool failed() const noexcept { return failed_; }

    /// Drop buffered bytes and clear the failed state.
    void reset();

private:
    static std::optional<std::size_t> parse_content_length(std::string_view header);
    [[noreturn]] void fail(const std::string& reason);

    std::size_t max_content_length_;
    std::string buffer_;
    bool failed_{false};
};

} // namespace lspc
