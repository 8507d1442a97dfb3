#include "lspc/framer.hpp"
#include "lspc/codec.hpp"
#include "lspc/error.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace lspc {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

Framer::Framer(std::size_t max_content_length)
    : max_content_length_(max_content_length) {}

std::string Framer::encode(const Message& msg) {
    return frame(Codec::serialize(msg));
}

std::string Framer::frame(std::string_view body) {
    std::string out;
    std::string length = std::to_string(body.size());
    out.reserve(CONTENT_LENGTH.size() + 2 + length.size() + HEADER_SEPARATOR.size() + body.size());
    out.append(CONTENT_LENGTH);
    out.append(": ");
    out.append(length);
    out.append(HEADER_SEPARATOR);
    out.append(body);
    return out;
}

void Framer::reset() {
    buffer_.clear();
    failed_ = false;
}

void Framer::fail(const std::string& reason) {
    failed_ = true;
    buffer_.clear();
    throw LspFramingError(reason);
}

std::optional<std::size_t> Framer::parse_content_length(std::string_view header) {
    std::optional<std::size_t> length;
    while (!header.empty()) {
        std::size_t eol = header.find("\r\n");
        std::string_view line = header.substr(0, eol);
        header = eol == std::string_view::npos ? std::string_view{} : header.substr(eol + 2);

        std::size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        if (!iequals(trim(line.substr(0, colon)), CONTENT_LENGTH)) continue;

        std::string_view value = trim(line.substr(colon + 1));
        std::size_t parsed = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
            return std::nullopt;
        }
        length = parsed;
    }
    return length;
}

void Framer::feed(std::string_view chunk,
                  const MessageCallback& on_message,
                  const ErrorCallback& on_error) {
    if (failed_) {
        throw LspFramingError("Stream is unusable after a framing error");
    }
    buffer_.append(chunk.data(), chunk.size());

    std::size_t pos = 0;
    while (true) {
        std::size_t header_end = buffer_.find(HEADER_SEPARATOR, pos);
        if (header_end == std::string::npos) {
            if (buffer_.size() - pos > MAX_HEADER_SIZE) {
                fail("Header block exceeds " + std::to_string(MAX_HEADER_SIZE) +
                     " bytes without a terminator");
            }
            break;
        }

        std::string_view header(buffer_.data() + pos, header_end - pos);
        auto declared = parse_content_length(header);
        if (!declared) {
            fail("Missing or invalid Content-Length in header: '" + std::string(header) + "'");
        }
        std::size_t length = *declared;
        if (length > max_content_length_) {
            fail("Content-Length " + std::to_string(length) + " exceeds limit of " +
                 std::to_string(max_content_length_));
        }

        std::size_t body_start = header_end + HEADER_SEPARATOR.size();
        if (buffer_.size() - body_start < length) break;

        std::string_view body(buffer_.data() + body_start, length);
        pos = body_start + length;

        // The frame is consumed whether or not its body decodes.
        Message msg;
        try {
            msg = Codec::parse(body);
        } catch (const LspParseError&) {
            if (on_error) on_error(std::current_exception());
            continue;
        }
        try {
            on_message(std::move(msg));
        } catch (...) {
            buffer_.erase(0, pos);
            throw;
        }
    }

    if (pos > 0) {
        buffer_.erase(0, pos);
    }
}

} // namespace lspc
