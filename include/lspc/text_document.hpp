#pragma once
#include "session.hpp"
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace lspc {

/// Zero-based line and UTF-16 character offset.
struct Position {
    int64_t line = 0;
    int64_t character = 0;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

struct TextDocumentItem {
    std::string uri;
    std::string language_id;
    int64_t version = 1;
    std::string text;
};

void to_json(nlohmann::json& j, const TextDocumentItem& item);

/// Builds the textDocument/* requests on top of a ready Session. Query
/// methods return the server's result unmodified.
class TextDocumentClient {
public:
    explicit TextDocumentClient(Session& session) : session_(session) {}

    void did_open(const TextDocumentItem& item);
    void did_close(const std::string& uri);

    [[nodiscard]] nlohmann::json completion(const std::string& uri, Position pos);
    [[nodiscard]] nlohmann::json hover(const std::string& uri, Position pos);
    [[nodiscard]] nlohmann::json definition(const std::string& uri, Position pos);
    [[nodiscard]] nlohmann::json references(const std::string& uri, Position pos,
                                            bool include_declaration = true);

    /// {"textDocument": {"uri": ...}, "position": {...}}
    [[nodiscard]] static nlohmann::json position_params(const std::string& uri, Position pos);

private:
    Session& session_;
};

} // namespace lspc
