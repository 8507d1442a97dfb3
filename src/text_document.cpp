#include "lspc/text_document.hpp"

namespace lspc {

void to_json(nlohmann::json& j, const Position& p) {
    j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
    p.line = j.at("line").get<int64_t>();
    p.character = j.at("character").get<int64_t>();
}

void to_json(nlohmann::json& j, const TextDocumentItem& item) {
    j = nlohmann::json{
        {"uri", item.uri},
        {"languageId", item.language_id},
        {"version", item.version},
        {"text", item.text}
    };
}

nlohmann::json TextDocumentClient::position_params(const std::string& uri, Position pos) {
    return {{"textDocument", {{"uri", uri}}}, {"position", pos}};
}

void TextDocumentClient::did_open(const TextDocumentItem& item) {
    session_.notify("textDocument/didOpen", {{"textDocument", item}});
}

void TextDocumentClient::did_close(const std::string& uri) {
    session_.notify("textDocument/didClose", {{"textDocument", {{"uri", uri}}}});
}

nlohmann::json TextDocumentClient::completion(const std::string& uri, Position pos) {
    return session_.request("textDocument/completion", position_params(uri, pos));
}

nlohmann::json TextDocumentClient::hover(const std::string& uri, Position pos) {
    return session_.request("textDocument/hover", position_params(uri, pos));
}

nlohmann::json TextDocumentClient::definition(const std::string& uri, Position pos) {
    return session_.request("textDocument/definition", position_params(uri, pos));
}

nlohmann::json TextDocumentClient::references(const std::string& uri, Position pos,
                                              bool include_declaration) {
    nlohmann::json params = position_params(uri, pos);
    params["context"] = {{"includeDeclaration", include_declaration}};
    return session_.request("textDocument/references", params);
}

} // namespace lspc
