#include "lspc/json_rpc.hpp"
#include "lspc/version.hpp"

namespace lspc {

std::string to_string(const RequestId& id) {
    if (auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return "\"" + std::get<std::string>(id) + "\"";
}

void to_json(nlohmann::json& j, const Request& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, Request& r) {
    from_json(j.at("id"), r.id);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const Response& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        // A successful response always carries a result member, even if null.
        j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
    }
}

void from_json(const nlohmann::json& j, Response& r) {
    from_json(j.at("id"), r.id);
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<ResponseError>();
}

void to_json(nlohmann::json& j, const Notification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, Notification& n) {
    n.method = j.at("method").get<std::string>();
    if (j.contains("params")) n.params = j.at("params");
}

void to_json(nlohmann::json& j, const Message& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

std::string describe(const Message& m) {
    if (auto* req = std::get_if<Request>(&m)) {
        return "request " + to_string(req->id) + " '" + req->method + "'";
    }
    if (auto* resp = std::get_if<Response>(&m)) {
        return std::string(resp->error ? "error response " : "response ") + to_string(resp->id);
    }
    return "notification '" + std::get<Notification>(m).method + "'";
}

} // namespace lspc
