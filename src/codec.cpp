#include "lspc/codec.hpp"
#include "lspc/error.hpp"
#include "lspc/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace lspc {

namespace {

using ordered = nlohmann::ordered_json;

nlohmann::json to_document(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_document(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_document(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

void require_id(const nlohmann::json& j) {
    const auto& id = j.at("id");
    if (!id.is_number_integer() && !id.is_string()) {
        throw LspParseError("'id' must be an integer or a string");
    }
}

ordered envelope() {
    ordered j = ordered::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    return j;
}

ordered to_ordered(const RequestId& id) {
    nlohmann::json id_j;
    to_json(id_j, id);
    return ordered(id_j);
}

ordered to_ordered(const Request& r) {
    ordered j = envelope();
    j["id"] = to_ordered(r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = ordered(*r.params);
    return j;
}

ordered to_ordered(const Response& r) {
    ordered j = envelope();
    j["id"] = to_ordered(r.id);
    if (r.error) {
        nlohmann::json err;
        to_json(err, *r.error);
        j["error"] = ordered(err);
    } else {
        j["result"] = r.result ? ordered(*r.result) : ordered(nullptr);
    }
    return j;
}

ordered to_ordered(const Notification& n) {
    ordered j = envelope();
    j["method"] = n.method;
    if (n.params) j["params"] = ordered(*n.params);
    return j;
}

} // anonymous namespace

Message Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw LspParseError("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw LspParseError("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");
    if (has_method && !j.at("method").is_string()) {
        throw LspParseError("'method' must be a string");
    }

    if (has_method && has_id) {
        require_id(j);
        Request req;
        from_json(j.at("id"), req.id);
        req.method = j.at("method").get<std::string>();
        if (j.contains("params")) req.params = j.at("params");
        return req;
    }
    if (has_method) {
        Notification notif;
        notif.method = j.at("method").get<std::string>();
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    }
    if (has_id) {
        require_id(j);
        bool has_result = j.contains("result");
        bool has_error = j.contains("error");
        if (has_result == has_error) {
            throw LspParseError("Response must carry exactly one of 'result' and 'error'");
        }
        Response resp;
        from_json(j.at("id"), resp.id);
        if (has_result) {
            resp.result = j.at("result");
        } else {
            try {
                resp.error = j.at("error").get<ResponseError>();
            } catch (const nlohmann::json::exception& e) {
                throw LspParseError(std::string("Malformed error object: ") + e.what());
            }
        }
        return resp;
    }
    throw LspParseError("Cannot determine message type: missing both 'id' and 'method'");
}

Message Codec::parse(std::string_view body) {
    if (body.empty()) {
        throw LspParseError("Empty body");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(body.data(), body.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw LspParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::value root;
        error = doc.get_value().get(root);
        if (error) {
            throw LspParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
        }
        j = to_document(root);
        // Reject trailing content after the root value.
        if (!doc.at_end()) {
            throw LspParseError("Trailing content after JSON body");
        }
    } catch (const simdjson::simdjson_error& e) {
        throw LspParseError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        throw LspParseError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const Message& msg) {
    ordered j = std::visit([](const auto& v) { return to_ordered(v); }, msg);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace lspc
