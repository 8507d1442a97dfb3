#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace lspc {

/// Ids generated by this library are always integers; string ids only
/// appear on requests initiated by the remote side.
using RequestId = std::variant<int64_t, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer or string");
    }
}

std::string to_string(const RequestId& id);

struct ResponseError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const ResponseError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const ResponseError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, ResponseError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

struct Request {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const Request& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result / error is set on a well-formed response.
struct Response {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<ResponseError> error;

    bool operator==(const Response& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct Notification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const Notification& o) const {
        return method == o.method && params == o.params;
    }
};

using Message = std::variant<Request, Response, Notification>;

void to_json(nlohmann::json& j, const Request& r);
void from_json(const nlohmann::json& j, Request& r);

void to_json(nlohmann::json& j, const Response& r);
void from_json(const nlohmann::json& j, Response& r);

void to_json(nlohmann::json& j, const Notification& n);
void from_json(const nlohmann::json& j, Notification& n);

void to_json(nlohmann::json& j, const Message& m);

/// Short human-readable description used in log lines.
std::string describe(const Message& m);

} // namespace lspc
