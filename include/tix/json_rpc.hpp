#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace tix {

struct ErrorObject {
    int code;
    std::string message;

    bool operator==(const ErrorObject& o) const {
        return code == o.code && message == o.message;
    }
};

inline void to_json(nlohmann::json& j, const ErrorObject& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
}

inline void from_json(const nlohmann::json& j, ErrorObject& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
}

struct Request {
    std::string id;
    std::string method;
    // Opaque until a handler decodes it for its own method.
    std::optional<nlohmann::json> params;

    bool operator==(const Request& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result / error is set on every response built by this library.
struct Response {
    std::string id;
    std::optional<nlohmann::json> result;
    std::optional<ErrorObject> error;

    static Response success(std::string id, nlohmann::json result);
    static Response failure(std::string id, int code, std::string message);

    bool operator==(const Response& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

void to_json(nlohmann::json& j, const Request& r);
void from_json(const nlohmann::json& j, Request& r);

void to_json(nlohmann::json& j, const Response& r);
void from_json(const nlohmann::json& j, Response& r);

} // namespace tix
