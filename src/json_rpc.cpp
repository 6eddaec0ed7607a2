#include "tix/json_rpc.hpp"

namespace tix {

Response Response::success(std::string id, nlohmann::json result) {
    Response resp;
    resp.id = std::move(id);
    resp.result = result.is_null() ? nlohmann::json::object() : std::move(result);
    return resp;
}

Response Response::failure(std::string id, int code, std::string message) {
    Response resp;
    resp.id = std::move(id);
    resp.error = ErrorObject{code, std::move(message)};
    return resp;
}

void to_json(nlohmann::json& j, const Request& r) {
    j = nlohmann::json::object();
    j["id"] = r.id;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, Request& r) {
    r.id = j.value("id", std::string{});
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const Response& r) {
    j = nlohmann::json::object();
    j["id"] = r.id;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void from_json(const nlohmann::json& j, Response& r) {
    r.id = j.value("id", std::string{});
    r.result.reset();
    r.error.reset();
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<ErrorObject>();
}

} // namespace tix
