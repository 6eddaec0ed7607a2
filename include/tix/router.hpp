#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>
#include <variant>

namespace tix {

using HandlerResult = std::variant<nlohmann::json, ErrorObject>;
using RequestHandler = std::function<HandlerResult(const std::optional<nlohmann::json>& params)>;

/// Method table. Handlers are registered during startup; afterwards the router
/// is only read, so one instance is shared by every session without locking.
class Router {
public:
    /// Register a request handler for a method, replacing any previous one.
    void on_request(const std::string& method, RequestHandler handler);

    /// Route a request to its handler. Always returns a response carrying the
    /// request id; unknown methods produce MethodNotFound.
    [[nodiscard]] Response dispatch(const Request& req) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
};

} // namespace tix
