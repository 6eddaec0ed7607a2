#include "tix/handlers.hpp"
#include "tix/error.hpp"
#include "tix/version.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tix {

namespace {

std::string utc_now_rfc3339() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // anonymous namespace

ServerContext ServerContext::builtin() {
    ServerContext ctx;
    ctx.server_info = {std::string(SERVER_NAME), std::string(LIBRARY_VERSION)};
    ctx.tickets = std::make_shared<const TicketStore>(TicketStore::builtin());
    ctx.tools = make_ticket_tools(ctx.tickets);
    return ctx;
}

void register_handlers(Router& router, const ServerContext& ctx) {
    // initialize
    router.on_request("initialize", [&ctx](const std::optional<nlohmann::json>&) -> HandlerResult {
        InitializeResult result;
        result.protocol_version = std::string(PROTOCOL_VERSION);
        result.server_info = ctx.server_info;

        nlohmann::json j;
        to_json(j, result);
        return j;
    });

    // ping
    router.on_request("ping", [](const std::optional<nlohmann::json>&) -> HandlerResult {
        return nlohmann::json{{"pong", utc_now_rfc3339()}};
    });

    // tools/list
    router.on_request("tools/list", [&ctx](const std::optional<nlohmann::json>&) -> HandlerResult {
        return nlohmann::json{{"tools", ctx.tools.list()}};
    });

    // tools/call
    router.on_request("tools/call", [&ctx](const std::optional<nlohmann::json>& params) -> HandlerResult {
        CallToolParams call = CallToolParams::from_params(params);

        CallToolResult result;
        result.tickets = ctx.tools.call(call.name);
        result.arguments = std::move(call.arguments);

        nlohmann::json j;
        to_json(j, result);
        return j;
    });
}

} // namespace tix
