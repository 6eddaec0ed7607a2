#include "tix/types.hpp"
#include "tix/error.hpp"
#include <stdexcept>

namespace tix {

// ---------- TicketStatus ----------

std::string to_string(TicketStatus status) {
    switch (status) {
        case TicketStatus::Pending: return "pending";
        case TicketStatus::Todo:    return "todo";
        case TicketStatus::Done:    return "done";
    }
    return "pending";
}

std::optional<TicketStatus> ticket_status_from_string(const std::string& s) {
    if (s == "pending") return TicketStatus::Pending;
    if (s == "todo")    return TicketStatus::Todo;
    if (s == "done")    return TicketStatus::Done;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const TicketStatus& s) {
    j = to_string(s);
}

void from_json(const nlohmann::json& j, TicketStatus& s) {
    auto parsed = ticket_status_from_string(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("Unknown ticket status: " + j.get<std::string>());
    }
    s = *parsed;
}

// ---------- Ticket ----------

void to_json(nlohmann::json& j, const Ticket& t) {
    j = {{"id", t.id}, {"title", t.title}, {"status", t.status}};
}

void from_json(const nlohmann::json& j, Ticket& t) {
    t.id = j.at("id").get<std::string>();
    t.title = j.at("title").get<std::string>();
    t.status = j.at("status").get<TicketStatus>();
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string{});
    t.input_schema = j.value("inputSchema", nlohmann::json::object());
}

// ---------- CallToolParams ----------

CallToolParams CallToolParams::from_params(const std::optional<nlohmann::json>& params) {
    if (!params || !params->is_object()) {
        throw TixProtocolError(error::InvalidParams, "params must be an object with a 'name' field");
    }
    auto name_it = params->find("name");
    if (name_it == params->end()) {
        throw TixProtocolError(error::InvalidParams, "params.name is required");
    }
    if (!name_it->is_string()) {
        throw TixProtocolError(error::InvalidParams, "params.name must be a string");
    }

    CallToolParams out;
    out.name = name_it->get<std::string>();

    auto args_it = params->find("arguments");
    if (args_it != params->end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            throw TixProtocolError(error::InvalidParams, "params.arguments must be an object");
        }
        out.arguments = *args_it;
    }
    return out;
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& r) {
    nlohmann::json meta = {{"count", r.tickets.size()}};
    if (r.arguments) meta["args"] = *r.arguments;
    j = {{"tickets", r.tickets}, {"meta", std::move(meta)}};
}

void from_json(const nlohmann::json& j, CallToolResult& r) {
    r.tickets = j.at("tickets").get<std::vector<Ticket>>();
    r.arguments.reset();
    if (j.contains("meta") && j.at("meta").contains("args")) {
        r.arguments = j.at("meta").at("args");
    }
}

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& i) {
    j = {{"name", i.name}, {"version", i.version}};
}

void from_json(const nlohmann::json& j, Implementation& i) {
    i.name = j.at("name").get<std::string>();
    i.version = j.at("version").get<std::string>();
}

// ---------- ServerCapabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& c) {
    j = {{"tools", {
        {"call", {{"enabled", c.tools_call}}},
        {"list", {{"enabled", c.tools_list}, {"listChanged", c.tools_list_changed}}}
    }}};
}

void from_json(const nlohmann::json& j, ServerCapabilities& c) {
    const auto& tools = j.at("tools");
    c.tools_call = tools.at("call").value("enabled", false);
    c.tools_list = tools.at("list").value("enabled", false);
    c.tools_list_changed = tools.at("list").value("listChanged", false);
}

// ---------- InitializeResult ----------

void to_json(nlohmann::json& j, const InitializeResult& r) {
    j = {
        {"protocolVersion", r.protocol_version},
        {"serverInfo", r.server_info},
        {"capabilities", r.capabilities}
    };
}

void from_json(const nlohmann::json& j, InitializeResult& r) {
    r.protocol_version = j.at("protocolVersion").get<std::string>();
    r.server_info = j.at("serverInfo").get<Implementation>();
    r.capabilities = j.at("capabilities").get<ServerCapabilities>();
}

} // namespace tix
