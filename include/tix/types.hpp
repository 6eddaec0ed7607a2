#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace tix {

// ---------- Tickets ----------

enum class TicketStatus {
    Pending,
    Todo,
    Done
};

std::string to_string(TicketStatus status);

/// Parse "pending" / "todo" / "done". Returns nullopt for anything else.
std::optional<TicketStatus> ticket_status_from_string(const std::string& s);

struct Ticket {
    std::string id;
    std::string title;
    TicketStatus status = TicketStatus::Pending;

    bool operator==(const Ticket& o) const {
        return id == o.id && title == o.title && status == o.status;
    }
};

void to_json(nlohmann::json& j, const TicketStatus& s);
void from_json(const nlohmann::json& j, TicketStatus& s);
void to_json(nlohmann::json& j, const Ticket& t);
void from_json(const nlohmann::json& j, Ticket& t);

// ---------- Tools ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

/// Typed view of the params of a tools/call request.
struct CallToolParams {
    std::string name;
    std::optional<nlohmann::json> arguments;

    /// Throws TixProtocolError(InvalidParams) unless params is an object with a
    /// string "name" and, if present, an object "arguments".
    static CallToolParams from_params(const std::optional<nlohmann::json>& params);
};

struct CallToolResult {
    std::vector<Ticket> tickets;
    std::optional<nlohmann::json> arguments;

    bool operator==(const CallToolResult& o) const {
        return tickets == o.tickets && arguments == o.arguments;
    }
};

// {"tickets": [...], "meta": {"count": n, "args": {...}}}
void to_json(nlohmann::json& j, const CallToolResult& r);
void from_json(const nlohmann::json& j, CallToolResult& r);

// ---------- Lifecycle ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct ServerCapabilities {
    bool tools_call = true;
    bool tools_list = true;
    bool tools_list_changed = false;

    bool operator==(const ServerCapabilities& o) const {
        return tools_call == o.tools_call && tools_list == o.tools_list
               && tools_list_changed == o.tools_list_changed;
    }
};

struct InitializeResult {
    std::string protocol_version;
    Implementation server_info;
    ServerCapabilities capabilities;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && server_info == o.server_info
               && capabilities == o.capabilities;
    }
};

void to_json(nlohmann::json& j, const Implementation& i);
void from_json(const nlohmann::json& j, Implementation& i);
void to_json(nlohmann::json& j, const ServerCapabilities& c);
void from_json(const nlohmann::json& j, ServerCapabilities& c);
void to_json(nlohmann::json& j, const InitializeResult& r);
void from_json(const nlohmann::json& j, InitializeResult& r);

} // namespace tix
