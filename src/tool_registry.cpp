#include "tix/tool_registry.hpp"
#include "tix/error.hpp"
#include <stdexcept>

namespace tix {

void ToolRegistry::add(ToolDefinition def, ToolHandler handler) {
    if (entries_.count(def.name) > 0) {
        throw std::invalid_argument("Duplicate tool: " + def.name);
    }
    definitions_.push_back(def);
    std::string name = def.name;
    entries_.emplace(std::move(name), Entry{std::move(def), std::move(handler)});
}

const ToolRegistry::Entry* ToolRegistry::find(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

std::vector<Ticket> ToolRegistry::call(const std::string& name) const {
    const Entry* entry = find(name);
    if (!entry) {
        throw TixProtocolError(error::ToolNotFound, "Unknown tool: " + name);
    }
    return entry->handler();
}

nlohmann::json empty_input_schema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

ToolRegistry make_ticket_tools(std::shared_ptr<const TicketStore> store) {
    ToolRegistry registry;

    auto add_status_tool = [&](const std::string& name, const std::string& description,
                               TicketStatus status) {
        registry.add({name, description, empty_input_schema()},
                     [store, status]() { return store->by_status(status); });
    };

    add_status_tool("get_pending_tickets", "Get pending tickets", TicketStatus::Pending);
    add_status_tool("get_done_tickets", "Get done tickets", TicketStatus::Done);
    add_status_tool("get_todo_tickets", "Get todo tickets", TicketStatus::Todo);
    return registry;
}

} // namespace tix
