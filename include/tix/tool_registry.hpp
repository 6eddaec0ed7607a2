#pragma once
#include "types.hpp"
#include "tickets.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tix {

/// Zero-argument tool body.
using ToolHandler = std::function<std::vector<Ticket>()>;

class ToolRegistry {
public:
    struct Entry {
        ToolDefinition definition;
        ToolHandler handler;
    };

    /// Register a tool. Throws std::invalid_argument on a duplicate name.
    void add(ToolDefinition def, ToolHandler handler);

    /// Descriptors in registration order.
    [[nodiscard]] const std::vector<ToolDefinition>& list() const { return definitions_; }

    /// Exact, case-sensitive lookup. nullptr when absent.
    [[nodiscard]] const Entry* find(const std::string& name) const;

    /// Run a tool. Throws TixProtocolError(ToolNotFound) for unknown names.
    [[nodiscard]] std::vector<Ticket> call(const std::string& name) const;

    [[nodiscard]] std::size_t size() const { return definitions_.size(); }

private:
    std::vector<ToolDefinition> definitions_;
    std::unordered_map<std::string, Entry> entries_;
};

/// Schema shared by every zero-argument tool.
nlohmann::json empty_input_schema();

/// Registry holding get_pending_tickets, get_done_tickets and get_todo_tickets.
ToolRegistry make_ticket_tools(std::shared_ptr<const TicketStore> store);

} // namespace tix
