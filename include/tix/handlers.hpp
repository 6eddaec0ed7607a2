#pragma once
#include "types.hpp"
#include "tickets.hpp"
#include "tool_registry.hpp"
#include "router.hpp"
#include <memory>

namespace tix {

/// Process-wide read-only state shared by every session. Built once before the
/// listener starts and never modified afterwards.
struct ServerContext {
    Implementation server_info;
    std::shared_ptr<const TicketStore> tickets;
    ToolRegistry tools;

    /// Built-in ticket dataset and the three ticket tools.
    static ServerContext builtin();
};

/// Bind initialize, ping, tools/list and tools/call to the router.
/// The router keeps a reference to ctx, which must outlive it.
void register_handlers(Router& router, const ServerContext& ctx);

} // namespace tix
