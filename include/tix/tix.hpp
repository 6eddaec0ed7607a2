#pragma once

/// Umbrella header for the tix ticket MCP server library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "tickets.hpp"
#include "tool_registry.hpp"
#include "router.hpp"
#include "handlers.hpp"
#include "session.hpp"
#include "server.hpp"
#include "transport/connection.hpp"
#include "transport/websocket_server.hpp"
