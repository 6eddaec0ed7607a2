/// Ticket server: MCP-style JSON requests over WebSocket.
/// Usage: ./tix-server
/// Listens on ws://0.0.0.0:8080/ws.

#include <tix/tix.hpp>

int main() {
    tix::log::init(spdlog::level::info);

    tix::TicketServer server{tix::TicketServer::Options{}};

    try {
        server.listen();
        spdlog::info("{} {} serving {} tools over {} tickets",
                     server.context().server_info.name,
                     server.context().server_info.version,
                     server.context().tools.size(),
                     server.context().tickets->size());
        server.serve();
    } catch (const tix::TixTransportError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }
    return 0;
}
