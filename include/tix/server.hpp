#pragma once
#include "types.hpp"
#include "handlers.hpp"
#include "router.hpp"
#include "transport/websocket_server.hpp"
#include <memory>

namespace tix {

/// Ticket server: the shared context, the method table and the WebSocket
/// listener wired together.
class TicketServer {
public:
    struct Options {
        WebSocketServer::Options listen;
    };

    explicit TicketServer(Options opts, ServerContext context = ServerContext::builtin());
    ~TicketServer();

    // Non-copyable, non-movable
    TicketServer(const TicketServer&) = delete;
    TicketServer& operator=(const TicketServer&) = delete;

    /// Bind the listener. Throws TixTransportError if the port is unavailable.
    void listen();

    /// Serve connections until shutdown(). Blocks.
    void serve();
    void shutdown();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool is_running() const;
    [[nodiscard]] std::size_t active_sessions() const;

    const ServerContext& context() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tix
