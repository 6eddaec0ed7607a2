#pragma once
#include "connection.hpp"
#include "../router.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace tix {

/// WebSocket listener. Every accepted connection gets its own thread running
/// a Session against the shared router.
class WebSocketServer {
public:
    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port = 8080;          // 0 picks an ephemeral port
        std::string path = "/ws";
        std::size_t max_message_size = 1024 * 1024;
    };

    WebSocketServer(Options opts, const Router& router);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /// Bind the listening socket. Throws TixTransportError on failure.
    void listen();

    /// Run the accept/IO loop on the calling thread until shutdown().
    /// Calls listen() first if it has not been called.
    void run();

    /// Close every connection and stop the IO loop. Safe from any thread.
    void shutdown();

    /// Bound port; valid after listen().
    [[nodiscard]] uint16_t port() const;

    [[nodiscard]] bool is_running() const;

    [[nodiscard]] std::size_t active_sessions() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tix
