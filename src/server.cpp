#include "tix/server.hpp"

namespace tix {

struct TicketServer::Impl {
    ServerContext context;
    Router router;
    WebSocketServer transport;

    Impl(Options opts, ServerContext ctx)
        : context(std::move(ctx))
        , transport(std::move(opts.listen), router) {
        register_handlers(router, context);
    }
};

TicketServer::TicketServer(Options opts, ServerContext context)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(context))) {
}

TicketServer::~TicketServer() = default;

void TicketServer::listen() {
    impl_->transport.listen();
}

void TicketServer::serve() {
    impl_->transport.run();
}

void TicketServer::shutdown() {
    impl_->transport.shutdown();
}

uint16_t TicketServer::port() const {
    return impl_->transport.port();
}

bool TicketServer::is_running() const {
    return impl_->transport.is_running();
}

std::size_t TicketServer::active_sessions() const {
    return impl_->transport.active_sessions();
}

const ServerContext& TicketServer::context() const {
    return impl_->context;
}

} // namespace tix
