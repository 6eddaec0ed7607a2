#include "tix/transport/websocket_server.hpp"
#include "tix/error.hpp"
#include "tix/session.hpp"

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <list>
#include <map>
#include <mutex>
#include <thread>

namespace tix {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;
using connection_hdl = websocketpp::connection_hdl;
using message_ptr = WsServer::message_ptr;

/// Bridges websocketpp's callback model to the blocking IConnection API:
/// the IO thread pushes frames into the inbox, the session thread pops them.
class WebSocketConnection : public IConnection {
public:
    WebSocketConnection(WsServer& server, connection_hdl hdl, std::string remote)
        : server_(server), hdl_(std::move(hdl)), remote_(std::move(remote)) {}

    std::optional<std::string> read_frame() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !inbox_.empty() || closed_; });
        if (closed_) return std::nullopt;
        std::string frame = std::move(inbox_.front());
        inbox_.pop_front();
        return frame;
    }

    void write_frame(const std::string& frame) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) throw TixTransportError("Connection closed");
        }
        websocketpp::lib::error_code ec;
        server_.send(hdl_, frame, websocketpp::frame::opcode::text, ec);
        if (ec) {
            throw TixTransportError("Send failed: " + ec.message());
        }
    }

    void close() override {
        bool peer_gone;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            peer_gone = peer_closed_;
            closed_ = true;
        }
        cv_.notify_all();
        if (peer_gone) return;

        websocketpp::lib::error_code ec;
        server_.close(hdl_, websocketpp::close::status::normal, "", ec);
        if (ec) {
            spdlog::debug("close {}: {}", remote_, ec.message());
        }
    }

    std::string remote_endpoint() const override { return remote_; }

    // Called on the IO thread.
    void push(std::string frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            inbox_.push_back(std::move(frame));
        }
        cv_.notify_one();
    }

    // Called on the IO thread once websocketpp reports the connection gone.
    void on_peer_closed() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            peer_closed_ = true;
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Server-initiated close during shutdown.
    void close_going_away() {
        bool peer_gone;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            peer_gone = peer_closed_;
            closed_ = true;
        }
        cv_.notify_all();
        if (peer_gone) return;

        websocketpp::lib::error_code ec;
        server_.close(hdl_, websocketpp::close::status::going_away, "Server shutting down", ec);
        if (ec) {
            spdlog::debug("close {}: {}", remote_, ec.message());
        }
    }

private:
    WsServer& server_;
    connection_hdl hdl_;
    std::string remote_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbox_;
    bool closed_{false};
    bool peer_closed_{false};
};

struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

} // anonymous namespace

struct WebSocketServer::Impl {
    Options opts;
    const Router& router;
    WsServer server;

    std::atomic<bool> listening{false};
    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};
    std::atomic<uint16_t> bound_port{0};
    std::atomic<uint64_t> next_session_id{1};

    mutable std::mutex connections_mutex;
    std::map<connection_hdl, std::shared_ptr<WebSocketConnection>,
             std::owner_less<connection_hdl>> connections;
    std::list<Worker> workers;

    Impl(Options o, const Router& r) : opts(std::move(o)), router(r) {}

    std::shared_ptr<WebSocketConnection> find(connection_hdl hdl) {
        std::lock_guard<std::mutex> lock(connections_mutex);
        auto it = connections.find(hdl);
        if (it == connections.end()) return nullptr;
        return it->second;
    }

    // Caller holds connections_mutex.
    void reap_finished_workers() {
        for (auto it = workers.begin(); it != workers.end(); ) {
            if (it->done->load()) {
                if (it->thread.joinable()) it->thread.join();
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    }

    void join_workers() {
        std::list<Worker> pending;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            pending.swap(workers);
        }
        for (auto& w : pending) {
            if (w.thread.joinable()) w.thread.join();
        }
    }

    bool on_validate(connection_hdl hdl) {
        auto con = server.get_con_from_hdl(hdl);
        std::string resource = con->get_resource();
        std::string path = resource.substr(0, resource.find('?'));
        if (path != opts.path) {
            spdlog::warn("rejecting handshake from {} for {}", con->get_remote_endpoint(), resource);
            con->set_status(websocketpp::http::status_code::not_found);
            return false;
        }
        return true;
    }

    void on_open(connection_hdl hdl) {
        // Handshake completed after shutdown() swept the open connections.
        if (stop_requested) {
            websocketpp::lib::error_code ec;
            server.close(hdl, websocketpp::close::status::going_away, "Server shutting down", ec);
            if (ec) {
                spdlog::debug("close late connection: {}", ec.message());
            }
            return;
        }

        auto con = server.get_con_from_hdl(hdl);
        auto conn = std::make_shared<WebSocketConnection>(server, hdl, con->get_remote_endpoint());
        std::string session_id = "s" + std::to_string(next_session_id++);
        auto done = std::make_shared<std::atomic<bool>>(false);

        std::lock_guard<std::mutex> lock(connections_mutex);
        reap_finished_workers();
        connections[hdl] = conn;
        workers.push_back(Worker{
            std::thread([this, conn, session_id, done]() {
                try {
                    Session session(session_id, *conn, router);
                    session.run();
                } catch (const std::exception& e) {
                    spdlog::error("session {} aborted: {}", session_id, e.what());
                    conn->close();
                }
                done->store(true);
            }),
            done
        });
    }

    void on_message(connection_hdl hdl, message_ptr msg) {
        auto conn = find(hdl);
        if (!conn) {
            spdlog::warn("frame from unknown connection dropped");
            return;
        }
        conn->push(msg->get_payload());
    }

    void on_closed(connection_hdl hdl) {
        std::shared_ptr<WebSocketConnection> conn;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            auto it = connections.find(hdl);
            if (it == connections.end()) return;
            conn = it->second;
            connections.erase(it);
        }
        conn->on_peer_closed();
    }

    // Runs on the IO thread. Once the acceptor and every connection are gone
    // the IO loop has no work left and run() returns.
    void stop_on_io_thread() {
        websocketpp::lib::error_code ec;
        server.stop_listening(ec);
        if (ec) {
            spdlog::warn("stop listening: {}", ec.message());
        }

        std::map<connection_hdl, std::shared_ptr<WebSocketConnection>,
                 std::owner_less<connection_hdl>> open;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            open.swap(connections);
        }
        for (auto& entry : open) {
            entry.second->close_going_away();
        }
    }

    // The IO loop died; wake every session so its thread can be joined.
    void abandon_connections() {
        std::map<connection_hdl, std::shared_ptr<WebSocketConnection>,
                 std::owner_less<connection_hdl>> open;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            open.swap(connections);
        }
        for (auto& entry : open) {
            entry.second->on_peer_closed();
        }
    }

    void on_fail(connection_hdl hdl) {
        auto con = server.get_con_from_hdl(hdl);
        // Rejected handshakes were already reported by on_validate.
        if (con->get_ec() != websocketpp::error::rejected) {
            spdlog::error("connection from {} failed: {}", con->get_remote_endpoint(),
                          con->get_ec().message());
        }
        on_closed(hdl);
    }
};

WebSocketServer::WebSocketServer(Options opts, const Router& router)
    : impl_(std::make_unique<Impl>(std::move(opts), router)) {
    auto& server = impl_->server;

    // Reported through spdlog instead.
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);

    server.set_max_message_size(impl_->opts.max_message_size);

    Impl* impl = impl_.get();
    server.set_validate_handler([impl](connection_hdl hdl) { return impl->on_validate(hdl); });
    server.set_open_handler([impl](connection_hdl hdl) { impl->on_open(hdl); });
    server.set_message_handler([impl](connection_hdl hdl, message_ptr msg) {
        impl->on_message(hdl, msg);
    });
    server.set_close_handler([impl](connection_hdl hdl) { impl->on_closed(hdl); });
    server.set_fail_handler([impl](connection_hdl hdl) { impl->on_fail(hdl); });
}

WebSocketServer::~WebSocketServer() {
    shutdown();
    impl_->join_workers();
}

void WebSocketServer::listen() {
    if (impl_->listening.exchange(true)) return;

    auto& server = impl_->server;
    const auto& opts = impl_->opts;
    websocketpp::lib::error_code ec;

    server.init_asio(ec);
    if (ec) {
        impl_->listening = false;
        throw TixTransportError("Failed to initialise IO service: " + ec.message());
    }
    server.set_reuse_addr(true);

    server.listen(opts.host, std::to_string(opts.port), ec);
    if (ec) {
        impl_->listening = false;
        throw TixTransportError("Failed to listen on " + opts.host + ":" +
                                std::to_string(opts.port) + ": " + ec.message());
    }

    websocketpp::lib::asio::error_code aec;
    auto endpoint = server.get_local_endpoint(aec);
    if (aec) {
        impl_->listening = false;
        throw TixTransportError("Failed to query local endpoint: " + aec.message());
    }
    impl_->bound_port = endpoint.port();

    server.start_accept(ec);
    if (ec) {
        impl_->listening = false;
        throw TixTransportError("Failed to start accepting: " + ec.message());
    }
    spdlog::info("listening on ws://{}:{}{}", opts.host, impl_->bound_port.load(), opts.path);
}

void WebSocketServer::run() {
    if (impl_->stop_requested) return;
    listen();
    if (impl_->running.exchange(true)) return;

    try {
        impl_->server.run();
    } catch (const std::exception& e) {
        impl_->running = false;
        impl_->abandon_connections();
        impl_->join_workers();
        throw TixTransportError(std::string("WebSocket server error: ") + e.what());
    }
    impl_->running = false;
    impl_->join_workers();
    spdlog::info("server stopped");
}

void WebSocketServer::shutdown() {
    if (impl_->stop_requested.exchange(true)) return;
    if (!impl_->listening) return;

    Impl* impl = impl_.get();
    impl_->server.get_io_service().post([impl] { impl->stop_on_io_thread(); });
}

uint16_t WebSocketServer::port() const {
    return impl_->bound_port;
}

bool WebSocketServer::is_running() const {
    return impl_->running;
}

std::size_t WebSocketServer::active_sessions() const {
    std::lock_guard<std::mutex> lock(impl_->connections_mutex);
    return impl_->connections.size();
}

} // namespace tix
