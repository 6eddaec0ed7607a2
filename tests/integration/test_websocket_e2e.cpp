#include <gtest/gtest.h>
#include "tix/server.hpp"
#include "tix/codec.hpp"
#include "tix/error.hpp"

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <array>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <sstream>
#include <thread>

using namespace tix;

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;

/// Minimal blocking WebSocket client for driving the server in tests.
class TestClient {
public:
    TestClient() {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();

        client_.set_open_handler([this](websocketpp::connection_hdl) {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
            cv_.notify_all();
        });
        client_.set_fail_handler([this](websocketpp::connection_hdl) {
            std::lock_guard<std::mutex> lock(mutex_);
            failed_ = true;
            cv_.notify_all();
        });
        client_.set_close_handler([this](websocketpp::connection_hdl hdl) {
            auto con = client_.get_con_from_hdl(hdl);
            std::lock_guard<std::mutex> lock(mutex_);
            close_code_ = con->get_remote_close_code();
            closed_ = true;
            cv_.notify_all();
        });
        client_.set_message_handler([this](websocketpp::connection_hdl, WsClient::message_ptr msg) {
            std::lock_guard<std::mutex> lock(mutex_);
            inbox_.push_back(msg->get_payload());
            cv_.notify_all();
        });
    }

    ~TestClient() {
        close();
        client_.stop();
        if (thread_.joinable()) thread_.join();
    }

    /// Returns false when the handshake is rejected or times out.
    bool connect(const std::string& uri) {
        websocketpp::lib::error_code ec;
        auto con = client_.get_connection(uri, ec);
        if (ec) return false;
        hdl_ = con->get_handle();
        client_.connect(con);
        thread_ = std::thread([this] { client_.run(); });

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::seconds(5), [this] { return open_ || failed_; });
        return open_;
    }

    void send(const std::string& frame,
              websocketpp::frame::opcode::value op = websocketpp::frame::opcode::text) {
        websocketpp::lib::error_code ec;
        client_.send(hdl_, frame, op, ec);
        ASSERT_FALSE(ec) << ec.message();
    }

    std::optional<Response> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, std::chrono::seconds(5), [this] { return !inbox_.empty(); })) {
            return std::nullopt;
        }
        std::string frame = std::move(inbox_.front());
        inbox_.pop_front();
        return Codec::parse_response(frame);
    }

    std::optional<Response> call(const std::string& frame) {
        send(frame);
        return receive();
    }

    bool wait_closed(std::chrono::seconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return closed_; });
    }

    websocketpp::close::status::value close_code() {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_code_;
    }

    void close() {
        bool should_close;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            should_close = open_ && !closed_;
        }
        if (!should_close) return;
        websocketpp::lib::error_code ec;
        client_.close(hdl_, websocketpp::close::status::normal, "", ec);
        wait_closed();
    }

private:
    WsClient client_;
    websocketpp::connection_hdl hdl_;
    std::thread thread_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbox_;
    bool open_{false};
    bool failed_{false};
    bool closed_{false};
    websocketpp::close::status::value close_code_{websocketpp::close::status::blank};
};

bool eventually(const std::function<bool()>& pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // anonymous namespace

class WebSocketE2ETest : public ::testing::Test {
protected:
    std::unique_ptr<TicketServer> server_;
    std::thread server_thread_;

    void SetUp() override {
        TicketServer::Options opts;
        opts.listen.host = "127.0.0.1";
        opts.listen.port = 0;
        server_ = std::make_unique<TicketServer>(opts);
        server_->listen();
        server_thread_ = std::thread([this] { server_->serve(); });
    }

    void TearDown() override {
        server_->shutdown();
        if (server_thread_.joinable()) server_thread_.join();
        server_.reset();
    }

    std::string uri(const std::string& path = "/ws") const {
        return "ws://127.0.0.1:" + std::to_string(server_->port()) + path;
    }
};

TEST_F(WebSocketE2ETest, BindsEphemeralPort) {
    EXPECT_NE(server_->port(), 0);
    EXPECT_TRUE(eventually([this] { return server_->is_running(); }));
}

TEST_F(WebSocketE2ETest, FullConversation) {
    TestClient client;
    ASSERT_TRUE(client.connect(uri()));

    auto init = client.call(R"({"id":"1","method":"initialize"})");
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ(init->id, "1");
    ASSERT_TRUE(init->result.has_value());
    EXPECT_TRUE(init->result->at("capabilities").at("tools").at("list").at("enabled").get<bool>());

    auto list = client.call(R"({"id":"2","method":"tools/list"})");
    ASSERT_TRUE(list.has_value());
    ASSERT_TRUE(list->result.has_value());
    EXPECT_EQ(list->result->at("tools").size(), 3u);

    auto done = client.call(R"({"id":"3","method":"tools/call","params":{"name":"get_done_tickets"}})");
    ASSERT_TRUE(done.has_value());
    ASSERT_TRUE(done->result.has_value());
    for (const auto& t : done->result->at("tickets")) EXPECT_EQ(t.at("status"), "done");

    auto missing = client.call(R"({"id":"4","method":"tools/call","params":{"name":"nonexistent"}})");
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->id, "4");
    ASSERT_TRUE(missing->error.has_value());
    EXPECT_EQ(missing->error->code, error::ToolNotFound);

    auto unknown = client.call(R"({"id":"5","method":"unknown/thing"})");
    ASSERT_TRUE(unknown.has_value());
    ASSERT_TRUE(unknown->error.has_value());
    EXPECT_EQ(unknown->error->code, error::MethodNotFound);
}

TEST_F(WebSocketE2ETest, MalformedFrameKeepsConnection) {
    TestClient client;
    ASSERT_TRUE(client.connect(uri()));

    auto bad = client.call("{{{ definitely not json");
    ASSERT_TRUE(bad.has_value());
    EXPECT_EQ(bad->id, "");
    ASSERT_TRUE(bad->error.has_value());
    EXPECT_EQ(bad->error->code, error::ParseError);

    auto good = client.call(R"({"id":"6","method":"tools/list"})");
    ASSERT_TRUE(good.has_value());
    EXPECT_EQ(good->id, "6");
    EXPECT_TRUE(good->result.has_value());
}

TEST_F(WebSocketE2ETest, ConnectionsAreIndependent) {
    TestClient a;
    TestClient b;
    ASSERT_TRUE(a.connect(uri()));
    ASSERT_TRUE(b.connect(uri()));

    auto from_b = b.call(R"({"id":"b1","method":"tools/list"})");
    auto from_a = a.call(R"({"id":"a1","method":"tools/list"})");
    ASSERT_TRUE(from_a.has_value());
    ASSERT_TRUE(from_b.has_value());
    EXPECT_EQ(from_a->id, "a1");
    EXPECT_EQ(from_b->id, "b1");
    EXPECT_EQ(from_a->result, from_b->result);

    EXPECT_EQ(server_->active_sessions(), 2u);

    a.close();
    EXPECT_TRUE(eventually([this] { return server_->active_sessions() == 1; }));
    auto again = b.call(R"({"id":"b2","method":"ping"})");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->id, "b2");
}

TEST_F(WebSocketE2ETest, WrongPathRejected) {
    TestClient client;
    EXPECT_FALSE(client.connect(uri("/other")));
}

TEST_F(WebSocketE2ETest, QueryStringIgnoredOnPath) {
    TestClient client;
    ASSERT_TRUE(client.connect(uri("/ws?x=1")));
    auto resp = client.call(R"({"id":"q","method":"ping"})");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->id, "q");
}

TEST_F(WebSocketE2ETest, BinaryFrameTreatedAsText) {
    TestClient client;
    ASSERT_TRUE(client.connect(uri()));
    client.send(R"({"id":"bin","method":"tools/list"})", websocketpp::frame::opcode::binary);
    auto resp = client.receive();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->id, "bin");
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ(resp->result->at("tools").size(), 3u);
}

TEST_F(WebSocketE2ETest, OversizedFrameClosesConnection) {
    TestClient client;
    ASSERT_TRUE(client.connect(uri()));
    client.send(std::string(2 * 1024 * 1024, ' '));
    // The server may wait out its close handshake timeout before dropping TCP.
    ASSERT_TRUE(client.wait_closed(std::chrono::seconds(15)));
    EXPECT_EQ(client.close_code(), websocketpp::close::status::message_too_big);
    EXPECT_TRUE(eventually([this] { return server_->active_sessions() == 0; }));
}

TEST_F(WebSocketE2ETest, ShutdownClosesClients) {
    TestClient client;
    ASSERT_TRUE(client.connect(uri()));
    ASSERT_TRUE(client.call(R"({"id":"1","method":"ping"})").has_value());

    server_->shutdown();
    EXPECT_TRUE(client.wait_closed());
    EXPECT_EQ(client.close_code(), websocketpp::close::status::going_away);
    server_thread_.join();
    EXPECT_FALSE(server_->is_running());
}

TEST_F(WebSocketE2ETest, HandshakeCompletingAfterShutdownIsClosed) {
    namespace asio = boost::asio;
    using asio::ip::tcp;

    asio::io_context io;
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->port()));
    // Let the server accept before the listener goes away.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    server_->shutdown();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    asio::write(socket, asio::buffer(std::string(
        "GET /ws HTTP/1.1\r\n"
        "Host: 127.0.0.1\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
        "Sec-WebSocket-Version: 13\r\n\r\n")));

    std::string received;
    std::array<char, 512> chunk{};
    std::function<void()> read_more = [&] {
        socket.async_read_some(asio::buffer(chunk),
            [&](const boost::system::error_code& ec, std::size_t n) {
                if (ec) return;
                received.append(chunk.data(), n);
                read_more();
            });
    };
    read_more();
    io.run_for(std::chrono::seconds(2));

    auto header_end = received.find("\r\n\r\n");
    ASSERT_NE(header_end, std::string::npos) << received;
    EXPECT_NE(received.find(" 101 "), std::string::npos);

    // Server close frame: FIN|close, then status 1001.
    std::string frame = received.substr(header_end + 4);
    ASSERT_GE(frame.size(), 4u);
    EXPECT_EQ(static_cast<unsigned char>(frame[0]), 0x88);
    EXPECT_EQ(static_cast<unsigned char>(frame[2]) << 8 | static_cast<unsigned char>(frame[3]),
              websocketpp::close::status::going_away);

    socket.close();
}

TEST(WebSocketServer, RejectedHandshakeLoggedOnce) {
    std::ostringstream captured;
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured)));

    {
        TicketServer::Options opts;
        opts.listen.host = "127.0.0.1";
        opts.listen.port = 0;
        TicketServer server(opts);
        server.listen();
        std::thread serving([&server] { server.serve(); });

        {
            TestClient client;
            EXPECT_FALSE(client.connect("ws://127.0.0.1:" + std::to_string(server.port()) + "/nope"));
        }

        // Joining the IO thread guarantees every handler has run.
        server.shutdown();
        serving.join();
    }
    spdlog::set_default_logger(previous);

    std::string log = captured.str();
    EXPECT_NE(log.find("rejecting handshake"), std::string::npos) << log;
    EXPECT_EQ(log.find(" failed: "), std::string::npos) << log;
}

TEST(WebSocketServer, PortInUseFailsToListen) {
    Router router;
    WebSocketServer::Options opts;
    opts.host = "127.0.0.1";
    opts.port = 0;
    WebSocketServer first(opts, router);
    first.listen();

    opts.port = first.port();
    WebSocketServer second(opts, router);
    // SO_REUSEADDR does not permit two listeners on the same port.
    EXPECT_THROW(second.listen(), TixTransportError);
}
