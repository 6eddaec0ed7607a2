#include "tix/session.hpp"
#include "tix/codec.hpp"
#include "tix/error.hpp"
#include <spdlog/spdlog.h>

namespace tix {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Open:        return "open";
        case SessionState::Reading:     return "reading";
        case SessionState::Dispatching: return "dispatching";
        case SessionState::Writing:     return "writing";
        case SessionState::Closed:      return "closed";
    }
    return "unknown";
}

Session::Session(std::string id, IConnection& connection, const Router& router)
    : id_(std::move(id)), connection_(connection), router_(router) {
}

SessionState Session::state() const {
    return state_.load();
}

void Session::set_state(SessionState s) {
    state_.store(s);
}

Response Session::handle_frame(const std::string& frame) const {
    Request req;
    try {
        req = Codec::parse(frame);
    } catch (const TixParseError& e) {
        spdlog::warn("session {}: {}", id_, e.what());
        return Response::failure(e.request_id(), error::ParseError, e.what());
    }

    spdlog::debug("session {}: method={} id={}", id_, req.method, req.id);
    return router_.dispatch(req);
}

void Session::run() {
    spdlog::info("session {} opened from {}", id_, connection_.remote_endpoint());

    while (true) {
        set_state(SessionState::Reading);
        std::optional<std::string> frame;
        try {
            frame = connection_.read_frame();
        } catch (const TixTransportError& e) {
            spdlog::error("session {}: read error: {}", id_, e.what());
            break;
        }
        if (!frame) {
            spdlog::info("session {}: peer disconnected", id_);
            break;
        }

        set_state(SessionState::Dispatching);
        Response resp = handle_frame(*frame);

        std::string payload;
        try {
            payload = Codec::serialize(resp);
        } catch (const std::exception& e) {
            spdlog::error("session {}: dropping response for id={}: {}", id_, resp.id, e.what());
            continue;
        }

        set_state(SessionState::Writing);
        try {
            connection_.write_frame(payload);
        } catch (const TixTransportError& e) {
            spdlog::error("session {}: write error: {}", id_, e.what());
            break;
        }
        ++requests_handled_;
    }

    set_state(SessionState::Closed);
    connection_.close();
    spdlog::info("session {} closed after {} request(s)", id_, requests_handled_.load());
}

} // namespace tix
