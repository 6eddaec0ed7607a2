#pragma once
#include "json_rpc.hpp"
#include "router.hpp"
#include "transport/connection.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace tix {

enum class SessionState {
    Open,
    Reading,
    Dispatching,
    Writing,
    Closed
};

const char* to_string(SessionState state);

/// Sequential read-dispatch-write loop for one connection.
class Session {
public:
    Session(std::string id, IConnection& connection, const Router& router);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Serve frames until the peer closes or a read/write fails.
    /// Never throws for protocol-level errors; those become error responses.
    void run();

    /// Build the response for a single raw frame.
    [[nodiscard]] Response handle_frame(const std::string& frame) const;

    const std::string& id() const { return id_; }
    SessionState state() const;
    std::uint64_t requests_handled() const { return requests_handled_; }

private:
    void set_state(SessionState s);

    std::string id_;
    IConnection& connection_;
    const Router& router_;
    std::atomic<SessionState> state_{SessionState::Open};
    std::atomic<std::uint64_t> requests_handled_{0};
};

} // namespace tix
