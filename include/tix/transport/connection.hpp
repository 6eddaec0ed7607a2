#pragma once
#include <optional>
#include <string>

namespace tix {

/// One accepted peer exchanging discrete text frames.
class IConnection {
public:
    virtual ~IConnection() = default;

    /// Block until the next inbound frame arrives.
    /// Returns nullopt once the peer has closed the connection.
    /// Throws TixTransportError on a read failure.
    virtual std::optional<std::string> read_frame() = 0;

    /// Write one frame. Throws TixTransportError on failure.
    virtual void write_frame(const std::string& frame) = 0;

    /// Close the connection; later reads return nullopt.
    virtual void close() = 0;

    [[nodiscard]] virtual std::string remote_endpoint() const = 0;
};

} // namespace tix
