#pragma once
#include <stdexcept>
#include <string>

namespace tix {

class TixError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Thrown by the codec when a frame is not a well-formed envelope.
/// Carries whatever request id could be salvaged (empty if none).
class TixParseError : public TixError {
public:
    explicit TixParseError(const std::string& msg, std::string request_id = {})
        : TixError(msg), request_id_(std::move(request_id)) {}

    const std::string& request_id() const { return request_id_; }

private:
    std::string request_id_;
};

class TixProtocolError : public TixError {
public:
    int code;
    TixProtocolError(int code, const std::string& msg)
        : TixError(msg), code(code) {}
};

class TixTransportError : public TixError {
public:
    using TixError::TixError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int ToolNotFound     = -32001;
} // namespace error

} // namespace tix
