#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace tix {

class Codec {
public:
    /// Parse one inbound frame into a request.
    /// Throws TixParseError on invalid JSON or a malformed envelope; the error
    /// carries the request id when one could be recovered.
    [[nodiscard]] static Request parse(std::string_view raw);

    /// Parse a response envelope (client side).
    [[nodiscard]] static Response parse_response(std::string_view raw);

    [[nodiscard]] static std::string serialize(const Response& resp);
    [[nodiscard]] static std::string serialize(const Request& req);

private:
    static nlohmann::json parse_document(std::string_view raw);
};

} // namespace tix
