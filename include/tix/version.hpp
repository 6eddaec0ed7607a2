#pragma once
#include <string_view>

namespace tix {

constexpr std::string_view LIBRARY_VERSION     = "1.0.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view SERVER_NAME         = "mcp-tickets";

} // namespace tix
