#pragma once
#include <string_view>

namespace mcpkit {

constexpr std::string_view LIBRARY_VERSION     = "0.3.0";
constexpr std::string_view PROTOCOL_VERSION    = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace mcpkit
