#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace mcpkit::logging {

/// The library logger ("mcpkit"). Writes to stderr so that stdout stays
/// free for the line-stream transport. Created on first use.
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

/// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
/// "critical", "off"). Throws McpConfigError on anything else.
void set_level(const std::string& level);

} // namespace mcpkit::logging
