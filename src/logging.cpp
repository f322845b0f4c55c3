#include "mcpkit/logging.hpp"
#include "mcpkit/error.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcpkit::logging {

namespace {
constexpr const char* LoggerName = "mcpkit";
std::mutex logger_mutex;
} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (auto existing = spdlog::get(LoggerName)) return existing;
    auto created = spdlog::stderr_color_mt(LoggerName);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
    return created;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

void set_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw McpConfigError("Unknown log level: " + level);
    }
    set_level(parsed);
}

} // namespace mcpkit::logging
