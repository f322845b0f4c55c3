#pragma once
#include "server.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpkit {

struct TransportConfig {
    std::string kind = "stdio";  // "stdio" | "http" | "websocket"
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    std::string request_path = "/mcp";
    std::string notify_path = "/mcp/notify";
    std::string events_path = "/mcp/events";
    std::string health_path = "/health";
    std::vector<std::string> allowed_origins;
    size_t push_queue_capacity = 256;
    size_t max_frame_bytes = 4 * 1024 * 1024;
};

/// Everything needed to run a server from a file. Every field has a
/// default, so `{}` is a valid configuration.
struct ServerConfig {
    Implementation server_info{"mcpkit", std::string(LIBRARY_VERSION)};
    std::optional<std::string> instructions;
    size_t page_size = 50;
    size_t worker_threads = 4;
    std::chrono::milliseconds shutdown_grace{5000};
    std::vector<std::string> supported_protocol_versions;  // empty: library default
    std::string log_level = "info";
    TransportConfig transport;
};

/// Unknown keys are ignored. A key with the wrong type or an out-of-range
/// value raises McpConfigError naming the key.
ServerConfig parse_config(const nlohmann::json& j);

/// Read and parse a JSON file. Throws McpConfigError if it cannot be read
/// or is not valid JSON.
ServerConfig load_config(const std::string& path);

McpServer::Options server_options(const ServerConfig& cfg);

/// Build the transport named by `cfg.kind`.
std::unique_ptr<ITransport> make_transport(const TransportConfig& cfg);

} // namespace mcpkit
