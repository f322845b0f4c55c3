#include "mcpkit/config.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/transport/http_transport.hpp"
#include "mcpkit/transport/stdio_transport.hpp"
#include "mcpkit/transport/websocket_transport.hpp"
#include <fstream>
#include <limits>

namespace mcpkit {

namespace {

// Reads `key` of `obj` into `out` when present. `path` is the dotted name
// used in error messages.
template<typename T>
void read_field(const nlohmann::json& obj, const char* key, const std::string& path, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception&) {
        throw McpConfigError("Config key '" + path + "' has the wrong type");
    }
}

void read_count(const nlohmann::json& obj, const char* key, const std::string& path,
                size_t& out, size_t max = std::numeric_limits<size_t>::max()) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    if (!it->is_number_integer() || it->get<int64_t>() < 0) {
        throw McpConfigError("Config key '" + path + "' must be a non-negative integer");
    }
    auto value = it->get<uint64_t>();
    if (value > max) {
        throw McpConfigError("Config key '" + path + "' is out of range");
    }
    out = static_cast<size_t>(value);
}

const nlohmann::json& section(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return empty;
    if (!it->is_object()) {
        throw McpConfigError(std::string("Config key '") + key + "' must be an object");
    }
    return *it;
}

TransportConfig parse_transport(const nlohmann::json& t) {
    TransportConfig cfg;
    read_field(t, "kind", "transport.kind", cfg.kind);
    if (cfg.kind != "stdio" && cfg.kind != "http" && cfg.kind != "websocket") {
        throw McpConfigError("Config key 'transport.kind' must be stdio, http or websocket, got '" +
                             cfg.kind + "'");
    }
    read_field(t, "host", "transport.host", cfg.host);

    size_t port = cfg.port;
    read_count(t, "port", "transport.port", port, 65535);
    cfg.port = static_cast<uint16_t>(port);

    read_field(t, "request_path", "transport.request_path", cfg.request_path);
    read_field(t, "notify_path", "transport.notify_path", cfg.notify_path);
    read_field(t, "events_path", "transport.events_path", cfg.events_path);
    read_field(t, "health_path", "transport.health_path", cfg.health_path);
    read_field(t, "allowed_origins", "transport.allowed_origins", cfg.allowed_origins);
    read_count(t, "push_queue_capacity", "transport.push_queue_capacity", cfg.push_queue_capacity);
    read_count(t, "max_frame_bytes", "transport.max_frame_bytes", cfg.max_frame_bytes);
    if (cfg.max_frame_bytes == 0) {
        throw McpConfigError("Config key 'transport.max_frame_bytes' must be positive");
    }
    return cfg;
}

} // anonymous namespace

ServerConfig parse_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw McpConfigError("Configuration must be a JSON object");
    }

    ServerConfig cfg;

    const auto& server = section(j, "server");
    read_field(server, "name", "server.name", cfg.server_info.name);
    read_field(server, "version", "server.version", cfg.server_info.version);
    if (server.contains("instructions") && !server["instructions"].is_null()) {
        std::string instructions;
        read_field(server, "instructions", "server.instructions", instructions);
        cfg.instructions = instructions;
    }

    read_count(j, "page_size", "page_size", cfg.page_size);
    read_count(j, "worker_threads", "worker_threads", cfg.worker_threads);
    if (cfg.worker_threads == 0) {
        throw McpConfigError("Config key 'worker_threads' must be positive");
    }

    size_t grace_ms = static_cast<size_t>(cfg.shutdown_grace.count());
    read_count(j, "shutdown_grace_ms", "shutdown_grace_ms", grace_ms);
    cfg.shutdown_grace = std::chrono::milliseconds(grace_ms);

    read_field(j, "supported_protocol_versions", "supported_protocol_versions",
               cfg.supported_protocol_versions);
    read_field(j, "log_level", "log_level", cfg.log_level);

    cfg.transport = parse_transport(section(j, "transport"));
    return cfg;
}

ServerConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw McpConfigError("Cannot open config file: " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw McpConfigError("Invalid JSON in " + path + ": " + e.what());
    }
    return parse_config(j);
}

McpServer::Options server_options(const ServerConfig& cfg) {
    McpServer::Options opts;
    opts.server_info = cfg.server_info;
    opts.instructions = cfg.instructions;
    opts.page_size = cfg.page_size;
    opts.worker_threads = cfg.worker_threads;
    opts.shutdown_grace = cfg.shutdown_grace;
    if (!cfg.supported_protocol_versions.empty()) {
        opts.supported_protocol_versions = cfg.supported_protocol_versions;
    }
    return opts;
}

std::unique_ptr<ITransport> make_transport(const TransportConfig& cfg) {
    if (cfg.kind == "http") {
        HttpServerTransport::Options opts;
        opts.host = cfg.host;
        opts.port = cfg.port;
        opts.request_path = cfg.request_path;
        opts.notify_path = cfg.notify_path;
        opts.events_path = cfg.events_path;
        opts.health_path = cfg.health_path;
        opts.allowed_origins = cfg.allowed_origins;
        opts.push_queue_capacity = cfg.push_queue_capacity;
        opts.max_frame_bytes = cfg.max_frame_bytes;
        return std::make_unique<HttpServerTransport>(opts);
    }
    if (cfg.kind == "websocket") {
        WebSocketServerTransport::Options opts;
        opts.host = cfg.host;
        opts.port = cfg.port;
        opts.path = cfg.request_path;
        opts.push_queue_capacity = cfg.push_queue_capacity;
        opts.max_frame_bytes = cfg.max_frame_bytes;
        return std::make_unique<WebSocketServerTransport>(opts);
    }
    if (cfg.kind == "stdio") {
        StdioTransport::Options opts;
        opts.max_frame_bytes = cfg.max_frame_bytes;
        opts.push_queue_capacity = cfg.push_queue_capacity;
        return std::make_unique<StdioTransport>(opts);
    }
    throw McpConfigError("Unknown transport kind: " + cfg.kind);
}

} // namespace mcpkit
