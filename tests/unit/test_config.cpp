#include <gtest/gtest.h>
#include "mcpkit/config.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/logging.hpp"
#include "mcpkit/transport/http_transport.hpp"
#include "mcpkit/transport/stdio_transport.hpp"
#include "mcpkit/transport/websocket_transport.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace mcpkit;

namespace {

std::string expect_config_error(const nlohmann::json& j) {
    try {
        parse_config(j);
    } catch (const McpConfigError& e) {
        return e.what();
    }
    ADD_FAILURE() << "accepted " << j.dump();
    return {};
}

/// Temporary file removed on scope exit.
class TempFile {
public:
    explicit TempFile(const std::string& contents) {
        char name[] = "/tmp/mcpkit-config-XXXXXX";
        int fd = ::mkstemp(name);
        if (fd < 0) throw std::runtime_error("mkstemp failed");
        ::close(fd);
        path_ = name;
        std::ofstream(path_) << contents;
    }
    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

TEST(Config, EmptyObjectGivesDefaults) {
    auto cfg = parse_config(nlohmann::json::object());
    EXPECT_EQ(cfg.server_info.name, "mcpkit");
    EXPECT_EQ(cfg.page_size, 50u);
    EXPECT_EQ(cfg.worker_threads, 4u);
    EXPECT_EQ(cfg.shutdown_grace, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.transport.kind, "stdio");
    EXPECT_EQ(cfg.transport.port, 8080);
    EXPECT_FALSE(cfg.instructions.has_value());
}

TEST(Config, FullDocument) {
    auto cfg = parse_config(nlohmann::json::parse(R"({
        "server": {"name": "calc", "version": "2.1.0", "instructions": "Ask for sums"},
        "page_size": 10,
        "worker_threads": 8,
        "shutdown_grace_ms": 250,
        "supported_protocol_versions": ["2024-11-05"],
        "log_level": "debug",
        "transport": {
            "kind": "http",
            "host": "0.0.0.0",
            "port": 9000,
            "request_path": "/rpc",
            "allowed_origins": ["http://localhost"],
            "push_queue_capacity": 16,
            "max_frame_bytes": 1024
        },
        "unknown_key": {"ignored": true}
    })"));

    EXPECT_EQ(cfg.server_info.name, "calc");
    EXPECT_EQ(cfg.server_info.version, "2.1.0");
    EXPECT_EQ(cfg.instructions, std::optional<std::string>("Ask for sums"));
    EXPECT_EQ(cfg.page_size, 10u);
    EXPECT_EQ(cfg.worker_threads, 8u);
    EXPECT_EQ(cfg.shutdown_grace, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.supported_protocol_versions, std::vector<std::string>{"2024-11-05"});
    EXPECT_EQ(cfg.transport.kind, "http");
    EXPECT_EQ(cfg.transport.port, 9000);
    EXPECT_EQ(cfg.transport.request_path, "/rpc");
    EXPECT_EQ(cfg.transport.notify_path, "/mcp/notify");
    EXPECT_EQ(cfg.transport.allowed_origins.size(), 1u);
    EXPECT_EQ(cfg.transport.push_queue_capacity, 16u);
    EXPECT_EQ(cfg.transport.max_frame_bytes, 1024u);
}

TEST(Config, RejectsBadValuesNamingTheKey) {
    EXPECT_NE(expect_config_error(nlohmann::json::array()).find("object"), std::string::npos);
    EXPECT_NE(expect_config_error({{"page_size", -1}}).find("page_size"), std::string::npos);
    EXPECT_NE(expect_config_error({{"page_size", "ten"}}).find("page_size"), std::string::npos);
    EXPECT_NE(expect_config_error({{"worker_threads", 0}}).find("worker_threads"), std::string::npos);
    EXPECT_NE(expect_config_error({{"server", "calc"}}).find("server"), std::string::npos);
    EXPECT_NE(expect_config_error({{"server", {{"name", 3}}}}).find("server.name"), std::string::npos);
    EXPECT_NE(expect_config_error({{"transport", {{"port", 70000}}}}).find("transport.port"), std::string::npos);
    EXPECT_NE(expect_config_error({{"transport", {{"kind", "carrier-pigeon"}}}}).find("transport.kind"),
              std::string::npos);
    EXPECT_NE(expect_config_error({{"transport", {{"max_frame_bytes", 0}}}}).find("max_frame_bytes"),
              std::string::npos);
}

TEST(Config, NullValuesKeepDefaults) {
    auto cfg = parse_config({{"page_size", nullptr}, {"transport", nullptr}});
    EXPECT_EQ(cfg.page_size, 50u);
    EXPECT_EQ(cfg.transport.kind, "stdio");
}

TEST(Config, LoadFromFile) {
    TempFile file(R"({"server": {"name": "from-file"}, "page_size": 3})");
    auto cfg = load_config(file.path());
    EXPECT_EQ(cfg.server_info.name, "from-file");
    EXPECT_EQ(cfg.page_size, 3u);
}

TEST(Config, LoadFailures) {
    EXPECT_THROW(load_config("/nonexistent/mcpkit.json"), McpConfigError);
    TempFile broken("{\"page_size\": ");
    EXPECT_THROW(load_config(broken.path()), McpConfigError);
}

TEST(Config, ServerOptions) {
    auto cfg = parse_config({{"page_size", 7}, {"worker_threads", 2}, {"shutdown_grace_ms", 100}});
    auto opts = server_options(cfg);
    EXPECT_EQ(opts.page_size, 7u);
    EXPECT_EQ(opts.worker_threads, 2u);
    EXPECT_EQ(opts.shutdown_grace, std::chrono::milliseconds(100));
    // An empty list keeps the library's versions.
    EXPECT_FALSE(opts.supported_protocol_versions.empty());
    EXPECT_EQ(opts.supported_protocol_versions.front(), std::string(PROTOCOL_VERSION));
}

TEST(Config, MakeTransportByKind) {
    TransportConfig t;
    t.kind = "http";
    t.port = 0;
    EXPECT_NE(dynamic_cast<HttpServerTransport*>(make_transport(t).get()), nullptr);

    t.kind = "websocket";
    EXPECT_NE(dynamic_cast<WebSocketServerTransport*>(make_transport(t).get()), nullptr);

    t.kind = "stdio";
    EXPECT_NE(dynamic_cast<StdioTransport*>(make_transport(t).get()), nullptr);

    t.kind = "smoke-signals";
    EXPECT_THROW(make_transport(t), McpConfigError);
}

TEST(Config, StdioTransportTakesQueueAndFrameLimits) {
    TransportConfig t;
    t.kind = "stdio";
    t.push_queue_capacity = 8;
    t.max_frame_bytes = 1024;
    auto transport = make_transport(t);
    auto* stdio = dynamic_cast<StdioTransport*>(transport.get());
    ASSERT_NE(stdio, nullptr);
    EXPECT_EQ(stdio->options().push_queue_capacity, 8u);
    EXPECT_EQ(stdio->options().max_frame_bytes, 1024u);
}

TEST(Logging, LevelNames) {
    EXPECT_NO_THROW(logging::set_level("debug"));
    EXPECT_NO_THROW(logging::set_level("off"));
    EXPECT_THROW(logging::set_level("chatty"), McpConfigError);
    logging::set_level(spdlog::level::info);
    EXPECT_EQ(logging::logger()->name(), "mcpkit");
}
