/// Calculator server: a calculator tool, a status resource family and a
/// prompt, served over the transport named in the configuration file.
/// Usage: ./calculator_server [--config path/to/config.json]
/// Without a configuration file it serves stdio with default settings.

#include <mcpkit/mcpkit.hpp>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>

namespace {

mcpkit::CallToolResult calculate(const nlohmann::json& args) {
    auto op = args.at("operation").get<std::string>();
    double a = args.at("a").get<double>();
    double b = args.at("b").get<double>();

    double value = 0.0;
    if (op == "add") {
        value = a + b;
    } else if (op == "subtract") {
        value = a - b;
    } else if (op == "multiply") {
        value = a * b;
    } else if (op == "divide") {
        if (b == 0.0) return mcpkit::text_result("Division by zero", true);
        value = a / b;
    } else if (op == "power") {
        value = std::pow(a, b);
    } else {
        return mcpkit::text_result("Unknown operation: " + op, true);
    }

    nlohmann::json out = value;
    return mcpkit::text_result(out.dump());
}

/// Serves http://server/status and everything below it.
class StatusFamily : public mcpkit::ResourceHandler {
public:
    explicit StatusFamily(const std::atomic<uint64_t>& calls)
        : calls_(calls), started_(std::chrono::steady_clock::now()) {}

    std::vector<mcpkit::ResourceContent> read(const std::string& uri,
                                              const mcpkit::QueryParams& params) override {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - started_);
        nlohmann::json body = {
            {"status", "running"},
            {"uptimeSeconds", uptime.count()},
            {"calculations", calls_.load()},
            {"version", mcpkit::LIBRARY_VERSION}
        };
        auto field = params.find("field");
        if (field != params.end()) {
            if (!body.contains(field->second)) {
                throw mcpkit::McpProtocolError(mcpkit::error::InvalidParams,
                                               "Unknown status field: " + field->second);
            }
            body = nlohmann::json{{field->second, body[field->second]}};
        }
        return {mcpkit::ResourceContent{uri, std::string("application/json"), body.dump(), std::nullopt}};
    }

    std::vector<mcpkit::ResourceInfo> list() override {
        mcpkit::ResourceInfo health;
        health.uri = "http://server/status/health";
        health.name = "health";
        health.mime_type = "application/json";
        return {health};
    }

private:
    const std::atomic<uint64_t>& calls_;
    std::chrono::steady_clock::time_point started_;
};

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <file>]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    mcpkit::ServerConfig cfg;
    try {
        if (!config_path.empty()) cfg = mcpkit::load_config(config_path);
        mcpkit::logging::set_level(cfg.log_level);
    } catch (const mcpkit::McpConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    if (cfg.server_info.name == "mcpkit") cfg.server_info = {"calculator-server", "1.0.0"};
    if (!cfg.instructions) cfg.instructions = "Arithmetic over numbers. Read http://server/status for counters.";

    mcpkit::McpServer server{mcpkit::server_options(cfg)};
    std::atomic<uint64_t> calls{0};

    mcpkit::ToolInfo calc;
    calc.name = "calculate";
    calc.description = "Apply an arithmetic operation to two numbers";
    calc.input_schema = {
        {"type", "object"},
        {"properties", {
            {"operation", {{"type", "string"}, {"enum", {"add", "subtract", "multiply", "divide", "power"}}}},
            {"a", {{"type", "number"}}},
            {"b", {{"type", "number"}}}
        }},
        {"required", {"operation", "a", "b"}}
    };
    server.add_tool(calc, [&server, &calls](const nlohmann::json& args) {
        auto result = calculate(args);
        ++calls;
        server.notify_resource_updated("http://server/status");
        return result;
    });

    mcpkit::ResourceInfo status;
    status.uri = "http://server/status";
    status.name = "status";
    status.description = "Server counters; append ?field=<name> for a single value";
    status.mime_type = "application/json";
    server.add_resource(status, std::make_shared<StatusFamily>(calls));

    mcpkit::PromptInfo explain;
    explain.name = "explain_calculation";
    explain.description = "Ask for a step-by-step explanation of an expression";
    explain.arguments = {{"expression", std::string("The expression to explain"), true},
                         {"level", std::string("beginner or expert"), false}};
    server.add_prompt(explain, [](const nlohmann::json& args) {
        auto expression = args.at("expression").get<std::string>();
        auto level = args.value("level", std::string("beginner"));
        mcpkit::GetPromptResult result;
        result.description = "Explain " + expression;
        result.messages.push_back({"user", mcpkit::TextContent{
            "Explain, for a " + level + ", how to evaluate: " + expression}});
        return result;
    });

    try {
        mcpkit::logging::logger()->info("calculator-server starting on {} transport", cfg.transport.kind);
        server.serve(mcpkit::make_transport(cfg.transport));
    } catch (const mcpkit::McpError& e) {
        mcpkit::logging::logger()->critical("Server stopped: {}", e.what());
        return 1;
    }
    return 0;
}
