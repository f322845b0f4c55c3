#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpkit {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised for frames that are not valid JSON.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// Carries a JSON-RPC error code; passed through to the peer unchanged.
class McpProtocolError : public McpError {
public:
    int code;
    std::optional<nlohmann::json> data;

    McpProtocolError(int code, const std::string& msg,
                     std::optional<nlohmann::json> data = std::nullopt)
        : McpError(msg), code(code), data(std::move(data)) {}
};

/// Structural validation failure. Request params that fail validation are
/// answered with InvalidParams; thrown from a handler it is an internal
/// error like any other.
class McpValidationError : public McpError {
public:
    using McpError::McpError;
};

/// Thrown by a tool to report a domain failure ("the tool ran and failed").
/// Reported in-band as an isError result, never as a JSON-RPC error.
class McpToolError : public McpError {
public:
    using McpError::McpError;
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class McpConfigError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int ToolNotFound     = -32000;
    constexpr int ResourceNotFound = -32001;
    constexpr int PromptNotFound   = -32002;
} // namespace error

} // namespace mcpkit
