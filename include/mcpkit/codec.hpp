#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcpkit {

class Codec {
public:
    /// Parse one raw frame into a message.
    /// Throws McpParseError on invalid JSON, McpProtocolError(InvalidRequest)
    /// when the JSON is not a JSON-RPC 2.0 message.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to single-line JSON.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Error response for a frame that could not be decoded. The id is null.
    [[nodiscard]] static JsonRpcResponse decode_error_response(const McpError& e);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace mcpkit
