#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcpkit {

/// Request id. nullptr is only ever produced by the server, for error
/// responses to frames whose id could not be recovered.
using RequestId = std::variant<int64_t, std::string, std::nullptr_t>;

/// Stable textual key for a request id (used for correlation tables and logs).
std::string request_id_key(const RequestId& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result and error is set on anything the server sends.
struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

JsonRpcResponse make_result(const RequestId& id, nlohmann::json result);
JsonRpcResponse make_error(const RequestId& id, int code, std::string message,
                           std::optional<nlohmann::json> data = std::nullopt);

// RequestId is a variant of std types, so these are not found by ADL and
// must be called directly. from_json throws std::invalid_argument for
// anything but an integer, a string or null.
void to_json(nlohmann::json& j, const RequestId& id);
void from_json(const nlohmann::json& j, RequestId& id);

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void from_json(const nlohmann::json& j, JsonRpcNotification& n);

void to_json(nlohmann::json& j, const JsonRpcMessage& m);

} // namespace mcpkit
