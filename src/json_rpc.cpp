#include "mcpkit/json_rpc.hpp"
#include "mcpkit/version.hpp"
#include <stdexcept>

namespace mcpkit {

namespace {

nlohmann::json envelope() {
    return nlohmann::json{{"jsonrpc", std::string(JSONRPC_VERSION)}};
}

nlohmann::json id_value(const RequestId& id) {
    nlohmann::json out;
    to_json(out, id);
    return out;
}

std::optional<nlohmann::json> member(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    return *it;
}

} // anonymous namespace

std::string request_id_key(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) return "i:" + std::to_string(*i);
    if (const auto* s = std::get_if<std::string>(&id)) return "s:" + *s;
    return "null";
}

JsonRpcResponse make_result(const RequestId& id, nlohmann::json result) {
    return JsonRpcResponse{id, std::move(result), std::nullopt};
}

JsonRpcResponse make_error(const RequestId& id, int code, std::string message,
                           std::optional<nlohmann::json> data) {
    return JsonRpcResponse{id, std::nullopt, JsonRpcError{code, std::move(message), std::move(data)}};
}

void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

void from_json(const nlohmann::json& j, RequestId& id) {
    switch (j.type()) {
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            id = j.get<int64_t>();
            break;
        case nlohmann::json::value_t::string:
            id = j.get<std::string>();
            break;
        case nlohmann::json::value_t::null:
            id = nullptr;
            break;
        default:
            throw std::invalid_argument("RequestId must be integer or string");
    }
}

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = {{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    e.data = member(j, "data");
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = envelope();
    j["id"] = id_value(r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    j.at("method").get_to(r.method);
    r.params = member(j, "params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = envelope();
    j["id"] = id_value(r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result.value_or(nlohmann::json::object());
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    from_json(j.at("id"), r.id);
    r.result = member(j, "result");
    if (auto err = member(j, "error")) r.error = err->get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = envelope();
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    j.at("method").get_to(n.method);
    n.params = member(j, "params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace mcpkit
