#include "mcpkit/codec.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcpkit {

namespace {

nlohmann::json to_nlohmann(simdjson::dom::element el) {
    using simdjson::dom::element_type;
    switch (el.type()) {
        case element_type::OBJECT: {
            nlohmann::json out = nlohmann::json::object();
            for (auto member : el.get_object().value()) {
                out[std::string(member.key)] = to_nlohmann(member.value);
            }
            return out;
        }
        case element_type::ARRAY: {
            nlohmann::json out = nlohmann::json::array();
            for (simdjson::dom::element item : el.get_array().value()) {
                out.push_back(to_nlohmann(item));
            }
            return out;
        }
        case element_type::STRING:
            return std::string(el.get_string().value());
        case element_type::INT64:
            return el.get_int64().value();
        case element_type::UINT64:
            return el.get_uint64().value();
        case element_type::DOUBLE:
            return el.get_double().value();
        case element_type::BOOL:
            return el.get_bool().value();
        case element_type::NULL_VALUE:
            break;
    }
    return nullptr;
}

/// One parser per thread; it keeps its buffers between frames.
simdjson::dom::parser& local_parser() {
    thread_local simdjson::dom::parser parser;
    return parser;
}

nlohmann::json parse_document(std::string_view raw) {
    simdjson::dom::element root;
    auto err = local_parser().parse(raw.data(), raw.size()).get(root);
    if (err) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }
    if (root.type() != simdjson::dom::element_type::OBJECT &&
        root.type() != simdjson::dom::element_type::ARRAY) {
        throw McpProtocolError(error::InvalidRequest, "Message must be a JSON object");
    }
    return to_nlohmann(root);
}

[[noreturn]] void invalid(const std::string& what) {
    throw McpProtocolError(error::InvalidRequest, what);
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        invalid("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        invalid("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");
    bool has_result = j.contains("result");
    bool has_error = j.contains("error");

    if (has_method) {
        if (!j.at("method").is_string()) {
            invalid("'method' must be a string");
        }
        if (has_result || has_error) {
            invalid("Request/notification cannot carry 'result' or 'error'");
        }
        if (j.contains("params")) {
            const auto& p = j.at("params");
            if (!p.is_object() && !p.is_array() && !p.is_null()) {
                invalid("'params' must be an object or array");
            }
        }
    }

    if (has_method && has_id) {
        const auto& id = j.at("id");
        if (!id.is_number_integer() && !id.is_string()) {
            invalid("Request ID must be an integer or a string");
        }
        JsonRpcRequest req;
        from_json(id, req.id);
        req.method = j.at("method").get<std::string>();
        if (j.contains("params") && !j.at("params").is_null()) req.params = j.at("params");
        return req;
    } else if (has_method) {
        JsonRpcNotification notif;
        notif.method = j.at("method").get<std::string>();
        if (j.contains("params") && !j.at("params").is_null()) notif.params = j.at("params");
        return notif;
    } else if (has_id) {
        if (has_result == has_error) {
            invalid("Response must carry exactly one of 'result' or 'error'");
        }
        JsonRpcResponse resp;
        try {
            from_json(j.at("id"), resp.id);
            if (has_result) resp.result = j.at("result");
            if (has_error) resp.error = j.at("error").get<JsonRpcError>();
        } catch (const std::exception& e) {
            invalid(std::string("Malformed response: ") + e.what());
        }
        return resp;
    }
    invalid("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    nlohmann::json j = parse_document(raw);

    if (j.is_array()) {
        invalid("Batch requests are not supported");
    }
    if (!j.is_object()) {
        invalid("Message must be a JSON object");
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Replace invalid UTF-8 rather than throwing from inside a writer thread.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

JsonRpcResponse Codec::decode_error_response(const McpError& e) {
    int code = error::ParseError;
    if (const auto* pe = dynamic_cast<const McpProtocolError*>(&e)) {
        code = pe->code;
    }
    return make_error(RequestId{nullptr}, code, e.what());
}

} // namespace mcpkit
