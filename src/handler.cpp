#include "mcpkit/handler.hpp"
#include "mcpkit/error.hpp"
#include <cctype>

namespace mcpkit {

namespace {

class FunctionTool : public ToolHandler {
public:
    explicit FunctionTool(ToolFn fn) : fn_(std::move(fn)) {}
    CallToolResult call(const nlohmann::json& arguments) override { return fn_(arguments); }

private:
    ToolFn fn_;
};

class FunctionResource : public ResourceHandler {
public:
    explicit FunctionResource(ResourceReadFn fn) : fn_(std::move(fn)) {}
    std::vector<ResourceContent> read(const std::string& uri, const QueryParams& params) override {
        return fn_(uri, params);
    }

private:
    ResourceReadFn fn_;
};

class FunctionPrompt : public PromptHandler {
public:
    explicit FunctionPrompt(PromptGetFn fn) : fn_(std::move(fn)) {}
    GetPromptResult get(const nlohmann::json& arguments) override { return fn_(arguments); }

private:
    PromptGetFn fn_;
};

template <typename Fn>
void require_callable(const Fn& fn) {
    if (!fn) throw McpValidationError("Handler function must not be empty");
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out += s[i];
                continue;
            }
            out += static_cast<char>(hi * 16 + lo);
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

} // anonymous namespace

std::shared_ptr<ToolHandler> make_tool(ToolFn fn) {
    require_callable(fn);
    return std::make_shared<FunctionTool>(std::move(fn));
}

std::shared_ptr<ResourceHandler> make_resource(ResourceReadFn fn) {
    require_callable(fn);
    return std::make_shared<FunctionResource>(std::move(fn));
}

std::shared_ptr<PromptHandler> make_prompt(PromptGetFn fn) {
    require_callable(fn);
    return std::make_shared<FunctionPrompt>(std::move(fn));
}

QueryParams parse_query(const std::string& uri) {
    QueryParams params;
    auto q = uri.find('?');
    if (q == std::string::npos) return params;

    auto end = uri.find('#', q);
    std::string query = uri.substr(q + 1, end == std::string::npos ? std::string::npos : end - q - 1);

    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                params[percent_decode(pair)] = "";
            } else {
                params[percent_decode(pair.substr(0, eq))] = percent_decode(pair.substr(eq + 1));
            }
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return params;
}

CallToolResult text_result(std::string text, bool is_error) {
    CallToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    result.is_error = is_error;
    return result;
}

} // namespace mcpkit
