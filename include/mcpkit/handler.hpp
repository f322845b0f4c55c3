#pragma once
#include "types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcpkit {

/// Query parameters of a resource uri ("?a=1&b=2").
using QueryParams = std::map<std::string, std::string>;

/// A callable tool. Domain failures are reported either by returning a
/// result with is_error set, or by throwing McpToolError.
class ToolHandler {
public:
    virtual ~ToolHandler() = default;
    virtual CallToolResult call(const nlohmann::json& arguments) = 0;
};

/// A resource, or the root of a family of resources sharing a uri prefix.
class ResourceHandler {
public:
    virtual ~ResourceHandler() = default;

    virtual std::vector<ResourceContent> read(const std::string& uri,
                                              const QueryParams& params) = 0;

    /// Concrete resources behind this registration. Empty means the
    /// registration's own metadata is listed.
    virtual std::vector<ResourceInfo> list() { return {}; }

    virtual void subscribe(const std::string& uri) { (void)uri; }
    virtual void unsubscribe(const std::string& uri) { (void)uri; }
};

class PromptHandler {
public:
    virtual ~PromptHandler() = default;

    virtual GetPromptResult get(const nlohmann::json& arguments) = 0;

    /// Same contract as ResourceHandler::list().
    virtual std::vector<PromptInfo> list() { return {}; }
};

/// Plain-callable forms accepted by the make_* adapters.
using ToolFn = std::function<CallToolResult(const nlohmann::json& arguments)>;
using ResourceReadFn = std::function<std::vector<ResourceContent>(const std::string& uri,
                                                                  const QueryParams& params)>;
using PromptGetFn = std::function<GetPromptResult(const nlohmann::json& arguments)>;

std::shared_ptr<ToolHandler> make_tool(ToolFn fn);
std::shared_ptr<ResourceHandler> make_resource(ResourceReadFn fn);
std::shared_ptr<PromptHandler> make_prompt(PromptGetFn fn);

/// Collaborator hooks for the sampling and progress paths.
using SamplingHandler = std::function<CreateMessageResult(const CreateMessageParams& params)>;
using ProgressHandler = std::function<void(const std::string& connection_id,
                                           const ProgressParams& params)>;

/// Split "scheme://path?a=1&b=2" into its query map. Keys and values are
/// percent-decoded; a key without '=' maps to an empty string.
QueryParams parse_query(const std::string& uri);

/// A CallToolResult with a single text item.
CallToolResult text_result(std::string text, bool is_error = false);

} // namespace mcpkit
