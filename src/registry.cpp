#include "mcpkit/registry.hpp"
#include <cctype>

namespace mcpkit {

size_t decode_cursor(const std::optional<std::string>& cursor, size_t total) {
    if (!cursor) return 0;

    const std::string& c = *cursor;
    bool digits = !c.empty() && c.size() <= 19 &&
        std::all_of(c.begin(), c.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (!digits) {
        throw McpProtocolError(error::InvalidParams, "Invalid cursor: " + c);
    }

    size_t offset = static_cast<size_t>(std::stoull(c));
    if (offset > total) {
        throw McpProtocolError(error::InvalidParams, "Cursor out of range: " + c);
    }
    return offset;
}

} // namespace mcpkit
