#include "mcpkit/transport/transport.hpp"

namespace mcpkit {

const char* to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::LineStream: return "line-stream";
        case TransportKind::Http:       return "http";
        case TransportKind::WebSocket:  return "websocket";
    }
    return "unknown";
}

} // namespace mcpkit
