#pragma once

/// Umbrella header for the mcpkit MCP server engine.

#include "version.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "validation.hpp"
#include "handler.hpp"
#include "registry.hpp"
#include "lifecycle.hpp"
#include "connection.hpp"
#include "subscription_manager.hpp"
#include "server_context.hpp"
#include "dispatcher.hpp"
#include "server.hpp"
#include "config.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/http_transport.hpp"
#include "transport/websocket_transport.hpp"
