#pragma once

#include "mcpsrv/protocol/mcp_types.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <functional>
#include <string>

namespace mcpsrv {

using Json = nlohmann::json;

/// Request-scoped data supplied by the transport (decoded identity claims,
/// deadlines, ...). The server never reads it; it is moved into the one
/// callback that handles the request, or dropped.
using RequestContext = Json;

struct HandlerError {
    std::string message;
};

template <typename T>
using HandlerResult = tl::expected<T, HandlerError>;

// ─────────────────────────────────────────────────────────────────────────────
// Callbacks
// ─────────────────────────────────────────────────────────────────────────────
// Handlers run concurrently for concurrent requests and must be reentrant.
// Any waiting on external work happens inside the handler before it returns.

/// tools/call. A HandlerError (or thrown std::exception) becomes a result
/// flagged with isError, not a JSON-RPC error.
using ToolHandler = std::function<HandlerResult<ToolResult>(RequestContext context, const Json& arguments)>;

/// resources/read, invoked with the resolved resource URI. A HandlerError
/// becomes an InternalError response.
using ResourceHandler = std::function<HandlerResult<ResourceContent>(RequestContext context, const std::string& uri)>;

}  // namespace mcpsrv
