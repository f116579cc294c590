#pragma once

#include "mcpsrv/log/logger.hpp"
#include "mcpsrv/protocol/json_rpc.hpp"
#include "mcpsrv/protocol/mcp_types.hpp"
#include "mcpsrv/server/handlers.hpp"
#include "mcpsrv/server/load_error.hpp"
#include "mcpsrv/server/registry.hpp"
#include "mcpsrv/server/response_cache.hpp"
#include "mcpsrv/server/server_config.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcpsrv {

// ═══════════════════════════════════════════════════════════════════════════
// McpServer - routes one JSON-RPC request to one response
// ═══════════════════════════════════════════════════════════════════════════
//
// Transport-agnostic. A transport decodes a request, calls handle() with any
// request-scoped context, and encodes the response. When the response
// is_notification(), the transport acknowledges without a body.
//
//   auto server = McpServer::create(ServerConfig{}.with_tools_file("tools.json"));
//   (*server)->register_tool("echo", [](RequestContext, const Json& args) {
//       return HandlerResult<ToolResult>(ToolResult::text(args.dump()));
//   });
//   auto response = (*server)->handle(request, RequestContext{});
//
// Thread safety: handle() may run concurrently from any number of threads.
// Handlers may be registered at any time, also while requests are served;
// the last registration for a name wins.

class McpServer {
public:
    McpServer(Registry registry,
              Implementation server_info,
              std::shared_ptr<ILogger> logger,
              std::size_t max_json_depth = 64);

    /// Validate the config, load its definitions and build a server.
    [[nodiscard]] static LoadResult<std::unique_ptr<McpServer>> create(const ServerConfig& config);

    ~McpServer() = default;

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;
    McpServer(McpServer&&) = delete;
    McpServer& operator=(McpServer&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Dispatch
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] JsonRpcResponse handle(const JsonRpcRequest& request, RequestContext context);

    /// Decode and handle. Undecodable bytes yield a ParseError response and
    /// malformed envelopes an InvalidRequest response.
    [[nodiscard]] JsonRpcResponse handle_raw(std::string_view bytes, RequestContext context);

    // ─────────────────────────────────────────────────────────────────────────
    // Handler Registration
    // ─────────────────────────────────────────────────────────────────────────

    void register_tool(const std::string& name, ToolHandler handler);
    void register_resource(const std::string& name, ResourceHandler handler);

    /// Bind every declared tool to a handler answering "stub: <name> accepted".
    void register_stub_tools();

    [[nodiscard]] bool has_tool_handler(std::string_view name) const;
    [[nodiscard]] bool has_resource_handler(std::string_view name) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Accessors
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const Registry& registry() const noexcept { return registry_; }
    [[nodiscard]] const ResponseCache& cache() const noexcept { return cache_; }
    [[nodiscard]] const Implementation& server_info() const noexcept { return server_info_; }

    /// Nesting limit applied when decoding request bodies.
    [[nodiscard]] std::size_t max_json_depth() const noexcept { return max_json_depth_; }

private:
    struct NameHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view name) const noexcept {
            return std::hash<std::string_view>{}(name);
        }
    };

    template <typename Handler>
    using HandlerMap = std::unordered_map<std::string, std::shared_ptr<const Handler>, NameHash, std::equal_to<>>;

    JsonRpcResponse handle_initialize(const JsonRpcRequest& request);
    JsonRpcResponse handle_tool_call(const JsonRpcRequest& request, RequestContext context);
    JsonRpcResponse handle_resource_read(const JsonRpcRequest& request, RequestContext context);

    [[nodiscard]] std::shared_ptr<const ToolHandler> find_tool_handler(std::string_view name) const;
    [[nodiscard]] std::shared_ptr<const ResourceHandler> find_resource_handler(std::string_view name) const;

    const Registry registry_;
    const Implementation server_info_;
    const ResponseCache cache_;
    std::shared_ptr<ILogger> logger_;
    const std::size_t max_json_depth_;

    mutable std::shared_mutex handlers_mutex_;
    HandlerMap<ToolHandler> tool_handlers_;
    HandlerMap<ResourceHandler> resource_handlers_;
};

}  // namespace mcpsrv
