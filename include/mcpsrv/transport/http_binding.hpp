#ifndef MCPSRV_TRANSPORT_HTTP_BINDING_HPP
#define MCPSRV_TRANSPORT_HTTP_BINDING_HPP

#include "mcpsrv/log/logger.hpp"
#include "mcpsrv/server/handlers.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcpsrv {

class McpServer;
class SessionStore;

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Binding Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct HttpBindingConfig {
    // POST target for JSON-RPC envelopes.
    std::string endpoint_path{"/mcp"};

    // GET target answering {"status":"ok"}.
    std::string health_path{"/healthz"};

    // Header carrying the session token in both directions.
    std::string session_header{"Mcp-Session-Id"};

    // Reject requests naming a token this server never issued (404).
    // Requests without the header are always accepted.
    bool reject_unknown_sessions{true};

    HttpBindingConfig& with_endpoint_path(std::string path);
    HttpBindingConfig& with_health_path(std::string path);
    HttpBindingConfig& with_session_header(std::string name);
    HttpBindingConfig& with_reject_unknown_sessions(bool reject);
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP messages as seen by the binding
// ─────────────────────────────────────────────────────────────────────────────

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpRequest {
    std::string method;
    std::string path;
    HeaderMap headers;
    std::string body;

    /// Case-insensitive header lookup.
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

struct HttpResponse {
    int status{200};
    HeaderMap headers;
    std::string body;
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpBinding - Streamable HTTP semantics without a listener
// ─────────────────────────────────────────────────────────────────────────────
// Any HTTP server can hand a decoded request to handle() and write back the
// returned status, headers and body. Session tokens are issued on a
// successful initialize and checked on every later request that carries one.

class HttpBinding {
public:
    HttpBinding(McpServer& server,
                SessionStore& sessions,
                HttpBindingConfig config = {},
                std::shared_ptr<ILogger> logger = nullptr);

    [[nodiscard]] HttpResponse handle(const HttpRequest& request, RequestContext context);

    [[nodiscard]] const HttpBindingConfig& config() const noexcept { return config_; }

private:
    HttpResponse handle_rpc(const HttpRequest& request, RequestContext context);

    McpServer& server_;
    SessionStore& sessions_;
    HttpBindingConfig config_;
    std::shared_ptr<ILogger> logger_;
};

}  // namespace mcpsrv

#endif  // MCPSRV_TRANSPORT_HTTP_BINDING_HPP
