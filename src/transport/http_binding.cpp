#include "mcpsrv/transport/http_binding.hpp"

#include "mcpsrv/protocol/json_rpc.hpp"
#include "mcpsrv/protocol/method.hpp"
#include "mcpsrv/server/mcp_server.hpp"
#include "mcpsrv/transport/session_store.hpp"

#include <algorithm>
#include <cctype>

namespace mcpsrv {

namespace {

constexpr int kStatusOk = 200;
constexpr int kStatusAccepted = 202;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternalError = 500;

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    return lhs.size() == rhs.size()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a))
                   == std::tolower(static_cast<unsigned char>(b));
           });
}

HttpResponse json_response(int status, std::string body) {
    HttpResponse response;
    response.status = status;
    response.headers.emplace("Content-Type", "application/json");
    response.body = std::move(body);
    return response;
}

HttpResponse error_response(int status, std::string_view message) {
    return json_response(status, Json{{"error", std::string(message)}}.dump());
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

HttpBindingConfig& HttpBindingConfig::with_endpoint_path(std::string path) {
    endpoint_path = std::move(path);
    return *this;
}

HttpBindingConfig& HttpBindingConfig::with_health_path(std::string path) {
    health_path = std::move(path);
    return *this;
}

HttpBindingConfig& HttpBindingConfig::with_session_header(std::string name) {
    session_header = std::move(name);
    return *this;
}

HttpBindingConfig& HttpBindingConfig::with_reject_unknown_sessions(bool reject) {
    reject_unknown_sessions = reject;
    return *this;
}

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HttpBinding
// ─────────────────────────────────────────────────────────────────────────────

HttpBinding::HttpBinding(McpServer& server,
                         SessionStore& sessions,
                         HttpBindingConfig config,
                         std::shared_ptr<ILogger> logger)
    : server_(server)
    , sessions_(sessions)
    , config_(std::move(config))
    , logger_(logger ? std::move(logger) : make_null_logger())
{}

HttpResponse HttpBinding::handle(const HttpRequest& request, RequestContext context) {
    if (request.path == config_.health_path) {
        if (request.method != "GET") {
            return error_response(kStatusMethodNotAllowed, "method not allowed");
        }
        return json_response(kStatusOk, R"({"status":"ok"})");
    }

    if (request.path == config_.endpoint_path) {
        if (request.method != "POST") {
            return error_response(kStatusMethodNotAllowed, "method not allowed");
        }
        return handle_rpc(request, std::move(context));
    }

    return error_response(kStatusNotFound, "not found");
}

HttpResponse HttpBinding::handle_rpc(const HttpRequest& request, RequestContext context) {
    auto rpc = parse_request(request.body, server_.max_json_depth());
    if (!rpc) {
        logger_->debug_fmt("bad request body: {}", rpc.error().message);
        const auto failure = JsonRpcResponse::failure(std::nullopt, std::move(rpc.error()));
        return json_response(kStatusBadRequest, failure.serialize());
    }

    const bool is_handshake = method_from_string(rpc->method()) == Method::Initialize;
    const std::string session{request.header(config_.session_header).value_or("")};

    if (is_handshake == false && session.empty() == false && config_.reject_unknown_sessions) {
        if (sessions_.contains(session) == false) {
            logger_->debug_fmt("unknown session {}", session);
            return error_response(kStatusNotFound, "session not found");
        }
    }

    const auto response = server_.handle(*rpc, std::move(context));
    if (response.is_notification()) {
        HttpResponse accepted;
        accepted.status = kStatusAccepted;
        return accepted;
    }

    std::string body = response.serialize();
    if (body == MARSHAL_FAILURE_PAYLOAD) {
        logger_->error("failed to encode response");
        return error_response(kStatusInternalError, "marshal failure");
    }

    HttpResponse reply = json_response(kStatusOk, std::move(body));
    if (is_handshake && response.is_error() == false) {
        const std::string token = sessions_.create();
        logger_->info_fmt("session {} created", token);
        reply.headers.insert_or_assign(config_.session_header, token);
    } else if (session.empty() == false) {
        reply.headers.insert_or_assign(config_.session_header, session);
    }
    return reply;
}

}  // namespace mcpsrv
