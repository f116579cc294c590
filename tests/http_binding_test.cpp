// ═══════════════════════════════════════════════════════════════════════════
// HTTP Binding Tests
// ═══════════════════════════════════════════════════════════════════════════

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpsrv/server/mcp_server.hpp"
#include "mcpsrv/server/server_config.hpp"
#include "mcpsrv/transport/http_binding.hpp"
#include "mcpsrv/transport/session_store.hpp"
#include "mocks/fixtures.hpp"
#include "mocks/test_logger.hpp"

using namespace mcpsrv;
using namespace mcpsrv::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

HttpRequest post(std::string body, HeaderMap headers = {}) {
    return HttpRequest{"POST", "/mcp", std::move(headers), std::move(body)};
}

constexpr const char* kInitializeBody =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26"}})";

}  // namespace

TEST_CASE("HttpBindingConfig builders", "[http][config]") {
    const auto config = HttpBindingConfig{}
        .with_endpoint_path("/rpc")
        .with_health_path("/live")
        .with_session_header("X-Session")
        .with_reject_unknown_sessions(false);

    REQUIRE(config.endpoint_path == "/rpc");
    REQUIRE(config.health_path == "/live");
    REQUIRE(config.session_header == "X-Session");
    REQUIRE_FALSE(config.reject_unknown_sessions);

    const HttpBindingConfig defaults;
    REQUIRE(defaults.endpoint_path == "/mcp");
    REQUIRE(defaults.health_path == "/healthz");
    REQUIRE(defaults.session_header == "Mcp-Session-Id");
    REQUIRE(defaults.reject_unknown_sessions);
}

TEST_CASE("HttpRequest header lookup ignores case", "[http]") {
    const HttpRequest req{"POST", "/mcp", {{"mcp-session-id", "abc"}}, ""};

    REQUIRE(req.header("Mcp-Session-Id") == std::optional<std::string_view>("abc"));
    REQUIRE_FALSE(req.header("Content-Type").has_value());
}

TEST_CASE("Health and routing", "[http]") {
    auto server = make_sample_server();
    SessionStore sessions;
    HttpBinding binding(*server, sessions);

    SECTION("health check") {
        const auto response = binding.handle(HttpRequest{"GET", "/healthz", {}, ""}, RequestContext{});
        REQUIRE(response.status == 200);
        REQUIRE(Json::parse(response.body) == Json{{"status", "ok"}});
    }
    SECTION("health check rejects other methods") {
        const auto response = binding.handle(HttpRequest{"POST", "/healthz", {}, ""}, RequestContext{});
        REQUIRE(response.status == 405);
    }
    SECTION("endpoint requires POST") {
        const auto response = binding.handle(HttpRequest{"GET", "/mcp", {}, ""}, RequestContext{});
        REQUIRE(response.status == 405);
    }
    SECTION("unknown path") {
        const auto response = binding.handle(HttpRequest{"POST", "/other", {}, "{}"}, RequestContext{});
        REQUIRE(response.status == 404);
        REQUIRE(Json::parse(response.body)["error"] == "not found");
    }
}

TEST_CASE("Initialize issues a session token", "[http][session]") {
    auto logger = std::make_shared<TestLogger>();
    auto server = make_sample_server();
    SessionStore sessions;
    HttpBinding binding(*server, sessions, HttpBindingConfig{}, logger);

    const auto response = binding.handle(post(kInitializeBody), RequestContext{});

    REQUIRE(response.status == 200);
    REQUIRE(response.headers.at("Content-Type") == "application/json");
    const auto& token = response.headers.at("Mcp-Session-Id");
    REQUIRE(is_uuid_format(token));
    REQUIRE(sessions.contains(token));
    REQUIRE(logger->contains(LogLevel::Info, token));

    const Json body = Json::parse(response.body);
    REQUIRE(body["id"] == 1);
    REQUIRE(body["result"]["serverInfo"]["name"] == "marketplace-mcp");
}

TEST_CASE("Requests carrying a session are checked and echoed", "[http][session]") {
    auto server = make_sample_server();
    SessionStore sessions;
    HttpBinding binding(*server, sessions);

    const auto init = binding.handle(post(kInitializeBody), RequestContext{});
    const std::string token = init.headers.at("Mcp-Session-Id");
    const std::string ping = R"({"jsonrpc":"2.0","id":2,"method":"ping"})";

    SECTION("known session") {
        const auto response = binding.handle(post(ping, {{"mcp-session-id", token}}), RequestContext{});
        REQUIRE(response.status == 200);
        REQUIRE(response.headers.at("Mcp-Session-Id") == token);
        REQUIRE(Json::parse(response.body)["result"] == Json::object());
    }
    SECTION("unknown session") {
        const auto response = binding.handle(
            post(ping, {{"Mcp-Session-Id", "123e4567-e89b-42d3-a456-426614174000"}}), RequestContext{});
        REQUIRE(response.status == 404);
        REQUIRE(Json::parse(response.body)["error"] == "session not found");
    }
    SECTION("no session header") {
        const auto response = binding.handle(post(ping), RequestContext{});
        REQUIRE(response.status == 200);
        REQUIRE(response.headers.count("Mcp-Session-Id") == 0);
    }
}

TEST_CASE("Unknown sessions pass when rejection is off", "[http][session]") {
    auto server = make_sample_server();
    SessionStore sessions;
    HttpBinding binding(*server, sessions, HttpBindingConfig{}.with_reject_unknown_sessions(false));

    const auto response = binding.handle(
        post(R"({"jsonrpc":"2.0","id":2,"method":"ping"})", {{"Mcp-Session-Id", "stale"}}), RequestContext{});

    REQUIRE(response.status == 200);
}

TEST_CASE("Notifications are acknowledged without a body", "[http]") {
    auto server = make_sample_server();
    SessionStore sessions;
    HttpBinding binding(*server, sessions);

    const auto response = binding.handle(
        post(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"), RequestContext{});

    REQUIRE(response.status == 202);
    REQUIRE(response.body.empty());
}

TEST_CASE("Bad bodies are rejected with an error envelope", "[http]") {
    auto server = make_sample_server();
    SessionStore sessions;
    HttpBinding binding(*server, sessions);

    SECTION("undecodable") {
        const auto response = binding.handle(post("{not json"), RequestContext{});
        REQUIRE(response.status == 400);
        const Json body = Json::parse(response.body);
        REQUIRE(body["error"]["code"] == ErrorCode::ParseError);
        REQUIRE(body["id"].is_null());
    }
    SECTION("not an envelope") {
        const auto response = binding.handle(post(R"({"jsonrpc":"2.0","id":1})"), RequestContext{});
        REQUIRE(response.status == 400);
        REQUIRE(Json::parse(response.body)["error"]["code"] == ErrorCode::InvalidRequest);
    }
}

TEST_CASE("Request bodies honour the server's nesting limit", "[http]") {
    auto server = McpServer::create(ServerConfig{}.with_max_json_depth(4));
    REQUIRE(server.has_value());
    SessionStore sessions;
    HttpBinding binding(**server, sessions);

    const auto shallow = binding.handle(post(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"), RequestContext{});
    REQUIRE(shallow.status == 200);

    const auto deep = binding.handle(
        post(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{"a":{"b":{"c":{"d":{"e":1}}}}}})"),
        RequestContext{});
    REQUIRE(deep.status == 400);
    REQUIRE(Json::parse(deep.body)["error"]["code"] == ErrorCode::ParseError);
    REQUIRE_THAT(Json::parse(deep.body)["error"]["message"].get<std::string>(), ContainsSubstring("depth"));
}

TEST_CASE("Protocol errors travel in a 200 response", "[http]") {
    auto server = make_sample_server();
    SessionStore sessions;
    HttpBinding binding(*server, sessions);

    const auto response = binding.handle(
        post(R"({"jsonrpc":"2.0","id":"x","method":"tools/call","params":{"name":"nope"}})"), RequestContext{});

    REQUIRE(response.status == 200);
    const Json body = Json::parse(response.body);
    REQUIRE(body["id"] == "x");
    REQUIRE(body["error"]["code"] == ErrorCode::MethodNotFound);
    REQUIRE_THAT(body["error"]["message"].get<std::string>(), ContainsSubstring("nope"));
}

TEST_CASE("Request context reaches the tool handler through HTTP", "[http][context]") {
    auto server = make_sample_server();
    SessionStore sessions;
    HttpBinding binding(*server, sessions);
    server->register_tool("channels-list", [](RequestContext context, const Json&) {
        return HandlerResult<ToolResult>(ToolResult::text(context.value("sub", "anonymous")));
    });

    const auto response = binding.handle(
        post(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"channels-list"}})"),
        RequestContext{{"sub", "user-7"}});

    REQUIRE(Json::parse(response.body)["result"]["content"][0]["text"] == "user-7");
}
