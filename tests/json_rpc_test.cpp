#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpsrv/protocol/json_rpc.hpp"
#include "mcpsrv/protocol/method.hpp"

using namespace mcpsrv;
using Catch::Matchers::ContainsSubstring;

// ═══════════════════════════════════════════════════════════════════════════
// Inbound envelopes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("JsonRpcRequest decodes ids, method and params", "[json-rpc][request]") {
    Json payload = {
        {"jsonrpc", "2.0"},
        {"id", "req-001"},
        {"method", "tools/call"},
        {"params", {{"name", "channels-list"}}}
    };

    auto parsed = JsonRpcRequest::from_json(payload);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->has_valid_version());
    REQUIRE(parsed->id().has_value());
    REQUIRE(*parsed->id() == "req-001");
    REQUIRE(parsed->method() == "tools/call");
    REQUIRE(parsed->params()->at("name") == "channels-list");
    REQUIRE(parsed->to_json() == payload);
}

TEST_CASE("JsonRpcRequest keeps a wrong version marker for the dispatcher", "[json-rpc][request]") {
    auto parsed = JsonRpcRequest::from_json({{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}});
    REQUIRE(parsed.has_value());
    REQUIRE_FALSE(parsed->has_valid_version());
}

TEST_CASE("JsonRpcRequest treats missing or null id as absent", "[json-rpc][request]") {
    auto missing = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    auto null_id = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", nullptr}, {"method", "ping"}});

    REQUIRE(missing.has_value());
    REQUIRE_FALSE(missing->id().has_value());
    REQUIRE_FALSE(missing->params().has_value());
    REQUIRE(null_id.has_value());
    REQUIRE_FALSE(null_id->id().has_value());
}

TEST_CASE("JsonRpcRequest rejects malformed envelopes", "[json-rpc][request]") {
    SECTION("not an object") {
        auto parsed = JsonRpcRequest::from_json(Json::array({1, 2}));
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == ErrorCode::InvalidRequest);
    }
    SECTION("method missing") {
        auto parsed = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", 1}});
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == ErrorCode::InvalidRequest);
    }
    SECTION("structured id") {
        auto parsed = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", {{"a", 1}}}, {"method", "ping"}});
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE_THAT(parsed.error().message, ContainsSubstring("id"));
    }
}

TEST_CASE("parse_request maps undecodable bytes to ParseError", "[json-rpc][request]") {
    auto parsed = parse_request("{not json");
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().code == ErrorCode::ParseError);
    REQUIRE_THAT(parsed.error().message, ContainsSubstring("invalid JSON"));

    auto ok = parse_request(R"({"jsonrpc":"2.0","id":3,"method":"ping"})");
    REQUIRE(ok.has_value());
    REQUIRE(*ok->id() == 3);
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound envelopes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("JsonRpcResponse notification sentinel has no body", "[json-rpc][response]") {
    const auto sentinel = JsonRpcResponse::notification();

    REQUIRE(sentinel.is_notification());
    REQUIRE_FALSE(sentinel.is_error());
    REQUIRE(sentinel.serialize().empty());
}

TEST_CASE("An empty result is not a notification", "[json-rpc][response]") {
    const auto empty = JsonRpcResponse::success(std::nullopt, Json::object());

    REQUIRE_FALSE(empty.is_notification());
    REQUIRE(Json::parse(empty.serialize()) == Json{{"jsonrpc", "2.0"}, {"id", nullptr}, {"result", Json::object()}});
}

TEST_CASE("JsonRpcResponse encodes errors with the request id", "[json-rpc][response]") {
    auto error = McpError::invalid_params("missing required field `token`");
    error.data.emplace(Json{{"field", "token"}});
    const auto response = JsonRpcResponse::failure(std::optional<Json>(Json("abc")), error);

    REQUIRE(response.is_error());
    REQUIRE(response.error()->code == ErrorCode::InvalidParams);

    const auto wire = Json::parse(response.serialize());
    REQUIRE(wire["id"] == "abc");
    REQUIRE(wire["error"]["code"] == -32602);
    REQUIRE(wire["error"]["data"]["field"] == "token");
    REQUIRE_FALSE(wire.contains("result"));
}

TEST_CASE("Cached payloads are spliced into the encoding verbatim", "[json-rpc][response]") {
    // Key order and spacing that a re-encode would normalise away
    const auto payload = std::make_shared<const std::string>(R"({"z":1, "a":[true]})");
    const auto response = JsonRpcResponse::cached(std::optional<Json>(Json(9)), payload);

    REQUIRE(response.cached_payload() == payload);
    REQUIRE(response.serialize() == R"({"jsonrpc":"2.0","id":9,"result":{"z":1, "a":[true]}})");
    REQUIRE(response.result()["a"][0] == true);
}

TEST_CASE("Encoding failures degrade to a fixed error payload", "[json-rpc][response]") {
    SECTION("invalid UTF-8 in a result") {
        const auto response = JsonRpcResponse::success(std::optional<Json>(Json(1)), Json{{"text", std::string("\xff\xfe")}});
        REQUIRE(response.serialize() == MARSHAL_FAILURE_PAYLOAD);
    }
    SECTION("missing cached buffer") {
        const auto response = JsonRpcResponse::cached(std::optional<Json>(Json(1)), nullptr);
        REQUIRE(response.serialize() == MARSHAL_FAILURE_PAYLOAD);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Method routing table
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("method_from_string covers every routed method", "[json-rpc][method]") {
    REQUIRE(method_from_string("initialize") == Method::Initialize);
    REQUIRE(method_from_string("ping") == Method::Ping);
    REQUIRE(method_from_string("notifications/initialized") == Method::NotificationInitialized);
    REQUIRE(method_from_string("notifications/cancelled") == Method::NotificationCancelled);
    REQUIRE(method_from_string("tools/list") == Method::ToolsList);
    REQUIRE(method_from_string("tools/call") == Method::ToolsCall);
    REQUIRE(method_from_string("resources/list") == Method::ResourcesList);
    REQUIRE(method_from_string("resources/read") == Method::ResourcesRead);
    REQUIRE(method_from_string("prompts/list") == Method::Unknown);
    REQUIRE(method_from_string("") == Method::Unknown);

    STATIC_REQUIRE(is_notification(Method::NotificationCancelled));
    STATIC_REQUIRE_FALSE(is_notification(Method::Ping));
}
