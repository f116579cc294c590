#pragma once

#include "mcpsrv/protocol/mcp_types.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcpsrv {

using Json = nlohmann::json;

inline constexpr std::string_view JSONRPC_VERSION = "2.0";

/// Emitted in place of a response that could not be encoded.
inline constexpr std::string_view MARSHAL_FAILURE_PAYLOAD =
    R"({"jsonrpc":"2.0","id":null,"error":{"code":-32603,"message":"marshal failure"}})";

// ─────────────────────────────────────────────────────────────────────────────
// CachedPayload - immutable pre-encoded JSON shared by every response using it
// ─────────────────────────────────────────────────────────────────────────────

using CachedPayload = std::shared_ptr<const std::string>;

[[nodiscard]] CachedPayload make_cached_payload(const Json& document);

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest - inbound envelope
// ─────────────────────────────────────────────────────────────────────────────
// The version marker is kept as received; the server rejects a wrong marker
// so the error can echo the request id.

class JsonRpcRequest {
public:
    explicit JsonRpcRequest(std::string method,
                            std::optional<Json> id = std::nullopt,
                            std::optional<Json> params = std::nullopt,
                            std::string jsonrpc = std::string(JSONRPC_VERSION));

    [[nodiscard]] const std::string& jsonrpc() const noexcept { return jsonrpc_; }
    [[nodiscard]] const std::optional<Json>& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const std::optional<Json>& params() const noexcept { return params_; }

    [[nodiscard]] bool has_valid_version() const noexcept { return jsonrpc_ == JSONRPC_VERSION; }

    [[nodiscard]] Json to_json() const;

    /// InvalidRequest when the payload is not an object, the method is not a
    /// string, or the id is structured. A null id is treated as absent.
    static tl::expected<JsonRpcRequest, McpError> from_json(const Json& payload);

private:
    std::string jsonrpc_;
    std::optional<Json> id_;
    std::string method_;
    std::optional<Json> params_;
};

/// Decode raw bytes into a request. Undecodable input yields ParseError.
[[nodiscard]] tl::expected<JsonRpcRequest, McpError> parse_request(
    std::string_view bytes,
    std::size_t max_depth = 64
);

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse - outbound envelope
// ─────────────────────────────────────────────────────────────────────────────
// Holds one of: a result document, a cached pre-encoded result, an error, or
// nothing at all (the notification sentinel, which has no id either).

class JsonRpcResponse {
public:
    [[nodiscard]] static JsonRpcResponse success(std::optional<Json> id, Json result);
    [[nodiscard]] static JsonRpcResponse cached(std::optional<Json> id, CachedPayload result);
    [[nodiscard]] static JsonRpcResponse failure(std::optional<Json> id, McpError error);
    [[nodiscard]] static JsonRpcResponse notification();

    /// True when the transport must acknowledge without a body.
    [[nodiscard]] bool is_notification() const noexcept;
    [[nodiscard]] bool is_error() const noexcept;

    [[nodiscard]] const std::optional<Json>& id() const noexcept { return id_; }

    /// Null unless this response is an error.
    [[nodiscard]] const McpError* error() const noexcept;

    /// Null unless this response carries a cached payload.
    [[nodiscard]] CachedPayload cached_payload() const noexcept;

    /// Result as a document; cached payloads are decoded. Null when absent.
    [[nodiscard]] Json result() const;

    /// Wire encoding. Cached payloads are spliced in verbatim. Empty for the
    /// notification sentinel; MARSHAL_FAILURE_PAYLOAD if encoding fails.
    [[nodiscard]] std::string serialize() const;

private:
    using Body = std::variant<std::monostate, Json, CachedPayload, McpError>;

    JsonRpcResponse(std::optional<Json> id, Body body);

    std::optional<Json> id_;
    Body body_;
};

}  // namespace mcpsrv
