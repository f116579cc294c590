#include "mcpsrv/protocol/json_rpc.hpp"

#include "mcpsrv/json/fast_json.hpp"

namespace mcpsrv {

namespace {

bool is_valid_id(const Json& node) {
    return node.is_string() || node.is_number() || node.is_boolean();
}

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

CachedPayload make_cached_payload(const Json& document) {
    return std::make_shared<const std::string>(document.dump());
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::optional<Json> id,
                               std::optional<Json> params,
                               std::string jsonrpc)
    : jsonrpc_(std::move(jsonrpc)),
      id_(std::move(id)),
      method_(std::move(method)),
      params_(std::move(params)) {}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = jsonrpc_;
    payload["method"] = method_;
    if (id_.has_value()) {
        payload["id"] = *id_;
    }
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

tl::expected<JsonRpcRequest, McpError> JsonRpcRequest::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(McpError::invalid_request("request must be a JSON object"));
    }

    std::string jsonrpc;
    const auto version_it = payload.find("jsonrpc");
    if (version_it != payload.end() && version_it->is_string()) {
        jsonrpc = version_it->get<std::string>();
    }

    const auto method_it = payload.find("method");
    if (method_it == payload.end() || method_it->is_string() == false) {
        return tl::unexpected(McpError::invalid_request("method must be a string"));
    }

    std::optional<Json> id;
    const auto id_it = payload.find("id");
    if (id_it != payload.end() && id_it->is_null() == false) {
        if (is_valid_id(*id_it) == false) {
            return tl::unexpected(McpError::invalid_request("id must be a string or number"));
        }
        id.emplace(*id_it);
    }

    std::optional<Json> params;
    const auto params_it = payload.find("params");
    if (params_it != payload.end() && params_it->is_null() == false) {
        params.emplace(*params_it);
    }

    return JsonRpcRequest(method_it->get<std::string>(), std::move(id), std::move(params), std::move(jsonrpc));
}

tl::expected<JsonRpcRequest, McpError> parse_request(std::string_view bytes, std::size_t max_depth) {
    auto document = fast_parse(bytes, max_depth);
    if (!document) {
        return tl::unexpected(McpError::parse_error("invalid JSON: " + document.error().message));
    }
    return JsonRpcRequest::from_json(*document);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcResponse::JsonRpcResponse(std::optional<Json> id, Body body)
    : id_(std::move(id)),
      body_(std::move(body)) {}

JsonRpcResponse JsonRpcResponse::success(std::optional<Json> id, Json result) {
    return JsonRpcResponse(std::move(id), Body(std::in_place_type<Json>, std::move(result)));
}

JsonRpcResponse JsonRpcResponse::cached(std::optional<Json> id, CachedPayload result) {
    return JsonRpcResponse(std::move(id), Body(std::in_place_type<CachedPayload>, std::move(result)));
}

JsonRpcResponse JsonRpcResponse::failure(std::optional<Json> id, McpError error) {
    return JsonRpcResponse(std::move(id), Body(std::in_place_type<McpError>, std::move(error)));
}

JsonRpcResponse JsonRpcResponse::notification() {
    return JsonRpcResponse(std::nullopt, Body{});
}

bool JsonRpcResponse::is_notification() const noexcept {
    return id_.has_value() == false && std::holds_alternative<std::monostate>(body_);
}

bool JsonRpcResponse::is_error() const noexcept {
    return std::holds_alternative<McpError>(body_);
}

const McpError* JsonRpcResponse::error() const noexcept {
    return std::get_if<McpError>(&body_);
}

CachedPayload JsonRpcResponse::cached_payload() const noexcept {
    if (const auto* payload = std::get_if<CachedPayload>(&body_)) {
        return *payload;
    }
    return nullptr;
}

Json JsonRpcResponse::result() const {
    if (const auto* doc = std::get_if<Json>(&body_)) {
        return *doc;
    }
    if (const auto* payload = std::get_if<CachedPayload>(&body_)) {
        if (*payload != nullptr) {
            return Json::parse(**payload);
        }
    }
    return nullptr;
}

std::string JsonRpcResponse::serialize() const {
    if (is_notification()) {
        return {};
    }

    try {
        std::string out = R"({"jsonrpc":"2.0","id":)";
        out += id_.has_value() ? id_->dump() : "null";

        const bool encoded = std::visit(overloaded{
            [](const std::monostate&) {
                return false;
            },
            [&out](const Json& doc) {
                out += R"(,"result":)";
                out += doc.dump();
                return true;
            },
            [&out](const CachedPayload& payload) {
                if (payload == nullptr) {
                    return false;
                }
                out += R"(,"result":)";
                out += *payload;
                return true;
            },
            [&out](const McpError& err) {
                out += R"(,"error":)";
                out += err.to_json().dump();
                return true;
            },
        }, body_);

        if (encoded == false) {
            return std::string(MARSHAL_FAILURE_PAYLOAD);
        }
        out += '}';
        return out;
    } catch (const Json::exception&) {
        return std::string(MARSHAL_FAILURE_PAYLOAD);
    }
}

}  // namespace mcpsrv
