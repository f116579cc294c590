#ifndef MCPSRV_PROTOCOL_MCP_TYPES_HPP
#define MCPSRV_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcpsrv {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2025-03-26";

// ═══════════════════════════════════════════════════════════════════════════
// Error Codes (JSON-RPC 2.0)
// ═══════════════════════════════════════════════════════════════════════════

namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}  // namespace ErrorCode

// ═══════════════════════════════════════════════════════════════════════════
// McpError - JSON-RPC error record
// ═══════════════════════════════════════════════════════════════════════════

struct McpError {
    int code{ErrorCode::InternalError};
    std::string message;
    std::optional<Json> data;

    [[nodiscard]] Json to_json() const {
        Json j = {{"code", code}, {"message", message}};
        if (data.has_value()) {
            j["data"] = *data;
        }
        return j;
    }

    static McpError parse_error(std::string msg) {
        return {ErrorCode::ParseError, std::move(msg), std::nullopt};
    }

    static McpError invalid_request(std::string msg) {
        return {ErrorCode::InvalidRequest, std::move(msg), std::nullopt};
    }

    static McpError method_not_found(std::string msg) {
        return {ErrorCode::MethodNotFound, std::move(msg), std::nullopt};
    }

    static McpError invalid_params(std::string msg) {
        return {ErrorCode::InvalidParams, std::move(msg), std::nullopt};
    }

    static McpError internal_error(std::string msg) {
        return {ErrorCode::InternalError, std::move(msg), std::nullopt};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tool Results
// ═══════════════════════════════════════════════════════════════════════════

struct ContentBlock {
    std::string type{"text"};
    std::string text;

    [[nodiscard]] Json to_json() const {
        Json j = {{"type", type}};
        if (!text.empty()) {
            j["text"] = text;
        }
        return j;
    }
};

/// Result of a tools/call. A failing tool is still a successful JSON-RPC
/// response; the failure is reported through `is_error` and the content.
struct ToolResult {
    std::vector<ContentBlock> content;
    bool is_error{false};

    [[nodiscard]] Json to_json() const {
        Json blocks = Json::array();
        for (const auto& block : content) {
            blocks.push_back(block.to_json());
        }
        Json j = {{"content", std::move(blocks)}};
        if (is_error) {
            j["isError"] = true;
        }
        return j;
    }

    static ToolResult text(std::string body) {
        return {{ContentBlock{"text", std::move(body)}}, false};
    }

    static ToolResult error(std::string body) {
        return {{ContentBlock{"text", std::move(body)}}, true};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Resource Contents
// ═══════════════════════════════════════════════════════════════════════════

struct ResourceContent {
    std::string uri;
    std::string mime_type;
    std::string text;
    std::string blob;  // base64

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}};
        if (!mime_type.empty()) {
            j["mimeType"] = mime_type;
        }
        if (!text.empty()) {
            j["text"] = text;
        }
        if (!blob.empty()) {
            j["blob"] = blob;
        }
        return j;
    }
};

}  // namespace mcpsrv

#endif  // MCPSRV_PROTOCOL_MCP_TYPES_HPP
