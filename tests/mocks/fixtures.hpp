#pragma once

#include "mcpsrv/server/mcp_server.hpp"
#include "mcpsrv/server/server_config.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace mcpsrv::testing {

// Two tools and one resource, shaped like a deployment's config files.
inline constexpr const char* kToolsJson = R"([
  {
    "name": "otp-verify",
    "description": "Verify a one-time password",
    "inputSchema": {
      "type": "object",
      "properties": {
        "token": {"type": "string"},
        "email": {"type": "string"},
        "phone": {"type": "string"},
        "code": {"type": "string"}
      },
      "required": ["token"],
      "oneOf": [{"required": ["email"]}, {"required": ["phone"]}],
      "dependencies": {"code": ["token"]}
    }
  },
  {
    "name": "channels-list",
    "description": "List channels",
    "inputSchema": {"type": "object", "properties": {}}
  }
])";

inline constexpr const char* kResourcesJson = R"([
  {
    "name": "openapi",
    "description": "API description",
    "uri": "docs://openapi.json",
    "mimeType": "application/json"
  }
])";

inline ServerConfig sample_config() {
    return ServerConfig{}
        .with_server_info("marketplace-mcp", "2.1.0")
        .with_tools_json(kToolsJson)
        .with_resources_json(kResourcesJson);
}

/// Build a server from sample_config(); throws if the fixture is broken.
inline std::unique_ptr<McpServer> make_sample_server(std::shared_ptr<ILogger> logger = nullptr) {
    auto config = sample_config();
    config.with_logger(std::move(logger));
    auto server = McpServer::create(config);
    if (!server) {
        throw std::runtime_error(server.error().what());
    }
    return std::move(*server);
}

inline JsonRpcRequest request(std::string method, Json params = nullptr, Json id = 1) {
    std::optional<Json> maybe_params;
    if (params.is_null() == false) {
        maybe_params.emplace(std::move(params));
    }
    return JsonRpcRequest(std::move(method), std::optional<Json>(std::move(id)), std::move(maybe_params));
}

}  // namespace mcpsrv::testing
