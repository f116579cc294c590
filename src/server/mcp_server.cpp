#include "mcpsrv/server/mcp_server.hpp"

#include "mcpsrv/protocol/method.hpp"
#include "mcpsrv/server/validator.hpp"

#include <mutex>

namespace mcpsrv {

namespace {

constexpr std::string_view kConfigSource = "<config>";

struct ToolCallParams {
    std::string name;
    Json arguments;
};

struct ResourceReadParams {
    std::string name;
    std::string uri;
};

// Absent params or name leave the name empty, which resolves as an unknown tool.
tl::expected<ToolCallParams, McpError> parse_tool_call_params(const std::optional<Json>& params) {
    ToolCallParams parsed{"", Json::object()};
    if (params.has_value() == false) {
        return parsed;
    }
    if (params->is_object() == false) {
        return tl::unexpected(McpError::invalid_params("invalid params: params must be an object"));
    }

    const auto name = params->find("name");
    if (name != params->end() && name->is_null() == false) {
        if (name->is_string() == false) {
            return tl::unexpected(McpError::invalid_params("invalid params: name must be a string"));
        }
        parsed.name = name->get<std::string>();
    }

    const auto arguments = params->find("arguments");
    if (arguments != params->end() && arguments->is_null() == false) {
        if (arguments->is_object() == false) {
            return tl::unexpected(McpError::invalid_params("invalid params: arguments must be an object"));
        }
        parsed.arguments = *arguments;
    }
    return parsed;
}

struct InitializeParams {
    Implementation client_info;
    std::string protocol_version;
};

tl::expected<InitializeParams, McpError> parse_initialize_params(const std::optional<Json>& params) {
    InitializeParams parsed;
    if (params.has_value() == false) {
        return parsed;
    }
    if (params->is_object() == false) {
        return tl::unexpected(McpError::invalid_params("invalid params: params must be an object"));
    }

    if (const auto it = params->find("protocolVersion"); it != params->end() && it->is_null() == false) {
        if (it->is_string() == false) {
            return tl::unexpected(McpError::invalid_params("invalid params: protocolVersion must be a string"));
        }
        parsed.protocol_version = it->get<std::string>();
    }

    const auto client = params->find("clientInfo");
    if (client == params->end() || client->is_null()) {
        return parsed;
    }
    if (client->is_object() == false) {
        return tl::unexpected(McpError::invalid_params("invalid params: clientInfo must be an object"));
    }
    for (auto [key, target] : {std::pair{"name", &parsed.client_info.name},
                               std::pair{"version", &parsed.client_info.version}}) {
        const auto it = client->find(key);
        if (it == client->end() || it->is_null()) {
            continue;
        }
        if (it->is_string() == false) {
            return tl::unexpected(McpError::invalid_params(
                std::string("invalid params: clientInfo.") + key + " must be a string"));
        }
        *target = it->get<std::string>();
    }
    return parsed;
}

tl::expected<ResourceReadParams, McpError> parse_resource_read_params(const std::optional<Json>& params) {
    ResourceReadParams parsed;
    if (params.has_value()) {
        if (params->is_object() == false) {
            return tl::unexpected(McpError::invalid_params("invalid params: params must be an object"));
        }
        for (auto [key, target] : {std::pair{"name", &parsed.name}, std::pair{"uri", &parsed.uri}}) {
            const auto it = params->find(key);
            if (it == params->end() || it->is_null()) {
                continue;
            }
            if (it->is_string() == false) {
                return tl::unexpected(McpError::invalid_params(
                    std::string("invalid params: ") + key + " must be a string"));
            }
            *target = it->get<std::string>();
        }
    }

    if (parsed.name.empty() && parsed.uri.empty()) {
        return tl::unexpected(McpError::invalid_params("either name or uri must be provided"));
    }
    return parsed;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

McpServer::McpServer(Registry registry,
                     Implementation server_info,
                     std::shared_ptr<ILogger> logger,
                     std::size_t max_json_depth)
    : registry_(std::move(registry))
    , server_info_(std::move(server_info))
    , cache_(registry_, server_info_)
    , logger_(logger ? std::move(logger) : make_null_logger())
    , max_json_depth_(max_json_depth)
{
    logger_->debug_fmt("server {} {} ready with {} tools and {} resources",
        server_info_.name, server_info_.version,
        registry_.tools().size(), registry_.resources().size());
}

LoadResult<std::unique_ptr<McpServer>> McpServer::create(const ServerConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        return tl::unexpected(LoadError::shape(std::string(kConfigSource), valid.error()));
    }

    auto registry = Registry::from_config(config);
    if (!registry) {
        if (config.logger) {
            config.logger->error_fmt("failed to load definitions: {}", registry.error().what());
        }
        return tl::unexpected(registry.error());
    }

    return std::make_unique<McpServer>(
        std::move(*registry), config.server_info, config.logger, config.max_json_depth);
}

// ─────────────────────────────────────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcResponse McpServer::handle_raw(std::string_view bytes, RequestContext context) {
    auto request = parse_request(bytes, max_json_depth_);
    if (!request) {
        logger_->debug_fmt("rejected envelope: {}", request.error().message);
        return JsonRpcResponse::failure(std::nullopt, std::move(request.error()));
    }
    return handle(*request, std::move(context));
}

JsonRpcResponse McpServer::handle(const JsonRpcRequest& request, RequestContext context) {
    const auto& id = request.id();

    if (request.has_valid_version() == false) {
        return JsonRpcResponse::failure(id, McpError::invalid_request("jsonrpc must be '2.0'"));
    }

    const Method method = method_from_string(request.method());
    logger_->debug_fmt("handling {}", request.method());

    switch (method) {
        case Method::Initialize:
            return handle_initialize(request);

        case Method::Ping:
            return JsonRpcResponse::success(id, Json::object());

        case Method::NotificationInitialized:
        case Method::NotificationCancelled:
            return JsonRpcResponse::notification();

        case Method::ToolsList:
            return JsonRpcResponse::cached(id, cache_.tools_list());

        case Method::ToolsCall:
            return handle_tool_call(request, std::move(context));

        case Method::ResourcesList:
            return JsonRpcResponse::cached(id, cache_.resources_list());

        case Method::ResourcesRead:
            return handle_resource_read(request, std::move(context));

        case Method::Unknown:
            break;
    }

    return JsonRpcResponse::failure(id, McpError::method_not_found("Method not found: " + request.method()));
}

JsonRpcResponse McpServer::handle_initialize(const JsonRpcRequest& request) {
    auto params = parse_initialize_params(request.params());
    if (!params) {
        return JsonRpcResponse::failure(request.id(), std::move(params.error()));
    }
    logger_->info_fmt("initialize from client {} {} (protocol {})",
        params->client_info.name, params->client_info.version, params->protocol_version);
    return JsonRpcResponse::cached(request.id(), cache_.initialize());
}

JsonRpcResponse McpServer::handle_tool_call(const JsonRpcRequest& request, RequestContext context) {
    const auto& id = request.id();

    auto params = parse_tool_call_params(request.params());
    if (!params) {
        return JsonRpcResponse::failure(id, std::move(params.error()));
    }

    const ToolDefinition* tool = registry_.find_tool(params->name);
    if (tool == nullptr) {
        return JsonRpcResponse::failure(id, McpError::method_not_found("Unknown tool: " + params->name));
    }

    auto valid = validate(tool->rules, params->arguments);
    if (!valid) {
        return JsonRpcResponse::failure(id, McpError::invalid_params(std::move(valid.error())));
    }

    const auto handler = find_tool_handler(tool->name);
    if (handler == nullptr) {
        logger_->error_fmt("no handler registered for tool {}", tool->name);
        return JsonRpcResponse::failure(id, McpError::internal_error("no handler for tool: " + tool->name));
    }

    HandlerResult<ToolResult> outcome;
    try {
        outcome = (*handler)(std::move(context), params->arguments);
    } catch (const std::exception& e) {
        outcome = tl::unexpected(HandlerError{e.what()});
    }

    if (!outcome) {
        logger_->warn_fmt("tool {} failed: {}", tool->name, outcome.error().message);
        return JsonRpcResponse::success(id, ToolResult::error(outcome.error().message).to_json());
    }
    return JsonRpcResponse::success(id, outcome->to_json());
}

JsonRpcResponse McpServer::handle_resource_read(const JsonRpcRequest& request, RequestContext context) {
    const auto& id = request.id();

    auto params = parse_resource_read_params(request.params());
    if (!params) {
        return JsonRpcResponse::failure(id, std::move(params.error()));
    }

    const ResourceDefinition* resource = nullptr;
    if (params->name.empty() == false) {
        resource = registry_.find_resource(params->name);
    }
    if (resource == nullptr && params->uri.empty() == false) {
        resource = registry_.find_resource_by_uri(params->uri);
    }
    if (resource == nullptr) {
        return JsonRpcResponse::failure(id, McpError::invalid_params("resource not found"));
    }

    const auto handler = find_resource_handler(resource->name);
    if (handler == nullptr) {
        Json fallback = {
            {"uri", resource->uri},
            {"mimeType", resource->mime_type},
            {"text", ""}
        };
        return JsonRpcResponse::success(id, Json{{"contents", Json::array({std::move(fallback)})}});
    }

    HandlerResult<ResourceContent> outcome;
    try {
        outcome = (*handler)(std::move(context), resource->uri);
    } catch (const std::exception& e) {
        outcome = tl::unexpected(HandlerError{e.what()});
    }

    if (!outcome) {
        logger_->error_fmt("resource {} read failed: {}", resource->name, outcome.error().message);
        return JsonRpcResponse::failure(id, McpError::internal_error("read resource: " + outcome.error().message));
    }
    return JsonRpcResponse::success(id, Json{{"contents", Json::array({outcome->to_json()})}});
}

// ─────────────────────────────────────────────────────────────────────────────
// Handler Registration
// ─────────────────────────────────────────────────────────────────────────────

void McpServer::register_tool(const std::string& name, ToolHandler handler) {
    if (registry_.find_tool(name) == nullptr) {
        logger_->warn_fmt("registering handler for undeclared tool {}", name);
    }
    auto shared = std::make_shared<const ToolHandler>(std::move(handler));
    std::unique_lock lock(handlers_mutex_);
    tool_handlers_.insert_or_assign(name, std::move(shared));
}

void McpServer::register_resource(const std::string& name, ResourceHandler handler) {
    if (registry_.find_resource(name) == nullptr) {
        logger_->warn_fmt("registering handler for undeclared resource {}", name);
    }
    auto shared = std::make_shared<const ResourceHandler>(std::move(handler));
    std::unique_lock lock(handlers_mutex_);
    resource_handlers_.insert_or_assign(name, std::move(shared));
}

void McpServer::register_stub_tools() {
    for (const auto& tool : registry_.tools()) {
        register_tool(tool.name, [name = tool.name](RequestContext, const Json&) {
            return HandlerResult<ToolResult>(ToolResult::text("stub: " + name + " accepted"));
        });
    }
}

bool McpServer::has_tool_handler(std::string_view name) const {
    return find_tool_handler(name) != nullptr;
}

bool McpServer::has_resource_handler(std::string_view name) const {
    return find_resource_handler(name) != nullptr;
}

std::shared_ptr<const ToolHandler> McpServer::find_tool_handler(std::string_view name) const {
    std::shared_lock lock(handlers_mutex_);
    const auto it = tool_handlers_.find(name);
    if (it == tool_handlers_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<const ResourceHandler> McpServer::find_resource_handler(std::string_view name) const {
    std::shared_lock lock(handlers_mutex_);
    const auto it = resource_handlers_.find(name);
    if (it == resource_handlers_.end()) {
        return nullptr;
    }
    return it->second;
}

}  // namespace mcpsrv
