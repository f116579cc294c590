#include "mcpsrv/server/server_config.hpp"

namespace mcpsrv {

ServerConfig& ServerConfig::with_server_info(std::string name, std::string version) {
    server_info = Implementation{std::move(name), std::move(version)};
    return *this;
}

ServerConfig& ServerConfig::with_tool(ToolDefinition tool) {
    tools.push_back(std::move(tool));
    return *this;
}

ServerConfig& ServerConfig::with_tools_json(std::string json) {
    tools_json.push_back(std::move(json));
    return *this;
}

ServerConfig& ServerConfig::with_tools_file(std::filesystem::path path) {
    tools_files.push_back(std::move(path));
    return *this;
}

ServerConfig& ServerConfig::with_resource(ResourceDefinition resource) {
    resources.push_back(std::move(resource));
    return *this;
}

ServerConfig& ServerConfig::with_resources_json(std::string json) {
    resources_json.push_back(std::move(json));
    return *this;
}

ServerConfig& ServerConfig::with_resources_file(std::filesystem::path path) {
    resources_files.push_back(std::move(path));
    return *this;
}

ServerConfig& ServerConfig::with_max_json_depth(std::size_t depth) {
    max_json_depth = depth;
    return *this;
}

ServerConfig& ServerConfig::with_logger(std::shared_ptr<ILogger> log) {
    logger = std::move(log);
    return *this;
}

tl::expected<void, std::string> ServerConfig::validate() const {
    if (server_info.name.empty()) {
        return tl::unexpected(std::string("server name must not be empty"));
    }
    if (server_info.version.empty()) {
        return tl::unexpected(std::string("server version must not be empty"));
    }
    if (max_json_depth == 0) {
        return tl::unexpected(std::string("max_json_depth must be positive"));
    }
    for (const auto& path : tools_files) {
        if (path.empty()) {
            return tl::unexpected(std::string("tools file path must not be empty"));
        }
    }
    for (const auto& path : resources_files) {
        if (path.empty()) {
            return tl::unexpected(std::string("resources file path must not be empty"));
        }
    }
    return {};
}

}  // namespace mcpsrv
