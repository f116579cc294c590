#include "mcpsrv/server/registry.hpp"

#include "mcpsrv/server/loader.hpp"
#include "mcpsrv/server/server_config.hpp"

namespace mcpsrv {

namespace {

constexpr std::string_view kRegistrySource = "<registry>";

template <typename T>
void append(std::vector<T>& into, std::vector<T>&& from) {
    into.insert(into.end(),
                std::make_move_iterator(from.begin()),
                std::make_move_iterator(from.end()));
}

}  // namespace

LoadResult<Registry> Registry::build(
    std::vector<ToolDefinition> tools,
    std::vector<ResourceDefinition> resources
) {
    Registry registry;
    registry.tools_ = std::move(tools);
    registry.resources_ = std::move(resources);

    for (std::size_t i = 0; i < registry.tools_.size(); ++i) {
        auto& tool = registry.tools_[i];
        if (tool.name.empty()) {
            return tl::unexpected(LoadError::shape(std::string(kRegistrySource), "tool name is required"));
        }

        auto rules = parse_schema_rules(tool.input_schema);
        if (!rules) {
            return tl::unexpected(LoadError::schema(std::string(kRegistrySource), tool.name, rules.error()));
        }
        tool.rules = std::move(*rules);

        const bool inserted = registry.tool_index_.emplace(tool.name, i).second;
        if (inserted == false) {
            return tl::unexpected(LoadError::duplicate(std::string(kRegistrySource), "tool name", tool.name));
        }
    }

    for (std::size_t i = 0; i < registry.resources_.size(); ++i) {
        const auto& resource = registry.resources_[i];
        if (resource.name.empty()) {
            return tl::unexpected(LoadError::shape(std::string(kRegistrySource), "resource name is required"));
        }

        const bool inserted = registry.resource_index_.emplace(resource.name, i).second;
        if (inserted == false) {
            return tl::unexpected(LoadError::duplicate(std::string(kRegistrySource), "resource name", resource.name));
        }

        // Name and URI lookups must land on the same definition
        if (resource.uri.empty() == false) {
            const bool unique_uri = registry.uri_index_.emplace(resource.uri, i).second;
            if (unique_uri == false) {
                return tl::unexpected(LoadError::duplicate(std::string(kRegistrySource), "resource uri", resource.uri));
            }
        }
    }

    return registry;
}

LoadResult<Registry> Registry::from_config(const ServerConfig& config) {
    std::vector<ToolDefinition> tools = config.tools;
    for (const auto& text : config.tools_json) {
        auto parsed = parse_tools(text, IN_MEMORY_SOURCE, config.max_json_depth);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        append(tools, std::move(*parsed));
    }
    for (const auto& path : config.tools_files) {
        auto loaded = load_tools(path, config.max_json_depth);
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }
        append(tools, std::move(*loaded));
    }

    std::vector<ResourceDefinition> resources = config.resources;
    for (const auto& text : config.resources_json) {
        auto parsed = parse_resources(text, IN_MEMORY_SOURCE, config.max_json_depth);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        append(resources, std::move(*parsed));
    }
    for (const auto& path : config.resources_files) {
        auto loaded = load_resources(path, config.max_json_depth);
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }
        append(resources, std::move(*loaded));
    }

    return build(std::move(tools), std::move(resources));
}

const ToolDefinition* Registry::find_tool(std::string_view name) const {
    const auto it = tool_index_.find(name);
    if (it == tool_index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

const ResourceDefinition* Registry::find_resource(std::string_view name) const {
    const auto it = resource_index_.find(name);
    if (it == resource_index_.end()) {
        return nullptr;
    }
    return &resources_[it->second];
}

const ResourceDefinition* Registry::find_resource_by_uri(std::string_view uri) const {
    const auto it = uri_index_.find(uri);
    if (it == uri_index_.end()) {
        return nullptr;
    }
    return &resources_[it->second];
}

}  // namespace mcpsrv
