#pragma once

#include "mcpsrv/server/definitions.hpp"
#include "mcpsrv/server/load_error.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcpsrv {

struct ServerConfig;

// ─────────────────────────────────────────────────────────────────────────────
// Registry - declared tools and resources
// ─────────────────────────────────────────────────────────────────────────────
// Immutable once built, so concurrent lookups need no locking. Listings keep
// declaration order.

class Registry {
public:
    Registry() = default;

    /// Derive each tool's schema rules and index both lists by name, and
    /// resources by URI. Repeated names or URIs fail the build.
    [[nodiscard]] static LoadResult<Registry> build(
        std::vector<ToolDefinition> tools,
        std::vector<ResourceDefinition> resources
    );

    /// Load every definition source named by the config, then build.
    [[nodiscard]] static LoadResult<Registry> from_config(const ServerConfig& config);

    [[nodiscard]] const ToolDefinition* find_tool(std::string_view name) const;
    [[nodiscard]] const ResourceDefinition* find_resource(std::string_view name) const;

    /// Exact URI match. URIs are unique across resources.
    [[nodiscard]] const ResourceDefinition* find_resource_by_uri(std::string_view uri) const;

    [[nodiscard]] const std::vector<ToolDefinition>& tools() const noexcept { return tools_; }
    [[nodiscard]] const std::vector<ResourceDefinition>& resources() const noexcept { return resources_; }

private:
    struct NameHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view name) const noexcept {
            return std::hash<std::string_view>{}(name);
        }
    };
    using NameIndex = std::unordered_map<std::string, std::size_t, NameHash, std::equal_to<>>;

    std::vector<ToolDefinition> tools_;
    std::vector<ResourceDefinition> resources_;
    NameIndex tool_index_;
    NameIndex resource_index_;
    NameIndex uri_index_;
};

}  // namespace mcpsrv
