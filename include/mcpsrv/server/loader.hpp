#pragma once

#include "mcpsrv/server/definitions.hpp"
#include "mcpsrv/server/load_error.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace mcpsrv {

inline constexpr std::string_view IN_MEMORY_SOURCE = "<bytes>";

// ─────────────────────────────────────────────────────────────────────────────
// Definition loading
// ─────────────────────────────────────────────────────────────────────────────
// Tools file: [{"name": "...", "description": "...", "inputSchema": {...}}]
// Resources file: [{"name", "description", "uri", "mimeType"}]
// `description` and `mimeType` may be omitted. Schema rules are derived later,
// when the registry is built.

[[nodiscard]] LoadResult<std::vector<ToolDefinition>> parse_tools(
    std::string_view bytes,
    std::string_view source = IN_MEMORY_SOURCE,
    std::size_t max_depth = 64
);

[[nodiscard]] LoadResult<std::vector<ToolDefinition>> load_tools(
    const std::filesystem::path& path,
    std::size_t max_depth = 64
);

[[nodiscard]] LoadResult<std::vector<ResourceDefinition>> parse_resources(
    std::string_view bytes,
    std::string_view source = IN_MEMORY_SOURCE,
    std::size_t max_depth = 64
);

[[nodiscard]] LoadResult<std::vector<ResourceDefinition>> load_resources(
    const std::filesystem::path& path,
    std::size_t max_depth = 64
);

}  // namespace mcpsrv
