#ifndef MCPSRV_SERVER_SERVER_CONFIG_HPP
#define MCPSRV_SERVER_SERVER_CONFIG_HPP

#include "mcpsrv/log/logger.hpp"
#include "mcpsrv/protocol/mcp_types.hpp"
#include "mcpsrv/server/definitions.hpp"

#include <tl/expected.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// Server Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Everything needed to build a server. Definitions may come from any mix of
// structs, in-memory JSON text and files; the registry loads them in that
// order and rejects duplicate names across all sources.

struct ServerConfig {
    // Reported in the initialize response.
    Implementation server_info{"mcpserver", "1.0.0"};

    // ─────────────────────────────────────────────────────────────────────────
    // Tool Definitions
    // ─────────────────────────────────────────────────────────────────────────

    std::vector<ToolDefinition> tools;
    std::vector<std::string> tools_json;
    std::vector<std::filesystem::path> tools_files;

    // ─────────────────────────────────────────────────────────────────────────
    // Resource Definitions
    // ─────────────────────────────────────────────────────────────────────────

    std::vector<ResourceDefinition> resources;
    std::vector<std::string> resources_json;
    std::vector<std::filesystem::path> resources_files;

    // ─────────────────────────────────────────────────────────────────────────
    // Parsing
    // ─────────────────────────────────────────────────────────────────────────

    // Nesting limit for definition files and inbound envelopes.
    std::size_t max_json_depth{64};

    // ─────────────────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────────────────

    // Null means nothing is logged.
    std::shared_ptr<ILogger> logger;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────
    //   ServerConfig{}.with_server_info("app-mcp", "1.0.0").with_tools_file(path)

    ServerConfig& with_server_info(std::string name, std::string version);
    ServerConfig& with_tool(ToolDefinition tool);
    ServerConfig& with_tools_json(std::string json);
    ServerConfig& with_tools_file(std::filesystem::path path);
    ServerConfig& with_resource(ResourceDefinition resource);
    ServerConfig& with_resources_json(std::string json);
    ServerConfig& with_resources_file(std::filesystem::path path);
    ServerConfig& with_max_json_depth(std::size_t depth);
    ServerConfig& with_logger(std::shared_ptr<ILogger> log);

    /// First configuration problem found, if any.
    [[nodiscard]] tl::expected<void, std::string> validate() const;
};

}  // namespace mcpsrv

#endif  // MCPSRV_SERVER_SERVER_CONFIG_HPP
