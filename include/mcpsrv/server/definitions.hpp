#pragma once

#include "mcpsrv/server/schema_rules.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace mcpsrv {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// ToolDefinition
// ─────────────────────────────────────────────────────────────────────────────

struct ToolDefinition {
    std::string name;
    std::string description;
    Json input_schema = Json::object();

    /// Derived from input_schema when the registry is built
    SchemaRuleSet rules;

    /// Listing form: {"name","description","inputSchema"}
    [[nodiscard]] Json to_json() const {
        return {
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema}
        };
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ResourceDefinition
// ─────────────────────────────────────────────────────────────────────────────

struct ResourceDefinition {
    std::string name;
    std::string description;
    std::string uri;
    std::string mime_type;

    /// Listing form: {"uri","name","description","mimeType"}
    [[nodiscard]] Json to_json() const {
        return {
            {"uri", uri},
            {"name", name},
            {"description", description},
            {"mimeType", mime_type}
        };
    }
};

}  // namespace mcpsrv
