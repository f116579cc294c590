#pragma once

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <map>
#include <string>
#include <vector>

namespace mcpsrv {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// SchemaRuleSet - presence rules extracted from a tool's inputSchema
// ─────────────────────────────────────────────────────────────────────────────
// Only key presence is modelled. Types, patterns and nested schemas are not.

struct SchemaRuleSet {
    /// Fields that must always be present
    std::vector<std::string> required;

    /// Alternatives; satisfied when every field of any one entry is present
    std::vector<std::vector<std::string>> one_of;

    /// Field -> companions required whenever the field is present
    std::map<std::string, std::vector<std::string>> dependencies;

    [[nodiscard]] bool empty() const noexcept {
        return required.empty() && one_of.empty() && dependencies.empty();
    }
};

/// Extract rules from an inputSchema document.
///
/// Every rule member must hold field names: `required` an array of strings,
/// `oneOf` an array of objects whose `required` is an array of strings, and
/// `dependencies` an object of string arrays. Anything else is an error, as is
/// a schema that is not an object. A null member counts as absent.
[[nodiscard]] tl::expected<SchemaRuleSet, std::string> parse_schema_rules(const Json& schema);

}  // namespace mcpsrv
