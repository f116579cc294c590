#pragma once

#include "mcpsrv/server/schema_rules.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <string>

namespace mcpsrv {

/// Error holds the human-readable failure reason.
using ValidationResult = tl::expected<void, std::string>;

/// Check tool arguments against presence rules.
///
/// Stops at the first failure, in this order:
///   1. every `required` field present
///   2. at least one `oneOf` alternative fully present (if any are declared)
///   3. for each present `dependencies` key, all of its companions present
/// Only key presence is inspected; values are never looked at.
[[nodiscard]] ValidationResult validate(const SchemaRuleSet& rules, const Json& arguments);

}  // namespace mcpsrv
