#include "mcpsrv/server/validator.hpp"

#include <algorithm>
#include <format>

namespace mcpsrv {

namespace {

bool has_field(const Json& arguments, const std::string& name) {
    return arguments.is_object() && arguments.contains(name);
}

bool has_all(const Json& arguments, const std::vector<std::string>& names) {
    return std::all_of(names.begin(), names.end(),
        [&arguments](const std::string& name) { return has_field(arguments, name); });
}

}  // namespace

ValidationResult validate(const SchemaRuleSet& rules, const Json& arguments) {
    for (const auto& name : rules.required) {
        if (has_field(arguments, name) == false) {
            return tl::unexpected(std::format("missing required field `{}`", name));
        }
    }

    if (rules.one_of.empty() == false) {
        const bool satisfied = std::any_of(rules.one_of.begin(), rules.one_of.end(),
            [&arguments](const std::vector<std::string>& alternative) {
                return has_all(arguments, alternative);
            });
        if (satisfied == false) {
            return tl::unexpected(std::string("arguments must satisfy oneOf requirements"));
        }
    }

    for (const auto& [field, companions] : rules.dependencies) {
        if (has_field(arguments, field) == false) {
            continue;
        }
        for (const auto& companion : companions) {
            if (has_field(arguments, companion) == false) {
                return tl::unexpected(std::format("field `{}` requires `{}`", field, companion));
            }
        }
    }

    return {};
}

}  // namespace mcpsrv
