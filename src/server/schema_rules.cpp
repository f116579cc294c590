#include "mcpsrv/server/schema_rules.hpp"

namespace mcpsrv {

namespace {

tl::expected<std::vector<std::string>, std::string> string_entries(const Json& array, std::string_view what) {
    std::vector<std::string> names;
    names.reserve(array.size());
    for (const auto& entry : array) {
        if (entry.is_string() == false) {
            return tl::unexpected(std::string(what) + " must be strings");
        }
        names.push_back(entry.get<std::string>());
    }
    return names;
}

}  // namespace

tl::expected<SchemaRuleSet, std::string> parse_schema_rules(const Json& schema) {
    SchemaRuleSet rules;

    // An omitted schema declares no rules
    if (schema.is_null()) {
        return rules;
    }
    if (schema.is_object() == false) {
        return tl::unexpected(std::string("inputSchema must be an object"));
    }

    if (const auto it = schema.find("required"); it != schema.end() && it->is_null() == false) {
        if (it->is_array() == false) {
            return tl::unexpected(std::string("required must be an array"));
        }
        auto names = string_entries(*it, "required entries");
        if (!names) {
            return tl::unexpected(std::move(names.error()));
        }
        rules.required = std::move(*names);
    }

    if (const auto it = schema.find("oneOf"); it != schema.end() && it->is_null() == false) {
        if (it->is_array() == false) {
            return tl::unexpected(std::string("oneOf must be an array"));
        }
        for (const auto& alternative : *it) {
            if (alternative.is_object() == false) {
                return tl::unexpected(std::string("oneOf entries must be objects with a required array"));
            }
            std::vector<std::string> fields;
            const auto req = alternative.find("required");
            if (req != alternative.end() && req->is_null() == false) {
                if (req->is_array() == false) {
                    return tl::unexpected(std::string("oneOf entries must be objects with a required array"));
                }
                auto names = string_entries(*req, "oneOf required entries");
                if (!names) {
                    return tl::unexpected(std::move(names.error()));
                }
                fields = std::move(*names);
            }
            rules.one_of.push_back(std::move(fields));
        }
    }

    if (const auto it = schema.find("dependencies"); it != schema.end() && it->is_null() == false) {
        if (it->is_object() == false) {
            return tl::unexpected(std::string("dependencies must be an object"));
        }
        for (const auto& [field, companions] : it->items()) {
            if (companions.is_null()) {
                continue;
            }
            const std::string reason = "dependencies of " + field + " must be an array of strings";
            if (companions.is_array() == false) {
                return tl::unexpected(reason);
            }
            auto names = string_entries(companions, "dependencies of " + field);
            if (!names) {
                return tl::unexpected(reason);
            }
            rules.dependencies.emplace(field, std::move(*names));
        }
    }

    return rules;
}

}  // namespace mcpsrv
