#include "mcpsrv/server/loader.hpp"

#include "mcpsrv/json/fast_json.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace mcpsrv {

namespace {

LoadResult<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return tl::unexpected(LoadError::io(path.string(), std::strerror(errno)));
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return tl::unexpected(LoadError::io(path.string(), "read failed"));
    }
    return contents.str();
}

LoadResult<Json> parse_array(std::string_view bytes, const std::string& source, std::size_t max_depth) {
    auto document = fast_parse(bytes, max_depth);
    if (!document) {
        return tl::unexpected(LoadError::parse(source, document.error().message));
    }
    if (document->is_array() == false) {
        return tl::unexpected(LoadError::shape(source, "expected a JSON array of definitions"));
    }
    return std::move(*document);
}

// Optional string member; absent or null reads as empty
tl::expected<std::string, std::string> optional_string(const Json& entry, const char* key) {
    const auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) {
        return std::string{};
    }
    if (it->is_string() == false) {
        return tl::unexpected(std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

tl::expected<std::string, std::string> required_string(const Json& entry, const char* key) {
    auto value = optional_string(entry, key);
    if (value && value->empty()) {
        return tl::unexpected(std::string(key) + " is required");
    }
    return value;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Tools
// ─────────────────────────────────────────────────────────────────────────────

LoadResult<std::vector<ToolDefinition>> parse_tools(
    std::string_view bytes,
    std::string_view source,
    std::size_t max_depth
) {
    const std::string origin(source);
    auto document = parse_array(bytes, origin, max_depth);
    if (!document) {
        return tl::unexpected(document.error());
    }

    std::vector<ToolDefinition> tools;
    tools.reserve(document->size());

    std::size_t index = 0;
    for (const auto& entry : *document) {
        const std::string where = "tool #" + std::to_string(index++);
        if (entry.is_object() == false) {
            return tl::unexpected(LoadError::shape(origin, where + " must be an object"));
        }

        auto name = required_string(entry, "name");
        if (!name) {
            return tl::unexpected(LoadError::shape(origin, where + ": " + name.error()));
        }
        auto description = optional_string(entry, "description");
        if (!description) {
            return tl::unexpected(LoadError::shape(origin, "tool " + *name + ": " + description.error()));
        }

        const auto schema = entry.find("inputSchema");
        if (schema == entry.end() || schema->is_object() == false) {
            return tl::unexpected(LoadError::schema(origin, *name, "inputSchema must be an object"));
        }

        ToolDefinition tool;
        tool.name = std::move(*name);
        tool.description = std::move(*description);
        tool.input_schema = *schema;
        tools.push_back(std::move(tool));
    }

    return tools;
}

LoadResult<std::vector<ToolDefinition>> load_tools(const std::filesystem::path& path, std::size_t max_depth) {
    auto contents = read_file(path);
    if (!contents) {
        return tl::unexpected(contents.error());
    }
    return parse_tools(*contents, path.string(), max_depth);
}

// ─────────────────────────────────────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────────────────────────────────────

LoadResult<std::vector<ResourceDefinition>> parse_resources(
    std::string_view bytes,
    std::string_view source,
    std::size_t max_depth
) {
    const std::string origin(source);
    auto document = parse_array(bytes, origin, max_depth);
    if (!document) {
        return tl::unexpected(document.error());
    }

    std::vector<ResourceDefinition> resources;
    resources.reserve(document->size());

    std::size_t index = 0;
    for (const auto& entry : *document) {
        const std::string where = "resource #" + std::to_string(index++);
        if (entry.is_object() == false) {
            return tl::unexpected(LoadError::shape(origin, where + " must be an object"));
        }

        auto name = required_string(entry, "name");
        auto uri = required_string(entry, "uri");
        auto description = optional_string(entry, "description");
        auto mime_type = optional_string(entry, "mimeType");
        for (const auto* field : {&name, &uri, &description, &mime_type}) {
            if (!*field) {
                return tl::unexpected(LoadError::shape(origin, where + ": " + field->error()));
            }
        }

        resources.push_back(ResourceDefinition{
            std::move(*name),
            std::move(*description),
            std::move(*uri),
            std::move(*mime_type)
        });
    }

    return resources;
}

LoadResult<std::vector<ResourceDefinition>> load_resources(const std::filesystem::path& path, std::size_t max_depth) {
    auto contents = read_file(path);
    if (!contents) {
        return tl::unexpected(contents.error());
    }
    return parse_resources(*contents, path.string(), max_depth);
}

}  // namespace mcpsrv
