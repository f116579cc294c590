#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpsrv/server/loader.hpp"
#include "mcpsrv/server/registry.hpp"
#include "mcpsrv/server/server_config.hpp"
#include "mocks/fixtures.hpp"

#include <filesystem>
#include <fstream>

using namespace mcpsrv;
using Catch::Matchers::ContainsSubstring;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
    return path;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Loader
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("parse_tools reads the documented layout", "[loader]") {
    auto tools = parse_tools(testing::kToolsJson);

    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);
    REQUIRE((*tools)[0].name == "otp-verify");
    REQUIRE((*tools)[0].description == "Verify a one-time password");
    REQUIRE((*tools)[0].input_schema["required"][0] == "token");
    REQUIRE((*tools)[1].name == "channels-list");
}

TEST_CASE("parse_tools reports malformed input with its source", "[loader]") {
    SECTION("invalid JSON") {
        auto tools = parse_tools("[{", "tools.json");
        REQUIRE_FALSE(tools.has_value());
        REQUIRE(tools.error().code == LoadError::Code::Parse);
        REQUIRE(tools.error().source == "tools.json");
        REQUIRE_THAT(tools.error().what(), ContainsSubstring("tools.json"));
    }
    SECTION("not an array") {
        auto tools = parse_tools(R"({"name":"x"})");
        REQUIRE(tools.error().code == LoadError::Code::Shape);
        REQUIRE(tools.error().source == IN_MEMORY_SOURCE);
    }
    SECTION("missing name") {
        auto tools = parse_tools(R"([{"description":"d","inputSchema":{}}])");
        REQUIRE(tools.error().code == LoadError::Code::Shape);
        REQUIRE_THAT(tools.error().message, ContainsSubstring("name"));
    }
    SECTION("missing inputSchema names the tool") {
        auto tools = parse_tools(R"([{"name":"otp-request","description":"d"}])");
        REQUIRE(tools.error().code == LoadError::Code::Schema);
        REQUIRE_THAT(tools.error().message, ContainsSubstring("tool otp-request schema"));
    }
}

TEST_CASE("parse_resources reads the documented layout", "[loader]") {
    auto resources = parse_resources(testing::kResourcesJson);

    REQUIRE(resources.has_value());
    REQUIRE(resources->size() == 1);
    REQUIRE((*resources)[0].uri == "docs://openapi.json");
    REQUIRE((*resources)[0].mime_type == "application/json");

    auto broken = parse_resources(R"([{"name":"x","uri":5}])");
    REQUIRE_FALSE(broken.has_value());
    REQUIRE_THAT(broken.error().message, ContainsSubstring("uri"));
}

TEST_CASE("load_tools reads definitions from disk", "[loader][file]") {
    const auto path = write_temp("mcpsrv_tools_test.json", testing::kToolsJson);

    auto tools = load_tools(path);
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);

    std::filesystem::remove(path);

    auto missing = load_tools(path);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == LoadError::Code::Io);
    REQUIRE(missing.error().source == path.string());
}

// ═══════════════════════════════════════════════════════════════════════════
// Registry
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Registry derives rules and indexes by name", "[registry]") {
    auto registry = Registry::from_config(testing::sample_config());
    REQUIRE(registry.has_value());

    const auto* tool = registry->find_tool("otp-verify");
    REQUIRE(tool != nullptr);
    REQUIRE(tool->rules.required == std::vector<std::string>{"token"});
    REQUIRE(tool->rules.one_of.size() == 2);
    REQUIRE(tool->rules.dependencies.count("code") == 1);

    REQUIRE(registry->find_tool("channels-list")->rules.empty());
    REQUIRE(registry->find_tool("missing") == nullptr);
}

TEST_CASE("Resources resolve identically by name and by URI", "[registry]") {
    auto registry = Registry::from_config(testing::sample_config());
    REQUIRE(registry.has_value());

    const auto* by_name = registry->find_resource("openapi");
    const auto* by_uri = registry->find_resource_by_uri("docs://openapi.json");

    REQUIRE(by_name != nullptr);
    REQUIRE(by_name == by_uri);
    REQUIRE(registry->find_resource("docs://openapi.json") == nullptr);
    REQUIRE(registry->find_resource_by_uri("openapi") == nullptr);
}

TEST_CASE("Registry construction paths are equivalent", "[registry]") {
    auto from_bytes = Registry::from_config(testing::sample_config());

    auto tools = parse_tools(testing::kToolsJson);
    auto resources = parse_resources(testing::kResourcesJson);
    auto from_structs = Registry::build(*tools, *resources);

    const auto tools_path = write_temp("mcpsrv_registry_tools.json", testing::kToolsJson);
    const auto resources_path = write_temp("mcpsrv_registry_resources.json", testing::kResourcesJson);
    auto from_files = Registry::from_config(
        ServerConfig{}.with_tools_file(tools_path).with_resources_file(resources_path));
    std::filesystem::remove(tools_path);
    std::filesystem::remove(resources_path);

    REQUIRE(from_bytes.has_value());
    REQUIRE(from_structs.has_value());
    REQUIRE(from_files.has_value());

    for (const Registry* registry : {&*from_structs, &*from_files}) {
        REQUIRE(registry->tools().size() == from_bytes->tools().size());
        for (std::size_t i = 0; i < registry->tools().size(); ++i) {
            REQUIRE(registry->tools()[i].to_json() == from_bytes->tools()[i].to_json());
            REQUIRE(registry->tools()[i].rules.required == from_bytes->tools()[i].rules.required);
        }
        REQUIRE(registry->resources()[0].to_json() == from_bytes->resources()[0].to_json());
    }
}

TEST_CASE("Registry build rejects bad definitions", "[registry]") {
    SECTION("malformed schema names the tool") {
        ToolDefinition tool{"otp-request", "Request an OTP", Json{{"required", "email"}}, {}};
        auto registry = Registry::build({tool}, {});
        REQUIRE_FALSE(registry.has_value());
        REQUIRE(registry.error().code == LoadError::Code::Schema);
        REQUIRE_THAT(registry.error().message, ContainsSubstring("tool otp-request schema"));
    }
    SECTION("duplicate tool names") {
        ToolDefinition tool{"echo", "", Json::object(), {}};
        auto registry = Registry::build({tool, tool}, {});
        REQUIRE(registry.error().code == LoadError::Code::Duplicate);
        REQUIRE_THAT(registry.error().message, ContainsSubstring("echo"));
    }
    SECTION("duplicate resource names") {
        ResourceDefinition resource{"readme", "", "file:///README.md", "text/markdown"};
        auto registry = Registry::build({}, {resource, resource});
        REQUIRE(registry.error().code == LoadError::Code::Duplicate);
        REQUIRE(registry.error().message == "duplicate resource name: readme");
    }
    SECTION("duplicate resource URIs") {
        ResourceDefinition readme{"readme", "", "file:///README.md", "text/markdown"};
        ResourceDefinition mirror{"readme-mirror", "", "file:///README.md", "text/markdown"};
        auto registry = Registry::build({}, {readme, mirror});
        REQUIRE_FALSE(registry.has_value());
        REQUIRE(registry.error().code == LoadError::Code::Duplicate);
        REQUIRE(registry.error().message == "duplicate resource uri: file:///README.md");
    }
    SECTION("non-string required entry names the tool") {
        ToolDefinition tool{"otp-request", "", Json{{"required", {"email", 3}}}, {}};
        auto registry = Registry::build({tool}, {});
        REQUIRE_FALSE(registry.has_value());
        REQUIRE(registry.error().code == LoadError::Code::Schema);
        REQUIRE_THAT(registry.error().message, ContainsSubstring("tool otp-request schema"));
        REQUIRE_THAT(registry.error().message, ContainsSubstring("required entries must be strings"));
    }
}

TEST_CASE("ServerConfig validates its settings", "[config]") {
    REQUIRE(testing::sample_config().validate().has_value());
    REQUIRE_FALSE(ServerConfig{}.with_server_info("", "1.0.0").validate().has_value());
    REQUIRE_FALSE(ServerConfig{}.with_max_json_depth(0).validate().has_value());

    const ServerConfig defaults;
    REQUIRE(defaults.server_info.name == "mcpserver");
    REQUIRE(defaults.server_info.version == "1.0.0");
    REQUIRE(defaults.logger == nullptr);
}
