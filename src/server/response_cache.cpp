#include "mcpsrv/server/response_cache.hpp"

namespace mcpsrv {

namespace {

Json initialize_result(const Implementation& server_info) {
    return {
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", {{"listChanged", false}}},
            {"resources", {{"subscribe", false}, {"listChanged", false}}}
        }},
        {"serverInfo", server_info.to_json()}
    };
}

template <typename Definition>
Json listing(const char* key, const std::vector<Definition>& definitions) {
    Json entries = Json::array();
    for (const auto& definition : definitions) {
        entries.push_back(definition.to_json());
    }
    return {{key, std::move(entries)}};
}

}  // namespace

ResponseCache::ResponseCache(const Registry& registry, const Implementation& server_info)
    : initialize_(make_cached_payload(initialize_result(server_info)))
    , tools_list_(make_cached_payload(listing("tools", registry.tools())))
    , resources_list_(make_cached_payload(listing("resources", registry.resources())))
{}

}  // namespace mcpsrv
