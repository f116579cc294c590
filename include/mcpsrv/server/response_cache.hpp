#pragma once

#include "mcpsrv/protocol/json_rpc.hpp"
#include "mcpsrv/protocol/mcp_types.hpp"
#include "mcpsrv/server/registry.hpp"

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// ResponseCache - results that depend only on configuration
// ─────────────────────────────────────────────────────────────────────────────
// Encoded once at construction. Every request for initialize, tools/list or
// resources/list shares the same buffer; nothing here changes afterwards.

class ResponseCache {
public:
    ResponseCache(const Registry& registry, const Implementation& server_info);

    [[nodiscard]] const CachedPayload& initialize() const noexcept { return initialize_; }
    [[nodiscard]] const CachedPayload& tools_list() const noexcept { return tools_list_; }
    [[nodiscard]] const CachedPayload& resources_list() const noexcept { return resources_list_; }

private:
    CachedPayload initialize_;
    CachedPayload tools_list_;
    CachedPayload resources_list_;
};

}  // namespace mcpsrv
