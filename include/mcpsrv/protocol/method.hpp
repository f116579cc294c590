#pragma once

#include <string_view>

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// Method - every method name the server routes, plus a catch-all
// ─────────────────────────────────────────────────────────────────────────────

enum class Method {
    Initialize,
    Ping,
    NotificationInitialized,
    NotificationCancelled,
    ToolsList,
    ToolsCall,
    ResourcesList,
    ResourcesRead,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::Initialize:              return "initialize";
        case Method::Ping:                    return "ping";
        case Method::NotificationInitialized: return "notifications/initialized";
        case Method::NotificationCancelled:   return "notifications/cancelled";
        case Method::ToolsList:               return "tools/list";
        case Method::ToolsCall:               return "tools/call";
        case Method::ResourcesList:           return "resources/list";
        case Method::ResourcesRead:           return "resources/read";
        case Method::Unknown:                 return "";
    }
    return "";
}

[[nodiscard]] constexpr Method method_from_string(std::string_view name) noexcept {
    constexpr Method known[] = {
        Method::Initialize,
        Method::Ping,
        Method::NotificationInitialized,
        Method::NotificationCancelled,
        Method::ToolsList,
        Method::ToolsCall,
        Method::ResourcesList,
        Method::ResourcesRead,
    };
    for (const Method candidate : known) {
        if (to_string(candidate) == name) {
            return candidate;
        }
    }
    return Method::Unknown;
}

[[nodiscard]] constexpr bool is_notification(Method method) noexcept {
    return method == Method::NotificationInitialized
        || method == Method::NotificationCancelled;
}

}  // namespace mcpsrv
