#pragma once

#include <cstddef>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <unordered_set>

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// SessionStore - live session tokens issued on initialize
// ─────────────────────────────────────────────────────────────────────────────
// Tokens are version-4 UUIDs drawn from std::random_device. A token is visible to contains() as soon
// as create() returns it. Tokens are never removed; sessions last for the
// lifetime of the store.

class SessionStore {
public:
    SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /// Issue and remember a fresh token.
    [[nodiscard]] std::string create();

    [[nodiscard]] bool contains(std::string_view token) const;

    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] std::string generate_token();

    mutable std::mutex mutex_;
    std::unordered_set<std::string> tokens_;
    std::random_device entropy_;  // guarded by mutex_
};

/// True for the canonical 36-character UUID text form.
[[nodiscard]] bool is_uuid_format(std::string_view token) noexcept;

}  // namespace mcpsrv
