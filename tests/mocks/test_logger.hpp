#pragma once

#include "mcpsrv/log/logger.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpsrv::testing {

// ─────────────────────────────────────────────────────────────────────────────
// TestLogger - captures records for assertions; safe across threads
// ─────────────────────────────────────────────────────────────────────────────

class TestLogger final : public ILogger {
public:
    explicit TestLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] std::vector<LogRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] bool contains(LogLevel level, std::string_view fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(records_.begin(), records_.end(), [&](const LogRecord& record) {
            return record.level == level && record.message.find(fragment) != std::string::npos;
        });
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

private:
    LogLevel min_level_;
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

}  // namespace mcpsrv::testing
