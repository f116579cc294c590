#include "mcpsrv/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mcpsrv {

namespace {

constexpr std::string_view RESET   = "\033[0m";
constexpr std::string_view GRAY    = "\033[90m";
constexpr std::string_view CYAN    = "\033[36m";
constexpr std::string_view GREEN   = "\033[32m";
constexpr std::string_view YELLOW  = "\033[33m";
constexpr std::string_view RED     = "\033[31m";
constexpr std::string_view MAGENTA = "\033[35m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return GRAY;
        case LogLevel::Debug: return CYAN;
        case LogLevel::Info:  return GREEN;
        case LogLevel::Warn:  return YELLOW;
        case LogLevel::Error: return RED;
        case LogLevel::Fatal: return MAGENTA;
        case LogLevel::Off:   return RESET;
    }
    return RESET;
}

[[nodiscard]] std::string format_clock(const std::chrono::system_clock::time_point& tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    std::string_view sv(path);
    const auto slash = sv.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        return sv.substr(slash + 1);
    }
    return sv;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal" || lowered == "critical") return LogLevel::Fatal;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    std::ostringstream line;
    const std::string_view color_on = colors_enabled_ ? level_color(record.level) : "";
    const std::string_view color_off = colors_enabled_ ? RESET : "";
    const std::string_view dim = colors_enabled_ ? GRAY : "";

    line << dim << format_clock(record.timestamp) << color_off << ' '
         << color_on << std::setw(5) << std::left << to_string(record.level) << color_off << ' '
         << dim << basename_of(record.location.file_name()) << ':' << record.location.line()
         << color_off << ' ' << record.message << '\n';

    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cerr << line.str();
}

std::shared_ptr<ILogger> make_null_logger() {
    return std::make_shared<NullLogger>();
}

}  // namespace mcpsrv
