#pragma once

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// LoadError - failure while loading definitions or building the registry
// ─────────────────────────────────────────────────────────────────────────────

struct LoadError {
    enum class Code {
        Io,         // source could not be read
        Parse,      // source is not valid JSON
        Shape,      // JSON does not match the definition layout
        Schema,     // a tool's inputSchema cannot be turned into rules
        Duplicate   // two definitions share a name
    };

    Code code{Code::Shape};
    std::string source;   // file path, or "<bytes>" for in-memory input
    std::string message;

    /// "<source>: <message>"
    [[nodiscard]] std::string what() const {
        return source + ": " + message;
    }

    static LoadError io(std::string source, std::string msg) {
        return {Code::Io, std::move(source), std::move(msg)};
    }

    static LoadError parse(std::string source, std::string msg) {
        return {Code::Parse, std::move(source), std::move(msg)};
    }

    static LoadError shape(std::string source, std::string msg) {
        return {Code::Shape, std::move(source), std::move(msg)};
    }

    static LoadError schema(std::string source, std::string_view tool, std::string_view reason) {
        return {Code::Schema, std::move(source),
                "tool " + std::string(tool) + " schema: " + std::string(reason)};
    }

    /// `key` names what repeated, e.g. "tool name" or "resource uri".
    static LoadError duplicate(std::string source, std::string_view key, std::string_view value) {
        return {Code::Duplicate, std::move(source),
                "duplicate " + std::string(key) + ": " + std::string(value)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(LoadError::Code code) noexcept {
    switch (code) {
        case LoadError::Code::Io:        return "Io";
        case LoadError::Code::Parse:     return "Parse";
        case LoadError::Code::Shape:     return "Shape";
        case LoadError::Code::Schema:    return "Schema";
        case LoadError::Code::Duplicate: return "Duplicate";
    }
    return "Unknown";
}

template <typename T>
using LoadResult = tl::expected<T, LoadError>;

}  // namespace mcpsrv
