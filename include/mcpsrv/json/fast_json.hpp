#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON decoding
// ─────────────────────────────────────────────────────────────────────────────
//
// Untrusted bytes (inbound envelopes, definition files) are decoded with
// simdjson's on-demand parser and materialised as nlohmann::json, which the
// rest of the server uses for inspection and encoding.
//
//   auto doc = mcpsrv::fast_parse(body);
//   if (!doc) { /* doc.error().message */ }
//
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace mcpsrv {

using Json = nlohmann::json;

struct JsonParseError {
    std::string message;
    std::size_t position{0};  // byte offset, 0 when simdjson does not report one

    JsonParseError() = default;
    explicit JsonParseError(std::string msg, std::size_t pos = 0)
        : message(std::move(msg))
        , position(pos)
    {}
};

using JsonParseResult = tl::expected<Json, JsonParseError>;

struct FastJsonConfig {
    // Documents nested deeper than this are rejected
    std::size_t max_depth{64};
};

/// One parser per thread; the simdjson parser owns reusable buffers.
class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    [[nodiscard]] JsonParseResult parse(std::string_view text);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;

    [[nodiscard]] JsonParseResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] JsonParseResult convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] JsonParseResult convert_array(simdjson::ondemand::array arr, std::size_t depth);
    [[nodiscard]] JsonParseResult convert_scalar_root(simdjson::ondemand::document& doc);
};

/// Parse with a thread-local parser using the default configuration.
[[nodiscard]] JsonParseResult fast_parse(std::string_view text);

/// Parse with a thread-local parser honouring the given nesting limit.
[[nodiscard]] JsonParseResult fast_parse(std::string_view text, std::size_t max_depth);

}  // namespace mcpsrv
