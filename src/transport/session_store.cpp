#include "mcpsrv/transport/session_store.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace mcpsrv {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

SessionStore::SessionStore() = default;

std::string SessionStore::create() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string token = generate_token();
    while (tokens_.contains(token)) {
        token = generate_token();
    }
    tokens_.insert(token);
    return token;
}

bool SessionStore::contains(std::string_view token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.contains(std::string(token));
}

std::size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

std::string SessionStore::generate_token() {
    using Word = std::random_device::result_type;
    constexpr std::size_t kWordBytes = 4;
    static_assert(sizeof(Word) >= kWordBytes);

    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += kWordBytes) {
        const Word word = entropy_();
        for (std::size_t j = 0; j < kWordBytes; ++j) {
            bytes[i + j] = static_cast<std::uint8_t>(word >> (j * 8));
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string token;
    token.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            token.push_back('-');
        }
        token.push_back(kHexDigits[bytes[i] >> 4]);
        token.push_back(kHexDigits[bytes[i] & 0x0F]);
    }
    return token;
}

bool is_uuid_format(std::string_view token) noexcept {
    if (token.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
        const bool dash_position = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash_position) {
            if (token[i] != '-') {
                return false;
            }
        } else if (std::isxdigit(static_cast<unsigned char>(token[i])) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace mcpsrv
