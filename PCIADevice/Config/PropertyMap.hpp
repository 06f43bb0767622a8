// PropertyMap.hpp
// PCIA - host property dictionary
//
// String key/value properties supplied by the embedding host (the analogue of
// a driver's personality properties). Values are parsed on demand; a missing
// or malformed value yields std::nullopt so callers keep their defaults.

#pragma once

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace PCIA::Config {

using PropertyMap = std::map<std::string, std::string, std::less<>>;

/// Parse a decimal or 0x-prefixed hexadecimal unsigned integer.
[[nodiscard]] inline std::optional<uint64_t> ParseUnsigned(std::string_view text) noexcept {
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
        base = 16;
    }
    if (text.empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Accepts true/false, yes/no, 1/0.
[[nodiscard]] inline std::optional<bool> ParseBool(std::string_view text) noexcept {
    if (text == "true" || text == "yes" || text == "1") {
        return true;
    }
    if (text == "false" || text == "no" || text == "0") {
        return false;
    }
    return std::nullopt;
}

[[nodiscard]] inline const std::string* FindProperty(const PropertyMap& properties,
                                                     std::string_view key) noexcept {
    const auto it = properties.find(key);
    return it != properties.end() ? &it->second : nullptr;
}

} // namespace PCIA::Config
