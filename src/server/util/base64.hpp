#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace base64 {

namespace detail {

constexpr std::array<int8_t, 256> make_table() {
    std::array<int8_t, 256> t{};
    for (auto& v : t) v = -1;
    constexpr std::string_view alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    for (size_t i = 0; i < alphabet.size(); i++) {
        t[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
    }
    // URL-safe alphabet
    t[static_cast<uint8_t>('-')] = 62;
    t[static_cast<uint8_t>('_')] = 63;
    return t;
}

inline constexpr auto kTable = make_table();

} // namespace detail

// Strips a "data:<mime>;base64," prefix if present.
inline std::string_view strip_data_uri(std::string_view in) {
    if (in.starts_with("data:")) {
        auto comma = in.find(',');
        if (comma != std::string_view::npos) return in.substr(comma + 1);
    }
    return in;
}

// Whitespace is skipped, padding is optional. Returns nullopt on any other
// character outside the alphabet, misplaced padding or a dangling sextet.
inline std::optional<std::vector<uint8_t>> decode(std::string_view in) {
    in = strip_data_uri(in);

    std::vector<uint8_t> out;
    out.reserve(in.size() / 4 * 3);

    uint32_t acc = 0;
    int bits = 0;
    int count = 0;
    bool padding = false;

    for (char c : in) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        if (padding) return std::nullopt;

        int8_t v = detail::kTable[static_cast<uint8_t>(c)];
        if (v < 0) return std::nullopt;

        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        count++;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }

    if (count % 4 == 1) return std::nullopt;
    return out;
}

} // namespace base64
