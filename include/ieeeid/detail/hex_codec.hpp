#pragma once

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>

namespace ieeeid::detail {

/**
 * Hex codec for identifier text forms.
 *
 * Rendering always produces two uppercase digits per byte. Decoding is
 * case-insensitive and tolerant of delimiter noise: extract_bytes() keeps
 * every adjacent pair of hex digits and skips everything else, so
 * "00:1b:63", "00-1B-63" and "001B63" all decode to the same three bytes.
 */

inline constexpr std::array<char, 16> hex_digits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                    '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

constexpr bool is_hex_digit(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}

// Nibble value of a hex digit; caller guarantees is_hex_digit(c)
constexpr uint8_t hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return static_cast<uint8_t>(c - '0');
    }
    if (c >= 'A' && c <= 'F') {
        return static_cast<uint8_t>(c - 'A' + 10);
    }
    return static_cast<uint8_t>(c - 'a' + 10);
}

constexpr std::array<char, 2> byte_to_hex_chars(uint8_t b) noexcept {
    return {hex_digits[b >> 4], hex_digits[b & 0x0F]};
}

inline std::string byte_to_hex(uint8_t b) {
    const auto chars = byte_to_hex_chars(b);
    return std::string(chars.data(), chars.size());
}

// Precondition: exactly two hex digits
constexpr uint8_t hex_pair_to_byte(std::string_view pair) noexcept {
    assert(pair.size() == 2 && is_hex_digit(pair[0]) && is_hex_digit(pair[1]));
    return static_cast<uint8_t>((hex_digit_value(pair[0]) << 4) | hex_digit_value(pair[1]));
}

/**
 * Extract bytes from arbitrary text containing hex digit pairs.
 *
 * Scans left to right. A hex digit immediately followed by another hex
 * digit yields one byte and both characters are consumed. Any other
 * character, including a hex digit without a partner, is skipped.
 *
 * @param text Input such as "00:1B:63:84:45:E6"
 * @return Decoded bytes in input order (may be empty)
 */
inline std::vector<uint8_t> extract_bytes(std::string_view text) {
    std::vector<uint8_t> bytes;
    bytes.reserve(text.size() / 2);

    std::size_t i = 0;
    while (i < text.size()) {
        if (i + 1 < text.size() && is_hex_digit(text[i]) && is_hex_digit(text[i + 1])) {
            bytes.push_back(hex_pair_to_byte(text.substr(i, 2)));
            i += 2;
        } else {
            ++i;
        }
    }
    return bytes;
}

// Two uppercase digits per byte, joined with `delimiter`
inline std::string join_hex(std::span<const uint8_t> bytes, char delimiter) {
    std::string out;
    if (bytes.empty()) {
        return out;
    }
    out.reserve(bytes.size() * 3 - 1);

    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            out.push_back(delimiter);
        }
        const auto chars = byte_to_hex_chars(bytes[i]);
        out.push_back(chars[0]);
        out.push_back(chars[1]);
    }
    return out;
}

} // namespace ieeeid::detail
