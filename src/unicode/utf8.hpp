#pragma once

// UTF-8 code point decoding/encoding and the character classes the mark
// rule is built from.
// Decoding never fails: an ill-formed sequence is reported as a single
// opaque byte so callers can copy it through unchanged.
// Internal header, not installed.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <unicode/uchar.h>

namespace punctuation_cpp::unicode {

inline constexpr char32_t replacement_character = 0xFFFD;
inline constexpr char32_t max_code_point = 0x10FFFF;

// -- Decoding -----------------------------------------------------------------

// Result of decoding one code point: value + number of bytes consumed.
// An ill-formed sequence yields replacement_character, bytes_read = 1 and
// valid = false.
struct DecodeResult {
    char32_t value;
    std::size_t bytes_read;
    bool valid;
};

// Decode the code point starting at `offset`. Requires offset < text.size().
inline auto decode(std::string_view text, std::size_t offset) -> DecodeResult {
    constexpr auto ill_formed = DecodeResult{
        .value = replacement_character, .bytes_read = 1, .valid = false};

    const auto lead = static_cast<unsigned char>(text[offset]);
    if (lead < 0x80) {
        return DecodeResult{.value = lead, .bytes_read = 1, .valid = true};
    }

    auto length = std::size_t{0};
    auto value = char32_t{0};
    auto min_value = char32_t{0};
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        value = lead & 0x1F;
        min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        value = lead & 0x0F;
        min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        value = lead & 0x07;
        min_value = 0x10000;
    } else {
        return ill_formed;  // stray continuation byte or 0xF8..0xFF
    }

    if (text.size() - offset < length) return ill_formed;  // truncated

    for (std::size_t i = 1; i < length; ++i) {
        const auto byte = static_cast<unsigned char>(text[offset + i]);
        if ((byte & 0xC0) != 0x80) return ill_formed;
        value = (value << 6) | (byte & 0x3F);
    }

    // overlong forms, surrogates and values past U+10FFFF
    if (value < min_value || value > max_code_point ||
        (value >= 0xD800 && value <= 0xDFFF)) {
        return ill_formed;
    }
    return DecodeResult{.value = value, .bytes_read = length, .valid = true};
}

// Check that every byte of `text` belongs to a well-formed code point.
inline auto is_valid(std::string_view text) -> bool {
    for (std::size_t pos = 0; pos < text.size();) {
        const auto cp = decode(text, pos);
        if (!cp.valid) return false;
        pos += cp.bytes_read;
    }
    return true;
}

// -- Encoding -----------------------------------------------------------------

// Encode a scalar value as UTF-8, appending bytes to output.
inline void encode(char32_t value, std::string& output) {
    if (value < 0x80) {
        output.push_back(static_cast<char>(value));
    } else if (value < 0x800) {
        output.push_back(static_cast<char>(0xC0 | (value >> 6)));
        output.push_back(static_cast<char>(0x80 | (value & 0x3F)));
    } else if (value < 0x10000) {
        output.push_back(static_cast<char>(0xE0 | (value >> 12)));
        output.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (value & 0x3F)));
    } else {
        output.push_back(static_cast<char>(0xF0 | (value >> 18)));
        output.push_back(static_cast<char>(0x80 | ((value >> 12) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (value & 0x3F)));
    }
}

// Encode a scalar value as UTF-8, returning the bytes.
inline auto encode(char32_t value) -> std::string {
    auto result = std::string{};
    encode(value, result);
    return result;
}

// -- Character classes --------------------------------------------------------

// Unicode whitespace, the same set str.isspace() accepts.
constexpr auto is_space(char32_t c) noexcept -> bool {
    if (c <= 0x20) {
        return c == 0x20 || (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x1F);
    }
    if (c < 0x85) return false;
    return c == 0x85 || c == 0xA0 || c == 0x1680 ||
           (c >= 0x2000 && c <= 0x200A) ||
           c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F ||
           c == 0x3000;
}

// Unicode decimal digits (general category Nd), in any script.
inline auto is_digit(char32_t c) -> bool {
    return c <= max_code_point && u_isdigit(static_cast<UChar32>(c)) != 0;
}

// -- Trimming -----------------------------------------------------------------

// Drop trailing whitespace code points.
inline auto trim_right(std::string_view text) -> std::string_view {
    auto end = std::size_t{0};
    for (std::size_t pos = 0; pos < text.size();) {
        const auto cp = decode(text, pos);
        pos += cp.bytes_read;
        if (!is_space(cp.value)) end = pos;
    }
    return text.substr(0, end);
}

// Drop leading and trailing whitespace code points.
inline auto trim(std::string_view text) -> std::string_view {
    auto begin = std::size_t{0};
    while (begin < text.size()) {
        const auto cp = decode(text, begin);
        if (!is_space(cp.value)) break;
        begin += cp.bytes_read;
    }
    return trim_right(text.substr(begin));
}

}  // namespace punctuation_cpp::unicode
