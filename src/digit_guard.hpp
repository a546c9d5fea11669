#pragma once

// Digit guard: hides separators inside numbers ("3,14", "2.5") from the
// mark rule by swapping them for reserved placeholders before matching,
// and swaps them back in every chunk afterwards.
//
// Placeholders come from the Unicode noncharacter block U+FDD0..U+FDEF.
// MarkMatcher refuses to be configured with any code point of that block.
// Input may still carry the placeholder code points themselves; those are
// prefixed with EscapeToken::literal so restore_digits() gives them back
// unchanged.
// Internal header, not installed.

#include "unicode/utf8.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace punctuation_cpp::detail {

inline constexpr char32_t reserved_first = 0xFDD0;
inline constexpr char32_t reserved_last = 0xFDEF;

// One placeholder per protected separator, plus the prefix that marks a
// placeholder code point found in the input.
enum class EscapeToken : char32_t {
    comma = 0xFDD0,
    period = 0xFDD1,
    literal = 0xFDD2,
};

constexpr auto is_reserved(char32_t c) noexcept -> bool {
    return c >= reserved_first && c <= reserved_last;
}

// The placeholder standing for `c`, if `c` is a protected separator.
constexpr auto escape_token_for(char32_t c) noexcept -> std::optional<EscapeToken> {
    switch (c) {
        case U',': return EscapeToken::comma;
        case U'.': return EscapeToken::period;
        default:   return std::nullopt;
    }
}

// The separator a placeholder stands for.
constexpr auto separator_for(EscapeToken token) noexcept -> char {
    switch (token) {
        case EscapeToken::comma:  return ',';
        case EscapeToken::period: return '.';
        case EscapeToken::literal: break;
    }
    return '\0';
}

// True for code points restore_digits() would rewrite.
constexpr auto is_escape_token(char32_t c) noexcept -> bool {
    return c >= static_cast<char32_t>(EscapeToken::comma) &&
           c <= static_cast<char32_t>(EscapeToken::literal);
}

// Replace every protected separator whose neighbours are both decimal
// digits, in any script. Escape tokens already present are prefixed with
// EscapeToken::literal.
inline auto protect_digits(std::string_view line) -> std::string {
    auto result = std::string{};
    result.reserve(line.size());

    auto previous_is_digit = false;
    for (std::size_t pos = 0; pos < line.size();) {
        const auto cp = unicode::decode(line, pos);
        const auto bytes = line.substr(pos, cp.bytes_read);
        pos += cp.bytes_read;

        const auto token = cp.valid ? escape_token_for(cp.value) : std::nullopt;
        if (token && previous_is_digit && pos < line.size()) {
            const auto next = unicode::decode(line, pos);
            if (next.valid && unicode::is_digit(next.value)) {
                unicode::encode(static_cast<char32_t>(*token), result);
                previous_is_digit = false;
                continue;
            }
        }

        if (cp.valid && is_escape_token(cp.value)) {
            unicode::encode(static_cast<char32_t>(EscapeToken::literal), result);
        }
        result.append(bytes);
        previous_is_digit = cp.valid && unicode::is_digit(cp.value);
    }
    return result;
}

// Undo protect_digits().
inline auto restore_digits(std::string_view chunk) -> std::string {
    // Every escape token encodes as EF B7 9x.
    if (chunk.find("\xEF\xB7") == std::string_view::npos) {
        return std::string{chunk};
    }

    auto result = std::string{};
    result.reserve(chunk.size());
    for (std::size_t pos = 0; pos < chunk.size();) {
        const auto cp = unicode::decode(chunk, pos);
        const auto token = static_cast<EscapeToken>(cp.value);
        if (!cp.valid || !is_escape_token(cp.value)) {
            result.append(chunk.substr(pos, cp.bytes_read));
            pos += cp.bytes_read;
        } else if (token == EscapeToken::literal && pos + cp.bytes_read < chunk.size()) {
            pos += cp.bytes_read;
            const auto escaped = unicode::decode(chunk, pos);
            result.append(chunk.substr(pos, escaped.bytes_read));
            pos += escaped.bytes_read;
        } else if (token == EscapeToken::literal) {
            result.append(chunk.substr(pos, cp.bytes_read));
            pos += cp.bytes_read;
        } else {
            result.push_back(separator_for(token));
            pos += cp.bytes_read;
        }
    }
    return result;
}

}  // namespace punctuation_cpp::detail
