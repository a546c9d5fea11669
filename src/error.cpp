#include <punctuation-cpp/error.hpp>

#include "digit_guard.hpp"
#include "unicode/utf8.hpp"

#include <cstddef>
#include <string>

namespace punctuation_cpp {

namespace {

auto code_point_to_hex(char32_t value) -> std::string {
    static constexpr char hex_chars[] = "0123456789ABCDEF";
    auto digits = std::string{};
    do {
        digits.insert(digits.begin(), hex_chars[value & 0xF]);
        value >>= 4;
    } while (value != 0);
    while (digits.size() < 4) digits.insert(digits.begin(), '0');
    return "U+" + digits;
}

}  // namespace

auto validate_marks(std::string_view marks) -> std::optional<Error> {
    for (std::size_t pos = 0; pos < marks.size();) {
        const auto cp = unicode::decode(marks, pos);
        if (!cp.valid) {
            return Error{ErrorKind::invalid_configuration,
                         "punctuation marks must be valid UTF-8, ill-formed byte at offset " +
                             std::to_string(pos)};
        }
        if (detail::is_reserved(cp.value)) {
            return Error{ErrorKind::invalid_configuration,
                         "punctuation marks must not contain reserved code point " +
                             code_point_to_hex(cp.value)};
        }
        pos += cp.bytes_read;
    }
    return std::nullopt;
}

}  // namespace punctuation_cpp
