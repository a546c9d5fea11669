/// @file mark_record.hpp
/// @brief Position classes, mark records and the preserved-text pair.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace punctuation_cpp {

/// Where a mark run sits relative to the line it was taken from.
enum class Position : std::uint8_t {
    begin,   ///< First run of the line, touching its start.
    end,     ///< Last run of the line, touching its end.
    middle,  ///< Any other run; splits two chunks of the same line.
    alone,   ///< The run is the whole line.
};

/// Convert a Position to its string representation.
constexpr auto to_string_view(Position position) noexcept -> std::string_view {
    switch (position) {
        case Position::begin:  return "begin";
        case Position::end:    return "end";
        case Position::middle: return "middle";
        case Position::alone:  return "alone";
    }
    return "unknown";
}

/// Parse the string produced by to_string_view(Position).
constexpr auto position_from_string(std::string_view name) noexcept
    -> std::optional<Position> {
    if (name == "begin")  return Position::begin;
    if (name == "end")    return Position::end;
    if (name == "middle") return Position::middle;
    if (name == "alone")  return Position::alone;
    return std::nullopt;
}

/// A mark run removed by Punctuator::preserve().
///
/// Records carry no identity beyond their place in the sequence: restore()
/// consumes them strictly in the order preserve() produced them, matching
/// each one to an output line through line_index.
struct MarkRecord {
    std::size_t line_index;  ///< Index of the source line in the preserved input.
    std::string text;        ///< The run verbatim, including enclosed whitespace.
    Position position;       ///< Placement of the run within its line.

    auto operator==(const MarkRecord&) const -> bool = default;
};

/// Output of Punctuator::preserve(): punctuation-free chunks plus the
/// records needed to put the punctuation back.
///
/// chunks holds only non-empty fragments, in line order and left to right
/// within each line.
struct PreservedText {
    std::vector<std::string> chunks;
    std::vector<MarkRecord> marks;

    auto operator==(const PreservedText&) const -> bool = default;
};

}  // namespace punctuation_cpp
