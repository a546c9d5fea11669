/// @file mark_matcher.hpp
/// @brief MarkMatcher -- recognizes runs of punctuation marks in a line.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace punctuation_cpp {

/// A single run of marks found by MarkMatcher::detect().
///
/// Offsets are byte offsets into the UTF-8 line, half-open [begin, end).
struct MarkUnit {
    std::string text;   ///< The matched run, whitespace included.
    std::size_t begin;  ///< Offset of the first byte of the run.
    std::size_t end;    ///< Offset one past the last byte of the run.

    auto operator==(const MarkUnit&) const -> bool = default;
};

/// Matches maximal runs of "whitespace* marks+ whitespace*" in a line.
///
/// A MarkMatcher is configured once from a set of single-character marks
/// and is immutable afterwards, so one instance may be shared freely
/// between threads. Marks are Unicode code points given as UTF-8; any
/// repeated mark is only considered once.
///
/// @code
/// auto matcher = MarkMatcher{",!"};
/// matcher.remove("hello, my world!");   // "hello my world"
/// matcher.detect("hello, my world!");   // {", ", 5, 7}, {"!", 15, 16}
/// @endcode
class MarkMatcher {
public:
    /// Configure from a UTF-8 mark set.
    /// @throws Exception with ErrorKind::invalid_configuration if the set
    ///   is not well-formed UTF-8 or holds a reserved code point.
    explicit MarkMatcher(std::string_view marks);

    /// Configure from a C string.
    /// @throws Exception with ErrorKind::invalid_configuration if marks is
    ///   null, or for the same reasons as the string_view overload.
    explicit MarkMatcher(const char* marks);

    /// The configured marks, duplicates collapsed, in order of first occurrence.
    auto marks() const -> const std::string& { return marks_; }

    /// Check if a code point is one of the configured marks.
    auto is_mark(char32_t code_point) const -> bool;

    /// Find every mark run in a line, leftmost first, without overlap.
    auto detect(std::string_view line) const -> std::vector<MarkUnit>;

    /// Replace each mark run by a single space, then trim the line.
    auto remove(std::string_view text) const -> std::string;

    /// Apply remove() to each line.
    auto remove(const std::vector<std::string>& lines) const
        -> std::vector<std::string>;

private:
    std::string marks_;
    std::vector<char32_t> code_points_;  // sorted, unique
};

}  // namespace punctuation_cpp
