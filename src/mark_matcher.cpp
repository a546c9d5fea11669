#include <punctuation-cpp/mark_matcher.hpp>
#include <punctuation-cpp/error.hpp>

#include "unicode/utf8.hpp"

#include <algorithm>
#include <utility>

namespace punctuation_cpp {

namespace {

auto require_marks(const char* marks) -> std::string_view {
    if (marks == nullptr) {
        throw Exception{ErrorKind::invalid_configuration,
                        "punctuation marks must be a character sequence, got null"};
    }
    return marks;
}

}  // namespace

MarkMatcher::MarkMatcher(std::string_view marks) {
    if (auto error = validate_marks(marks)) {
        throw Exception{std::move(*error)};
    }

    for (std::size_t pos = 0; pos < marks.size();) {
        const auto cp = unicode::decode(marks, pos);
        auto it = std::ranges::lower_bound(code_points_, cp.value);
        if (it == code_points_.end() || *it != cp.value) {
            code_points_.insert(it, cp.value);
            marks_.append(marks.substr(pos, cp.bytes_read));
        }
        pos += cp.bytes_read;
    }
}

MarkMatcher::MarkMatcher(const char* marks)
    : MarkMatcher{require_marks(marks)} {}

auto MarkMatcher::is_mark(char32_t code_point) const -> bool {
    return std::ranges::binary_search(code_points_, code_point);
}

auto MarkMatcher::detect(std::string_view line) const -> std::vector<MarkUnit> {
    auto units = std::vector<MarkUnit>{};
    if (code_points_.empty()) return units;

    // Ill-formed bytes decode to U+FFFD; they must not match a configured U+FFFD.
    const auto is_mark_at = [this](const unicode::DecodeResult& cp) {
        return cp.valid && is_mark(cp.value);
    };

    auto pos = std::size_t{0};
    while (pos < line.size()) {
        // A run opens on a mark, or on the whitespace leading up to one.
        auto probe = pos;
        while (probe < line.size()) {
            const auto cp = unicode::decode(line, probe);
            if (is_mark_at(cp) || !unicode::is_space(cp.value)) break;
            probe += cp.bytes_read;
        }
        if (probe == line.size()) break;

        const auto first = unicode::decode(line, probe);
        if (!is_mark_at(first)) {
            pos = probe + first.bytes_read;
            continue;
        }

        // The run then takes every following mark and whitespace.
        auto end = probe + first.bytes_read;
        while (end < line.size()) {
            const auto cp = unicode::decode(line, end);
            if (!is_mark_at(cp) && !unicode::is_space(cp.value)) break;
            end += cp.bytes_read;
        }

        units.push_back(MarkUnit{
            .text = std::string{line.substr(pos, end - pos)},
            .begin = pos,
            .end = end,
        });
        pos = end;
    }
    return units;
}

auto MarkMatcher::remove(std::string_view text) const -> std::string {
    auto result = std::string{};
    result.reserve(text.size());

    auto previous_end = std::size_t{0};
    for (const auto& unit : detect(text)) {
        result.append(text.substr(previous_end, unit.begin - previous_end));
        result.push_back(' ');
        previous_end = unit.end;
    }
    result.append(text.substr(previous_end));

    return std::string{unicode::trim(result)};
}

auto MarkMatcher::remove(const std::vector<std::string>& lines) const
    -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(lines.size());
    for (const auto& line : lines) {
        result.push_back(remove(line));
    }
    return result;
}

}  // namespace punctuation_cpp
