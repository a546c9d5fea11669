#include <punctuation-cpp/punctuator.hpp>

#include "debug_log.hpp"
#include "digit_guard.hpp"
#include "executor.hpp"
#include "unicode/utf8.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace punctuation_cpp {

// Below this many lines per batch the task overhead outweighs the work.
static constexpr std::size_t min_batch_lines = 64;

Punctuator::Punctuator(PunctuatorOptions options)
    : matcher_{options.marks}, batch_size_{options.batch_size} {}

Punctuator::Punctuator(std::string_view marks)
    : matcher_{marks}, batch_size_{0} {}

Punctuator::Punctuator(MarkMatcher matcher, std::size_t batch_size)
    : matcher_{std::move(matcher)}, batch_size_{batch_size} {}

// =============================================================================
// Removal
// =============================================================================

auto Punctuator::remove(std::string_view text) const -> std::string {
    return matcher_.remove(text);
}

auto Punctuator::remove(const std::vector<std::string>& lines) const
    -> std::vector<std::string> {
    return matcher_.remove(lines);
}

// =============================================================================
// Preservation
// =============================================================================

void Punctuator::preserve_line(std::string_view line, std::size_t line_index,
                               PreservedText& out) const {
    const auto escaped = detail::protect_digits(line);
    auto units = matcher_.detect(escaped);

    if (units.empty()) {
        if (!line.empty()) out.chunks.emplace_back(line);
        return;
    }

    // The line is made only of punctuation.
    if (units.size() == 1 && units.front().begin == 0 &&
        units.front().end == escaped.size()) {
        out.marks.push_back(MarkRecord{
            .line_index = line_index,
            .text = std::move(units.front().text),
            .position = Position::alone,
        });
        return;
    }

    const auto emit_chunk = [&out](std::string_view fragment) {
        if (!fragment.empty()) out.chunks.push_back(detail::restore_digits(fragment));
    };

    const auto view = std::string_view{escaped};
    auto previous_end = std::size_t{0};
    for (std::size_t i = 0; i < units.size(); ++i) {
        auto& unit = units[i];

        auto position = Position::middle;
        if (i == 0 && unit.begin == 0) {
            position = Position::begin;
        } else if (i + 1 == units.size() && unit.end == escaped.size()) {
            position = Position::end;
        }

        emit_chunk(view.substr(previous_end, unit.begin - previous_end));
        previous_end = unit.end;
        out.marks.push_back(MarkRecord{
            .line_index = line_index,
            .text = std::move(unit.text),
            .position = position,
        });
    }
    emit_chunk(view.substr(previous_end));
}

auto Punctuator::preserve(std::string_view line) const -> PreservedText {
    auto result = PreservedText{};
    preserve_line(line, 0, result);
    return result;
}

auto Punctuator::preserve(const std::vector<std::string>& lines) const -> PreservedText {
    auto result = PreservedText{};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        preserve_line(lines[i], i, result);
    }
    return result;
}

auto Punctuator::preserve_parallel(const std::vector<std::string>& lines) const
    -> PreservedText {
    auto& executor = detail::global_executor();

    auto batch = batch_size_;
    if (batch == 0) {
        const auto workers = std::max<std::size_t>(executor.num_workers(), 1);
        batch = std::max((lines.size() + workers - 1) / workers, min_batch_lines);
    }
    if (lines.size() <= batch) return preserve(lines);

    const auto batch_count = (lines.size() + batch - 1) / batch;
    detail::debug_log("preserving ", lines.size(), " lines in ", batch_count,
                      " batches of ", batch);

    // Each batch writes only its own slot; line indices stay global.
    auto partials = std::vector<PreservedText>(batch_count);
    auto taskflow = tf::Taskflow{};
    for (std::size_t b = 0; b < batch_count; ++b) {
        taskflow.emplace([this, &lines, &partials, b, batch] {
            const auto first = b * batch;
            const auto last = std::min(first + batch, lines.size());
            for (auto i = first; i < last; ++i) {
                preserve_line(lines[i], i, partials[b]);
            }
        });
    }
    executor.run(taskflow).wait();

    auto result = PreservedText{};
    auto chunk_count = std::size_t{0};
    auto mark_count = std::size_t{0};
    for (const auto& part : partials) {
        chunk_count += part.chunks.size();
        mark_count += part.marks.size();
    }
    result.chunks.reserve(chunk_count);
    result.marks.reserve(mark_count);
    for (auto& part : partials) {
        std::ranges::move(part.chunks, std::back_inserter(result.chunks));
        std::ranges::move(part.marks, std::back_inserter(result.marks));
    }
    return result;
}

// =============================================================================
// Restoration
// =============================================================================

auto Punctuator::restore(std::vector<std::string> chunks,
                         const std::vector<MarkRecord>& marks)
    -> std::vector<std::string> {
    auto lines = std::vector<std::string>{};
    lines.reserve(chunks.size() + 1);

    auto chunk = std::size_t{0};  // next unconsumed chunk
    auto mark = std::size_t{0};   // next unconsumed mark
    auto num = std::size_t{0};    // index of the line being rebuilt

    while (true) {
        if (mark == marks.size()) {
            if (chunk < chunks.size()) {
                detail::debug_log("restore: ", chunks.size() - chunk,
                                  " chunk(s) after the last mark, emitted as they are");
            }
            std::move(chunks.begin() + static_cast<std::ptrdiff_t>(chunk), chunks.end(),
                      std::back_inserter(lines));
            break;
        }

        // Nothing left to attach marks to: they form the last line together.
        if (chunk == chunks.size()) {
            detail::debug_log("restore: ", marks.size() - mark,
                              " mark(s) left after the last chunk, joined into one line");
            auto tail = std::string{};
            for (; mark < marks.size(); ++mark) {
                tail += marks[mark].text;
            }
            lines.push_back(std::move(tail));
            break;
        }

        const auto& current = marks[mark];
        if (current.line_index != num) {
            lines.push_back(std::move(chunks[chunk]));
            ++chunk;
            ++num;
            continue;
        }

        auto& head = chunks[chunk];
        head.erase(unicode::trim_right(head).size());
        ++mark;

        switch (current.position) {
            case Position::begin:
                head.insert(0, current.text);
                break;

            case Position::end:
                head += current.text;
                lines.push_back(std::move(head));
                ++chunk;
                ++num;
                break;

            case Position::alone:
                lines.push_back(current.text);
                ++num;
                break;

            case Position::middle:
                head += current.text;
                if (chunk + 1 == chunks.size()) {
                    // The text after the mark never came back from processing.
                    detail::debug_log("restore: middle mark \"", current.text,
                                      "\" on line ", num,
                                      " has no following chunk, appended to the last one");
                } else {
                    head += chunks[chunk + 1];
                    chunks[chunk + 1] = std::move(head);
                    ++chunk;
                }
                break;
        }
    }
    return lines;
}

auto Punctuator::restore(const PreservedText& preserved) -> std::vector<std::string> {
    return restore(preserved.chunks, preserved.marks);
}

}  // namespace punctuation_cpp
