/// @file punctuator.hpp
/// @brief The Punctuator class -- preserves punctuation across a text engine.

#pragma once

#include <punctuation-cpp/mark_matcher.hpp>
#include <punctuation-cpp/mark_record.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace punctuation_cpp {

/// The default mark set: ; : , . ! ? ¡ ¿ — … " « » “ ” (UTF-8).
constexpr auto default_marks() noexcept -> std::string_view {
    return ";:,.!?"
           "\xC2\xA1"        // ¡
           "\xC2\xBF"        // ¿
           "\xE2\x80\x94"    // —
           "\xE2\x80\xA6"    // …
           "\""
           "\xC2\xAB"        // «
           "\xC2\xBB"        // »
           "\xE2\x80\x9C"    // “
           "\xE2\x80\x9D";   // ”
}

/// Construction options for a Punctuator.
struct PunctuatorOptions {
    /// UTF-8 set of single-character marks.
    std::string marks{default_marks()};

    /// Lines per task for preserve_parallel(). 0 derives a size from the
    /// executor's worker count.
    std::size_t batch_size = 0;
};

/// Hides punctuation from a text-processing engine and restores it after.
///
/// preserve() splits lines into punctuation-free chunks and records every
/// removed mark run with its line and position. The chunks go through the
/// engine, which must return the same number of chunks in the same order.
/// restore() then interleaves the processed chunks with the recorded marks.
///
/// @code
/// auto p = Punctuator{PunctuatorOptions{}};
/// auto preserved = p.preserve(std::vector<std::string>{"hello, my world!"});
/// // preserved.chunks == {"hello", "my world"}
/// auto lines = Punctuator::restore({"HELLO", "MY WORLD"}, preserved.marks);
/// // lines == {"HELLO, MY WORLD!"}
/// @endcode
///
/// A Punctuator is immutable once constructed; all operations are const
/// and may run concurrently on the same instance.
class Punctuator {
public:
    /// Construct from options.
    /// @throws Exception with ErrorKind::invalid_configuration on a bad mark set.
    explicit Punctuator(PunctuatorOptions options);

    /// Construct from a mark set with default batching.
    /// @throws Exception with ErrorKind::invalid_configuration on a bad mark set.
    explicit Punctuator(std::string_view marks);

    /// Construct around an already configured matcher.
    explicit Punctuator(MarkMatcher matcher, std::size_t batch_size = 0);

    auto matcher() const -> const MarkMatcher& { return matcher_; }
    auto marks() const -> const std::string& { return matcher_.marks(); }
    auto batch_size() const -> std::size_t { return batch_size_; }

    // -- Removal --------------------------------------------------------------

    /// Strip punctuation from a line. No restoration data is kept.
    auto remove(std::string_view text) const -> std::string;

    /// Strip punctuation from each line.
    auto remove(const std::vector<std::string>& lines) const
        -> std::vector<std::string>;

    // -- Preservation ---------------------------------------------------------

    /// Preserve a single line, treated as a one-line input.
    auto preserve(std::string_view line) const -> PreservedText;

    /// Split lines into punctuation-free chunks and ordered mark records.
    ///
    /// Empty chunks are dropped. Every MarkRecord::line_index refers to the
    /// position of its line in `lines`.
    auto preserve(const std::vector<std::string>& lines) const -> PreservedText;

    /// Same result as preserve(lines), computed in batches on the global
    /// executor. Inputs that fit one batch are processed inline.
    auto preserve_parallel(const std::vector<std::string>& lines) const
        -> PreservedText;

    // -- Restoration ----------------------------------------------------------

    /// Rebuild punctuated lines from processed chunks and preserved marks.
    ///
    /// `chunks` must match the chunks returned by preserve() in count and
    /// order. Misaligned input is not rejected: marks left over once the
    /// chunks run out form one final line, and a middle mark with no
    /// following chunk is appended to the last chunk.
    static auto restore(std::vector<std::string> chunks,
                        const std::vector<MarkRecord>& marks)
        -> std::vector<std::string>;

    /// Restore a PreservedText whose chunks were left unprocessed.
    static auto restore(const PreservedText& preserved) -> std::vector<std::string>;

private:
    void preserve_line(std::string_view line, std::size_t line_index,
                       PreservedText& out) const;

    MarkMatcher matcher_;
    std::size_t batch_size_;
};

}  // namespace punctuation_cpp
