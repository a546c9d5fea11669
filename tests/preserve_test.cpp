#include <punctuation-cpp/punctuation.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace pc = punctuation_cpp;

using Lines = std::vector<std::string>;
using Marks = std::vector<pc::MarkRecord>;

namespace {

auto defaults() -> pc::Punctuator {
    return pc::Punctuator{pc::PunctuatorOptions{}};
}

}  // namespace

// =============================================================================
// Single line shapes
// =============================================================================

TEST(Preserve, middle_and_end_marks) {
    auto p = pc::Punctuator{",!"};
    auto preserved = p.preserve(Lines{"hello, my world!"});

    EXPECT_EQ(preserved.chunks, (Lines{"hello", "my world"}));
    EXPECT_EQ(preserved.marks, (Marks{
        {0, ", ", pc::Position::middle},
        {0, "!", pc::Position::end},
    }));
}

TEST(Preserve, begin_and_end_marks) {
    auto preserved = defaults().preserve(Lines{"\xC2\xA1" "Hola!"});

    EXPECT_EQ(preserved.chunks, (Lines{"Hola"}));
    EXPECT_EQ(preserved.marks, (Marks{
        {0, "\xC2\xA1", pc::Position::begin},
        {0, "!", pc::Position::end},
    }));
}

TEST(Preserve, line_of_marks_only_is_alone) {
    auto p = pc::Punctuator{"!"};
    auto preserved = p.preserve(Lines{"!!!"});

    EXPECT_TRUE(preserved.chunks.empty());
    EXPECT_EQ(preserved.marks, (Marks{{0, "!!!", pc::Position::alone}}));
}

TEST(Preserve, alone_run_keeps_its_whitespace) {
    auto p = pc::Punctuator{"!."};
    auto preserved = p.preserve(Lines{" !. ! "});

    EXPECT_TRUE(preserved.chunks.empty());
    EXPECT_EQ(preserved.marks, (Marks{{0, " !. ! ", pc::Position::alone}}));
}

TEST(Preserve, line_without_marks_is_one_untouched_chunk) {
    auto preserved = defaults().preserve(Lines{"  no marks here  "});

    EXPECT_EQ(preserved.chunks, (Lines{"  no marks here  "}));
    EXPECT_TRUE(preserved.marks.empty());
}

TEST(Preserve, mark_between_words_is_middle) {
    auto preserved = defaults().preserve(Lines{"a,b"});

    EXPECT_EQ(preserved.chunks, (Lines{"a", "b"}));
    EXPECT_EQ(preserved.marks, (Marks{{0, ",", pc::Position::middle}}));
}

TEST(Preserve, several_middle_marks_keep_order) {
    auto preserved = defaults().preserve(Lines{"one; two: three, four"});

    EXPECT_EQ(preserved.chunks, (Lines{"one", "two", "three", "four"}));
    EXPECT_EQ(preserved.marks, (Marks{
        {0, "; ", pc::Position::middle},
        {0, ": ", pc::Position::middle},
        {0, ", ", pc::Position::middle},
    }));
}

TEST(Preserve, end_run_takes_trailing_whitespace) {
    auto preserved = defaults().preserve(Lines{"hi! "});

    EXPECT_EQ(preserved.chunks, (Lines{"hi"}));
    EXPECT_EQ(preserved.marks, (Marks{{0, "! ", pc::Position::end}}));
}

TEST(Preserve, quoted_sentence) {
    // He said: «yes».
    auto preserved = defaults().preserve(Lines{"He said: \xC2\xAByes\xC2\xBB."});

    EXPECT_EQ(preserved.chunks, (Lines{"He said", "yes"}));
    EXPECT_EQ(preserved.marks, (Marks{
        {0, ": \xC2\xAB", pc::Position::middle},
        {0, "\xC2\xBB.", pc::Position::end},
    }));
}

TEST(Preserve, single_line_overload_matches_vector_overload) {
    auto p = defaults();
    EXPECT_EQ(p.preserve("What? No, never."), p.preserve(Lines{"What? No, never."}));
}

TEST(Preserve, empty_mark_set_keeps_every_line) {
    auto p = pc::Punctuator{""};
    auto preserved = p.preserve(Lines{"a, b!", "c"});

    EXPECT_EQ(preserved.chunks, (Lines{"a, b!", "c"}));
    EXPECT_TRUE(preserved.marks.empty());
}

// =============================================================================
// Digit protection
// =============================================================================

TEST(PreserveDigits, decimal_comma_is_not_a_mark) {
    auto p = pc::Punctuator{",."};
    auto preserved = p.preserve(Lines{"3,14 is pi."});

    EXPECT_EQ(preserved.chunks, (Lines{"3,14 is pi"}));
    EXPECT_EQ(preserved.marks, (Marks{{0, ".", pc::Position::end}}));
}

TEST(PreserveDigits, grouped_number_survives_intact) {
    auto preserved = defaults().preserve(Lines{"It costs 1,000.50 dollars."});

    EXPECT_EQ(preserved.chunks, (Lines{"It costs 1,000.50 dollars"}));
    EXPECT_EQ(preserved.marks, (Marks{{0, ".", pc::Position::end}}));
}

TEST(PreserveDigits, number_without_marks_is_unchanged) {
    auto preserved = defaults().preserve(Lines{"pi is 3.14159"});

    EXPECT_EQ(preserved.chunks, (Lines{"pi is 3.14159"}));
    EXPECT_TRUE(preserved.marks.empty());
}

TEST(PreserveDigits, separator_followed_by_space_is_a_mark) {
    auto preserved = defaults().preserve(Lines{"1, 2"});

    EXPECT_EQ(preserved.chunks, (Lines{"1", "2"}));
    EXPECT_EQ(preserved.marks, (Marks{{0, ", ", pc::Position::middle}}));
}

TEST(PreserveDigits, number_at_line_end_before_period) {
    auto preserved = defaults().preserve(Lines{"Version 2.5."});

    EXPECT_EQ(preserved.chunks, (Lines{"Version 2.5"}));
    EXPECT_EQ(preserved.marks, (Marks{{0, ".", pc::Position::end}}));
}

TEST(PreserveDigits, non_ascii_decimal_stays_whole) {
    // arabic-indic "3,14 is pi."
    auto p = pc::Punctuator{",."};
    auto preserved = p.preserve(Lines{"\xD9\xA3,\xD9\xA1\xD9\xA4 is pi."});

    EXPECT_EQ(preserved.chunks, (Lines{"\xD9\xA3,\xD9\xA1\xD9\xA4 is pi"}));
    EXPECT_EQ(preserved.marks, (Marks{{0, ".", pc::Position::end}}));
}

TEST(PreserveDigits, fullwidth_digits_keep_their_separator) {
    // fullwidth "1.5", then a comma mark
    auto preserved = defaults().preserve(Lines{"\xEF\xBC\x91.\xEF\xBC\x95, ok"});

    EXPECT_EQ(preserved.chunks, (Lines{"\xEF\xBC\x91.\xEF\xBC\x95", "ok"}));
    EXPECT_EQ(preserved.marks, (Marks{{0, ", ", pc::Position::middle}}));
}

TEST(PreserveDigits, placeholder_code_points_in_input_are_kept) {
    // U+FDD0 and U+FDD1 written by the caller, not by the digit guard
    auto p = pc::Punctuator{",."};
    auto preserved = p.preserve(Lines{"x\xEF\xB7\x90y, z\xEF\xB7\x91"});

    EXPECT_EQ(preserved.chunks, (Lines{"x\xEF\xB7\x90y", "z\xEF\xB7\x91"}));
    EXPECT_EQ(preserved.marks, (Marks{{0, ", ", pc::Position::middle}}));
}

// =============================================================================
// Multiple lines
// =============================================================================

TEST(PreserveLines, line_index_refers_to_source_line) {
    auto preserved = defaults().preserve(Lines{"no marks here", "wow!"});

    EXPECT_EQ(preserved.chunks, (Lines{"no marks here", "wow"}));
    EXPECT_EQ(preserved.marks, (Marks{{1, "!", pc::Position::end}}));
}

TEST(PreserveLines, empty_lines_contribute_nothing) {
    auto preserved = defaults().preserve(Lines{"", "a", ""});

    EXPECT_EQ(preserved.chunks, (Lines{"a"}));
    EXPECT_TRUE(preserved.marks.empty());
}

TEST(PreserveLines, punctuation_line_between_text_lines) {
    auto preserved = defaults().preserve(Lines{"a", "...", "b."});

    EXPECT_EQ(preserved.chunks, (Lines{"a", "b"}));
    EXPECT_EQ(preserved.marks, (Marks{
        {1, "...", pc::Position::alone},
        {2, ".", pc::Position::end},
    }));
}

TEST(PreserveLines, chunk_and_mark_counts_stay_consistent) {
    auto p = defaults();
    auto lines = Lines{"Hi, you.", "\xC2\xBF" "Qu\xC3\xA9?", "!!", "plain", "a: b; c"};
    auto preserved = p.preserve(lines);

    EXPECT_EQ(preserved.chunks, (Lines{"Hi", "you", "Qu\xC3\xA9", "plain", "a", "b", "c"}));
    ASSERT_EQ(preserved.marks.size(), 7u);
    EXPECT_EQ(preserved.marks[2], (pc::MarkRecord{1, "\xC2\xBF", pc::Position::begin}));
    EXPECT_EQ(preserved.marks[4], (pc::MarkRecord{2, "!!", pc::Position::alone}));
    EXPECT_EQ(preserved.marks[6], (pc::MarkRecord{4, "; ", pc::Position::middle}));
}

TEST(PreserveLines, ill_formed_bytes_pass_through) {
    auto preserved = defaults().preserve(Lines{"caf\xC3!"});

    EXPECT_EQ(preserved.chunks, (Lines{"caf\xC3"}));
    EXPECT_EQ(preserved.marks, (Marks{{0, "!", pc::Position::end}}));
}
