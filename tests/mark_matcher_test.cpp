#include <punctuation-cpp/mark_matcher.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace pc = punctuation_cpp;

// =============================================================================
// Configuration
// =============================================================================

TEST(MarkMatcher, duplicates_are_collapsed) {
    auto matcher = pc::MarkMatcher{"!!,,!"};
    EXPECT_EQ(matcher.marks(), "!,");
}

TEST(MarkMatcher, multibyte_duplicates_are_collapsed) {
    auto matcher = pc::MarkMatcher{"\xC2\xBF?\xC2\xBF"};
    EXPECT_EQ(matcher.marks(), "\xC2\xBF?");
}

TEST(MarkMatcher, is_mark) {
    auto matcher = pc::MarkMatcher{",\xE2\x80\xA6"};
    EXPECT_TRUE(matcher.is_mark(U','));
    EXPECT_TRUE(matcher.is_mark(char32_t{0x2026}));
    EXPECT_FALSE(matcher.is_mark(U'.'));
    EXPECT_FALSE(matcher.is_mark(U' '));
}

TEST(MarkMatcher, string_and_c_string_construction_agree) {
    const auto marks = std::string{";:!"};
    EXPECT_EQ(pc::MarkMatcher{marks}.marks(), pc::MarkMatcher{marks.c_str()}.marks());
}

// =============================================================================
// detect()
// =============================================================================

TEST(MarkMatcherDetect, finds_runs_in_order) {
    auto matcher = pc::MarkMatcher{",!"};
    auto units = matcher.detect("hello, my world!");

    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0], (pc::MarkUnit{", ", 5, 7}));
    EXPECT_EQ(units[1], (pc::MarkUnit{"!", 15, 16}));
}

TEST(MarkMatcherDetect, run_takes_leading_whitespace) {
    auto matcher = pc::MarkMatcher{","};
    auto units = matcher.detect("a  ,b");

    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0], (pc::MarkUnit{"  ,", 1, 4}));
}

TEST(MarkMatcherDetect, multi_character_runs) {
    auto matcher = pc::MarkMatcher{".?!"};
    auto units = matcher.detect("wait... what?!");

    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0], (pc::MarkUnit{"... ", 4, 8}));
    EXPECT_EQ(units[1], (pc::MarkUnit{"?!", 12, 14}));
}

TEST(MarkMatcherDetect, whitespace_between_marks_joins_one_run) {
    auto matcher = pc::MarkMatcher{","};
    auto units = matcher.detect("a , , b");

    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0], (pc::MarkUnit{" , , ", 1, 6}));
}

TEST(MarkMatcherDetect, whitespace_alone_is_not_a_run) {
    auto matcher = pc::MarkMatcher{","};
    EXPECT_TRUE(matcher.detect("a   b").empty());
    EXPECT_TRUE(matcher.detect("   ").empty());
    EXPECT_TRUE(matcher.detect("").empty());
}

TEST(MarkMatcherDetect, whole_line_run) {
    auto matcher = pc::MarkMatcher{"!"};
    auto units = matcher.detect(" !! ");

    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0], (pc::MarkUnit{" !! ", 0, 4}));
}

TEST(MarkMatcherDetect, multibyte_marks_use_byte_offsets) {
    // "¿Qué?" -- ¿ and é are two bytes each
    auto matcher = pc::MarkMatcher{"\xC2\xBF?"};
    auto units = matcher.detect("\xC2\xBFQu\xC3\xA9?");

    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0], (pc::MarkUnit{"\xC2\xBF", 0, 2}));
    EXPECT_EQ(units[1], (pc::MarkUnit{"?", 6, 7}));
}

TEST(MarkMatcherDetect, unicode_whitespace_joins_the_run) {
    auto matcher = pc::MarkMatcher{"!"};
    auto units = matcher.detect("a\xE3\x80\x80!");

    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0], (pc::MarkUnit{"\xE3\x80\x80!", 1, 5}));
}

TEST(MarkMatcherDetect, ill_formed_bytes_never_match) {
    // U+FFFD configured as a mark must not match bytes that merely fail to decode.
    auto matcher = pc::MarkMatcher{"\xEF\xBF\xBD"};
    EXPECT_TRUE(matcher.detect("a\xFF" "b").empty());
    EXPECT_EQ(matcher.detect("a\xEF\xBF\xBD" "b").size(), 1u);
}

TEST(MarkMatcherDetect, empty_mark_set_matches_nothing) {
    auto matcher = pc::MarkMatcher{""};
    EXPECT_TRUE(matcher.detect("hello, world!").empty());
}

// =============================================================================
// remove()
// =============================================================================

TEST(MarkMatcherRemove, replaces_runs_with_one_space) {
    auto matcher = pc::MarkMatcher{",!"};
    EXPECT_EQ(matcher.remove("hello, my world!"), "hello my world");
    EXPECT_EQ(matcher.remove("a,b"), "a b");
    EXPECT_EQ(matcher.remove("a , , b"), "a b");
}

TEST(MarkMatcherRemove, trims_the_line) {
    auto matcher = pc::MarkMatcher{",!"};
    EXPECT_EQ(matcher.remove(", hi !"), "hi");
    EXPECT_EQ(matcher.remove("  hi  "), "hi");
    EXPECT_EQ(matcher.remove("!!!"), "");
}

TEST(MarkMatcherRemove, keeps_inner_whitespace_runs) {
    auto matcher = pc::MarkMatcher{"!"};
    EXPECT_EQ(matcher.remove("a   b!"), "a   b");
}

TEST(MarkMatcherRemove, does_not_protect_digits) {
    auto matcher = pc::MarkMatcher{"."};
    EXPECT_EQ(matcher.remove("3.14"), "3 14");
}

TEST(MarkMatcherRemove, is_idempotent) {
    auto matcher = pc::MarkMatcher{";:,.!?\xC2\xA1\xC2\xBF"};
    for (const auto* line : {"hello, my world!", "  ; ; a ;; b ;  ", "\xC2\xA1" "Hola!",
                             "no marks", "", "...", "3.14, 2.71"}) {
        const auto once = matcher.remove(line);
        EXPECT_EQ(matcher.remove(once), once) << "line: " << line;
    }
}

TEST(MarkMatcherRemove, vector_keeps_shape) {
    auto matcher = pc::MarkMatcher{".!"};
    auto lines = std::vector<std::string>{"one.", "", "two! three"};
    auto removed = matcher.remove(lines);

    EXPECT_EQ(removed, (std::vector<std::string>{"one", "", "two three"}));
    EXPECT_EQ(lines[0], "one.");
}
