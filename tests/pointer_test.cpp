#include <jsonpatch-cpp/pointer.hpp>

#include <gtest/gtest.h>

using namespace jsonpatch_cpp;

TEST(TrimPath, strips_surrounding_slashes) {
    EXPECT_EQ(trim_path("/phones/-"), "phones/-");
    EXPECT_EQ(trim_path("phones/-/"), "phones/-");
    EXPECT_EQ(trim_path("//a/b//"), "a/b");
    EXPECT_EQ(trim_path("/"), "");
    EXPECT_EQ(trim_path(""), "");
}

TEST(TrimPath, keeps_inner_empty_segments) {
    EXPECT_EQ(trim_path("/a//b/"), "a//b");
}

TEST(SplitHead, last_segment_has_no_rest) {
    const auto split = split_head("name");
    EXPECT_EQ(split.head, "name");
    EXPECT_FALSE(split.rest.has_value());
}

TEST(SplitHead, splits_at_first_slash) {
    EXPECT_EQ(split_head("a/b/c"), (PathHead{"a", "b/c"}));
    EXPECT_EQ(split_head("a/"), (PathHead{"a", ""}));
}

TEST(UnescapeToken, rfc6901_escapes) {
    EXPECT_EQ(unescape_token("a~1b"), "a/b");
    EXPECT_EQ(unescape_token("m~0n"), "m~n");
    EXPECT_EQ(unescape_token("~01"), "~1");
    EXPECT_EQ(unescape_token("plain"), "plain");
    EXPECT_EQ(unescape_token("trailing~"), "trailing~");
    EXPECT_EQ(unescape_token("~2"), "~2");
}

TEST(ParseIndex, accepts_decimal_indices) {
    EXPECT_EQ(parse_index("0"), 0u);
    EXPECT_EQ(parse_index("7"), 7u);
    EXPECT_EQ(parse_index("42"), 42u);
}

TEST(ParseIndex, rejects_non_indices) {
    EXPECT_FALSE(parse_index("").has_value());
    EXPECT_FALSE(parse_index("-").has_value());
    EXPECT_FALSE(parse_index("-1").has_value());
    EXPECT_FALSE(parse_index("+1").has_value());
    EXPECT_FALSE(parse_index("01").has_value());
    EXPECT_FALSE(parse_index("1a").has_value());
    EXPECT_FALSE(parse_index("name").has_value());
}
