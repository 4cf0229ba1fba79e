/**
 * @file utf8_test.cpp
 * @brief Unit tests for codepoint helpers
 */

#include <gtest/gtest.h>

#include "common/utf8.hpp"

namespace fixedwidth {
namespace {

TEST(Utf8Test, LengthCountsCodepoints) {
  EXPECT_EQ(utf8::length(""), 0);
  EXPECT_EQ(utf8::length("abc"), 3);
  EXPECT_EQ(utf8::length("h\xC3\xA9llo"), 5);     // héllo
  EXPECT_EQ(utf8::length("\xE2\x82\xAC" "12"), 3); // €12
}

TEST(Utf8Test, SliceByCodepoints) {
  const std::string text = "h\xC3\xA9llo";
  EXPECT_EQ(utf8::slice(text, 0, 2), "h\xC3\xA9");
  EXPECT_EQ(utf8::slice(text, 1, 3), "\xC3\xA9ll");
  EXPECT_EQ(utf8::slice(text, 3, 10), "lo");
}

TEST(Utf8Test, SlicePastEndIsEmpty) {
  EXPECT_EQ(utf8::slice("abc", 3, 2), "");
  EXPECT_EQ(utf8::slice("abc", 7, 1), "");
  EXPECT_EQ(utf8::slice("", 0, 4), "");
}

TEST(Utf8Test, FirstAndLast) {
  const std::string text = "\xC3\xA9t\xC3\xA9";  // été
  EXPECT_EQ(utf8::first(text, 2), "\xC3\xA9t");
  EXPECT_EQ(utf8::last(text, 2), "t\xC3\xA9");
  EXPECT_EQ(utf8::last(text, 9), text);
}

TEST(Utf8Test, Repeat) {
  EXPECT_EQ(utf8::repeat(" ", 3), "   ");
  EXPECT_EQ(utf8::repeat("\xC2\xB7", 2), "\xC2\xB7\xC2\xB7");
  EXPECT_EQ(utf8::repeat("0", 0), "");
}

TEST(Utf8Test, StripPadding) {
  EXPECT_EQ(utf8::strip_leading("00012", "0"), "12");
  EXPECT_EQ(utf8::strip_trailing("ab  ", " "), "ab");
  EXPECT_EQ(utf8::strip_leading("   ", " "), "");
  EXPECT_EQ(utf8::strip_trailing("x\xC2\xB7\xC2\xB7", "\xC2\xB7"), "x");
  // Only the named side is touched
  EXPECT_EQ(utf8::strip_leading(" a ", " "), "a ");
}

} // namespace
} // namespace fixedwidth
