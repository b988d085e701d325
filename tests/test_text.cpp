#include "text.hpp"
#include <gtest/gtest.h>

TEST(Text, BoundariesFollowCodePoints) {
  // "a" + e-acute (2 bytes) + "b"
  std::string s = "a\xC3\xA9" "b";
  auto b = utf8_boundaries(s);
  ASSERT_EQ(b.size(), 4u);
  EXPECT_EQ(b[0], 0u);
  EXPECT_EQ(b[1], 1u);
  EXPECT_EQ(b[2], 3u);
  EXPECT_EQ(b[3], 4u);
  EXPECT_EQ(utf8_length(s), 3u);
}

TEST(Text, EmptyStringHasOnlySentinel) {
  auto b = utf8_boundaries("");
  ASSERT_EQ(b.size(), 1u);
  EXPECT_EQ(b[0], 0u);
  EXPECT_EQ(utf8_length(""), 0u);
}

TEST(Text, PrefixNeverSplitsSequence) {
  std::string s = "\xC3\xA9\xC3\xA9x";
  EXPECT_EQ(utf8_prefix(s, 1), "\xC3\xA9");
  EXPECT_EQ(utf8_prefix(s, 0), "");
  EXPECT_EQ(utf8_prefix(s, 10), s);
}

TEST(Text, BlankAndCase) {
  EXPECT_TRUE(is_blank(" \t\r\n"));
  EXPECT_TRUE(is_blank(""));
  EXPECT_FALSE(is_blank("  x "));
  EXPECT_EQ(to_lower("HeLLo W0rld"), "hello w0rld");
  EXPECT_EQ(trim("  hi \n"), "hi");
}

TEST(Text, LowercasesBeyondAscii) {
  EXPECT_EQ(to_lower("\xC3\x89" "CLAIR \xC3\x9C" "ber"), "\xC3\xA9" "clair \xC3\xBC" "ber");
  EXPECT_EQ(to_lower("\xCE\xA3\xCE\x9F\xCE\xA6"), "\xCF\x83\xCE\xBF\xCF\x86");
}

TEST(Text, UnicodeWhitespaceIsBlank) {
  // NBSP, ideographic space, em space
  EXPECT_TRUE(is_blank("\xC2\xA0\xE3\x80\x80\xE2\x80\x83 \n"));
  EXPECT_FALSE(is_blank("\xC2\xA0x\xC2\xA0"));
  EXPECT_FALSE(is_blank("\xC3\xA9"));
}
