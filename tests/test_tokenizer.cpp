#include "tokenizer.hpp"
#include <gtest/gtest.h>

using Strings = std::vector<std::string>;

TEST(Tokenizer, LowercasesAndDropsShortTokens) {
  EXPECT_EQ(tokenize("The Quick, brown-fox! a I x2"),
            Strings({"the", "quick", "brown", "fox", "x2"}));
}

TEST(Tokenizer, KeepsDigitsAndUnderscores) {
  EXPECT_EQ(tokenize("error_code 404 v2.0"), Strings({"error_code", "404", "v2"}));
}

TEST(Tokenizer, KeepsNonAsciiLetters) {
  EXPECT_EQ(tokenize("caf\xC3\xA9 au lait"), Strings({"caf\xC3\xA9", "au", "lait"}));
}

TEST(Tokenizer, LowercasesNonAsciiLetters) {
  EXPECT_EQ(tokenize("\xC3\x89" "clair \xC3\xA9" "clair"),
            Strings({"\xC3\xA9" "clair", "\xC3\xA9" "clair"}));
}

TEST(Tokenizer, EmptyText) {
  EXPECT_TRUE(tokenize("").empty());
  EXPECT_TRUE(tokenize("  ... !").empty());
}

TEST(Analyzer, RemovesStopwordsBeforeNgrams) {
  Analyzer a;
  a.stopwords = {"the", "over"};
  a.ngram_min = 1;
  a.ngram_max = 2;
  EXPECT_EQ(a.terms("The quick fox over dogs"),
            Strings({"quick", "fox", "dogs", "quick fox", "fox dogs"}));
}

TEST(Analyzer, BigramsOnly) {
  Analyzer a;
  a.ngram_min = 2;
  a.ngram_max = 2;
  EXPECT_EQ(a.terms("red green blue"), Strings({"red green", "green blue"}));
  EXPECT_TRUE(a.terms("single").empty());
}
