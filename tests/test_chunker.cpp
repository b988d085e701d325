#include "chunker.hpp"
#include "config.hpp"
#include <gtest/gtest.h>
#include <vector>

TEST(Chunker, ShortDocumentIsOneChunk) {
  auto spans = chunk_text("The quick brown fox jumps.", 100, 0);
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].text, "The quick brown fox jumps.");
  EXPECT_EQ(spans[0].start, 0u);
}

TEST(Chunker, WindowsAdvanceBySizeMinusOverlap) {
  auto spans = chunk_text("abcdefghij", 4, 1);
  ASSERT_EQ(spans.size(), 4u);
  EXPECT_EQ(spans[0].text, "abcd");
  EXPECT_EQ(spans[1].text, "defg");
  EXPECT_EQ(spans[2].text, "ghij");
  EXPECT_EQ(spans[3].text, "j");
  EXPECT_EQ(spans[3].start, 9u);
}

TEST(Chunker, SpansCoverWholeText) {
  std::string text;
  for (int i = 0; i < 97; ++i) text += (char)('a' + i % 26);
  for (int size : {1, 5, 10, 33, 200}) {
    for (int overlap : {0, size / 2, size - 1}) {
      auto spans = chunk_text(text, size, overlap);
      std::vector<bool> covered(text.size(), false);
      for (auto& s : spans) {
        EXPECT_LE(s.text.size(), (size_t)size);
        EXPECT_EQ(text.substr(s.start, s.text.size()), s.text);
        for (size_t i = 0; i < s.text.size(); ++i) covered[s.start + i] = true;
      }
      for (size_t i = 0; i < covered.size(); ++i)
        EXPECT_TRUE(covered[i]) << "size=" << size << " overlap=" << overlap << " at " << i;
    }
  }
}

TEST(Chunker, DropsWhitespaceWindows) {
  auto spans = chunk_text("ab        cd", 4, 0);
  ASSERT_EQ(spans.size(), 2u);
  EXPECT_EQ(spans[0].text, "ab  ");
  EXPECT_EQ(spans[1].text, "  cd");
  EXPECT_EQ(spans[1].start, 8u);
}

TEST(Chunker, DropsUnicodeWhitespaceWindows) {
  std::string nbsp = "\xC2\xA0";
  auto spans = chunk_text("abcd" + nbsp + nbsp + nbsp + nbsp, 4, 0);
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].text, "abcd");
}

TEST(Chunker, EmptyTextGivesNoChunks) {
  EXPECT_TRUE(chunk_text("", 10, 2).empty());
  EXPECT_TRUE(chunk_text("   \n ", 10, 2).empty());
}

TEST(Chunker, CountsCodePoints) {
  auto spans = chunk_text("\xC3\xA9\xC3\xA9\xC3\xA9", 2, 0);
  ASSERT_EQ(spans.size(), 2u);
  EXPECT_EQ(spans[0].text, "\xC3\xA9\xC3\xA9");
  EXPECT_EQ(spans[1].text, "\xC3\xA9");
  EXPECT_EQ(spans[1].start, 2u);
}

TEST(Chunker, RejectsBadWindow) {
  EXPECT_THROW(chunk_text("abc", 0, 0), ConfigError);
  EXPECT_THROW(chunk_text("abc", 3, 3), ConfigError);
  EXPECT_THROW(chunk_text("abc", 3, -1), ConfigError);
}

TEST(Chunker, CorpusChunksAreNumberedGlobally) {
  Corpus corpus{ {"a.txt", "abcdef"}, {"b.txt", ""}, {"c.txt", "xyz"} };
  auto chunks = chunk_corpus(corpus, 4, 0);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].id, 0);
  EXPECT_EQ(chunks[0].document, "a.txt");
  EXPECT_EQ(chunks[1].id, 1);
  EXPECT_EQ(chunks[1].text, "ef");
  EXPECT_EQ(chunks[1].start, 4u);
  EXPECT_EQ(chunks[2].id, 2);
  EXPECT_EQ(chunks[2].document, "c.txt");
}
