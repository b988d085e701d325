#pragma once
#include <string>
#include <vector>

struct Document {
  std::string id;     // unique identifier (file name or path)
  std::string text;
};

using Corpus = std::vector<Document>;

struct TextSpan {
  std::string text;
  size_t start;       // offset in code points
};

struct Chunk {
  int id;             // position in the global chunk list
  std::string document;
  size_t start;       // offset in code points within the document
  std::string text;
};

// Sliding window of chunk_size code points, advancing by
// chunk_size - overlap. Whitespace-only windows are dropped.
// Throws ConfigError unless 0 <= overlap < chunk_size.
std::vector<TextSpan> chunk_text(const std::string& text, int chunk_size, int overlap);

// Chunks every document in corpus order and numbers the chunks globally.
std::vector<Chunk> chunk_corpus(const Corpus& corpus, int chunk_size, int overlap);
