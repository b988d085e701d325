#include "chunker.hpp"
#include "config.hpp"
#include "text.hpp"
#include <algorithm>

std::vector<TextSpan> chunk_text(const std::string& text, int chunk_size, int overlap) {
  if (chunk_size <= 0) throw ConfigError("chunk_size must be positive");
  if (overlap < 0 || overlap >= chunk_size)
    throw ConfigError("chunk_overlap must be in [0, chunk_size)");

  std::vector<TextSpan> spans;
  if (text.empty()) return spans;

  // code point boundaries, last entry is the byte length
  auto cp = utf8_boundaries(text);
  size_t n = cp.size() - 1;
  size_t size = (size_t)chunk_size;
  size_t step = (size_t)(chunk_size - overlap);
  for (size_t start = 0; start < n; start += step) {
    size_t end = std::min(n, start + size);
    std::string window = text.substr(cp[start], cp[end] - cp[start]);
    if (is_blank(window)) continue;
    spans.push_back(TextSpan{ std::move(window), start });
  }
  return spans;
}

std::vector<Chunk> chunk_corpus(const Corpus& corpus, int chunk_size, int overlap) {
  std::vector<Chunk> all;
  for (auto& doc : corpus) {
    for (auto& s : chunk_text(doc.text, chunk_size, overlap)) {
      all.push_back(Chunk{ (int)all.size(), doc.id, s.start, std::move(s.text) });
    }
  }
  return all;
}
