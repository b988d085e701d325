#include "ranker.hpp"
#include <algorithm>

double cosine(const ChunkVector& a, const ChunkVector& b) {
  double s = 0.0;
  size_t i = 0, j = 0;
  while (i < a.size() && j < b.size()) {
    if (a[i].first < b[j].first) ++i;
    else if (b[j].first < a[i].first) ++j;
    else { s += a[i].second * b[j].second; ++i; ++j; }
  }
  return s;
}

std::vector<ScoredChunk> rank(const ChunkVector& query,
                              const std::vector<ChunkVector>& corpus,
                              int top_k,
                              double min_similarity) {
  std::vector<ScoredChunk> scored;
  if (top_k <= 0 || corpus.empty() || query.empty()) return scored;

  scored.reserve(corpus.size());
  for (size_t i = 0; i < corpus.size(); ++i) {
    if (corpus[i].empty()) continue;
    scored.push_back(ScoredChunk{ (int)i, cosine(query, corpus[i]) });
  }

  auto better = [](const ScoredChunk& a, const ScoredChunk& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.index < b.index;
  };
  size_t keep = std::min(scored.size(), (size_t)top_k);
  std::partial_sort(scored.begin(), scored.begin() + keep, scored.end(), better);
  scored.resize(keep);

  while (!scored.empty() && !(scored.back().score > min_similarity)) scored.pop_back();
  return scored;
}
