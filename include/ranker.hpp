#pragma once
#include "vectorizer.hpp"
#include <vector>

struct ScoredChunk {
  int index;     // position in the corpus vector list
  double score;
};

// Sparse dot product; equals cosine similarity for unit vectors.
double cosine(const ChunkVector& a, const ChunkVector& b);

// Top-k corpus vectors by cosine similarity against query, highest first,
// ties to the lower index. Only scores strictly above min_similarity
// survive. Empty (degenerate) vectors are never scored.
std::vector<ScoredChunk> rank(const ChunkVector& query,
                              const std::vector<ChunkVector>& corpus,
                              int top_k,
                              double min_similarity);
