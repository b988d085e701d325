#pragma once
#include "config.hpp"
#include "vocabulary.hpp"
#include <string>
#include <utility>
#include <vector>

// Sparse (term id, weight) pairs sorted by term id. Either empty or of unit
// L2 norm.
using ChunkVector = std::vector<std::pair<int, double>>;

double l2_norm(const ChunkVector& v);

// TF-IDF weighting of text against a fixed vocabulary. Terms outside the
// vocabulary contribute nothing.
ChunkVector vectorize(const std::string& text, const Vocabulary& vocab,
                      const Analyzer& analyzer, bool sublinear_tf);

class Vectorizer {
public:
  explicit Vectorizer(const RetrievalConfig& cfg);

  // Builds the vocabulary from texts, then returns one vector per text.
  std::vector<ChunkVector> fit_transform(const std::vector<std::string>& texts);
  // Never touches the vocabulary.
  ChunkVector transform(const std::string& text) const;

  void set_vocabulary(Vocabulary vocab) { vocab_ = std::move(vocab); }
  const Vocabulary& vocabulary() const { return vocab_; }

private:
  Analyzer analyzer_;
  int max_features_;
  bool sublinear_tf_;
  Vocabulary vocab_;
};
