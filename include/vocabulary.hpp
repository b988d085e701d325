#pragma once
#include "tokenizer.hpp"
#include <string>
#include <unordered_map>
#include <vector>

// Term -> id with per-term document frequency. Ids are 0-based and follow
// selection order. Read-only once built.
class Vocabulary {
public:
  Vocabulary() = default;
  // terms[i] gets id i with document frequency df[i]; n_chunks is the
  // number of chunks the statistics were collected over.
  Vocabulary(std::vector<std::string> terms, std::vector<int> df, int n_chunks);

  int id_of(const std::string& term) const;   // -1 when absent
  const std::string& term(int id) const { return terms_[id]; }
  int df(int id) const { return df_[id]; }
  // ln((1 + N) / (1 + df)) + 1
  double idf(int id) const { return idf_[id]; }

  int size() const { return (int)terms_.size(); }
  bool empty() const { return terms_.empty(); }
  int n_chunks() const { return n_chunks_; }

  bool operator==(const Vocabulary& o) const {
    return terms_ == o.terms_ && df_ == o.df_ && n_chunks_ == o.n_chunks_;
  }

private:
  std::vector<std::string> terms_;
  std::vector<int> df_;
  std::vector<double> idf_;
  std::unordered_map<std::string, int> ids_;
  int n_chunks_ = 0;
};

// Scans every chunk once. When more than max_features distinct terms are
// seen, keeps the highest-df ones; equal df goes to the term seen first.
Vocabulary build_vocabulary(const std::vector<std::string>& chunks,
                            int max_features,
                            const Analyzer& analyzer);
