#include "vectorizer.hpp"
#include <cmath>
#include <map>

double l2_norm(const ChunkVector& v) {
  double s = 0.0;
  for (auto& e : v) s += e.second * e.second;
  return std::sqrt(s);
}

ChunkVector vectorize(const std::string& text, const Vocabulary& vocab,
                      const Analyzer& analyzer, bool sublinear_tf) {
  ChunkVector v;
  if (vocab.empty()) return v;

  std::map<int, int> counts;
  for (auto& t : analyzer.terms(text)) {
    int id = vocab.id_of(t);
    if (id >= 0) counts[id]++;
  }
  if (counts.empty()) return v;

  v.reserve(counts.size());
  for (auto& c : counts) {
    double tf = sublinear_tf ? 1.0 + std::log((double)c.second) : (double)c.second;
    v.emplace_back(c.first, tf * vocab.idf(c.first));
  }
  double norm = l2_norm(v);
  if (norm == 0.0) return {};
  for (auto& e : v) e.second /= norm;
  return v;
}

Vectorizer::Vectorizer(const RetrievalConfig& cfg)
  : max_features_(cfg.max_features), sublinear_tf_(cfg.sublinear_tf) {
  analyzer_.stopwords = cfg.stopwords;
  analyzer_.ngram_min = cfg.ngram_min;
  analyzer_.ngram_max = cfg.ngram_max;
}

std::vector<ChunkVector> Vectorizer::fit_transform(const std::vector<std::string>& texts) {
  vocab_ = build_vocabulary(texts, max_features_, analyzer_);
  std::vector<ChunkVector> out;
  out.reserve(texts.size());
  for (auto& t : texts) out.push_back(transform(t));
  return out;
}

ChunkVector Vectorizer::transform(const std::string& text) const {
  return vectorize(text, vocab_, analyzer_, sublinear_tf_);
}
