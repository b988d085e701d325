#include "vocabulary.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

Vocabulary::Vocabulary(std::vector<std::string> terms, std::vector<int> df, int n_chunks)
  : terms_(std::move(terms)), df_(std::move(df)), n_chunks_(n_chunks) {
  if (terms_.size() != df_.size())
    throw std::runtime_error("vocabulary: term/df size mismatch");
  idf_.reserve(terms_.size());
  for (size_t i = 0; i < terms_.size(); ++i) {
    if (!ids_.emplace(terms_[i], (int)i).second)
      throw std::runtime_error("vocabulary: duplicate term '" + terms_[i] + "'");
    idf_.push_back(std::log((1.0 + n_chunks_) / (1.0 + df_[i])) + 1.0);
  }
}

int Vocabulary::id_of(const std::string& term) const {
  auto it = ids_.find(term);
  return it == ids_.end() ? -1 : it->second;
}

namespace {
struct Candidate {
  std::string term;
  int df;
};
}

Vocabulary build_vocabulary(const std::vector<std::string>& chunks,
                            int max_features,
                            const Analyzer& analyzer) {
  // candidates stay in first-seen order
  std::vector<Candidate> cands;
  std::unordered_map<std::string, size_t> pos;
  for (auto& text : chunks) {
    std::unordered_set<std::string> seen;
    for (auto& t : analyzer.terms(text)) {
      if (!seen.insert(t).second) continue;
      auto it = pos.find(t);
      if (it == pos.end()) {
        pos.emplace(t, cands.size());
        cands.push_back(Candidate{t, 1});
      } else {
        cands[it->second].df++;
      }
    }
  }

  std::stable_sort(cands.begin(), cands.end(),
                   [](const Candidate& a, const Candidate& b) { return a.df > b.df; });
  if (max_features >= 0 && (int)cands.size() > max_features) cands.resize(max_features);

  std::vector<std::string> terms;
  std::vector<int> df;
  terms.reserve(cands.size());
  df.reserve(cands.size());
  for (auto& c : cands) {
    terms.push_back(std::move(c.term));
    df.push_back(c.df);
  }
  return Vocabulary(std::move(terms), std::move(df), (int)chunks.size());
}
