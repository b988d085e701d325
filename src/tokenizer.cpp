#include "tokenizer.hpp"
#include "text.hpp"
#include <re2/re2.h>

std::vector<std::string> tokenize(const std::string& text) {
  static const RE2 word("([\\pL\\pN_]{2,})");
  std::string lowered = to_lower(text);
  re2::StringPiece input(lowered);
  std::vector<std::string> out;
  std::string tok;
  while (RE2::FindAndConsume(&input, word, &tok)) out.push_back(tok);
  return out;
}

std::vector<std::string> Analyzer::terms(const std::string& text) const {
  std::vector<std::string> tokens;
  for (auto& t : tokenize(text)) {
    if (stopwords.count(t)) continue;
    tokens.push_back(std::move(t));
  }
  if (ngram_min == 1 && ngram_max == 1) return tokens;

  std::vector<std::string> out;
  int n_tokens = (int)tokens.size();
  for (int n = ngram_min; n <= ngram_max; ++n) {
    for (int i = 0; i + n <= n_tokens; ++i) {
      std::string gram = tokens[i];
      for (int j = 1; j < n; ++j) { gram += ' '; gram += tokens[i + j]; }
      out.push_back(std::move(gram));
    }
  }
  return out;
}
