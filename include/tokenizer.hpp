#pragma once
#include "stopwords.hpp"
#include <string>
#include <vector>

// Lowercased word tokens: maximal runs of two or more letters, digits or
// underscores, in text order.
std::vector<std::string> tokenize(const std::string& text);

// Turns text into candidate terms: tokenize, drop stopwords, then emit the
// n-grams for n in [ngram_min, ngram_max], grouped by n.
struct Analyzer {
  StopwordSet stopwords;
  int ngram_min = 1;
  int ngram_max = 1;

  std::vector<std::string> terms(const std::string& text) const;
};
