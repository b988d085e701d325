#pragma once
#include "stopwords.hpp"
#include <stdexcept>
#include <string>

struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RetrievalConfig {
  int chunk_size = 500;      // code points per window
  int chunk_overlap = 50;
  int max_features = 500;
  StopwordSet stopwords = english_stopwords();
  int ngram_min = 1;
  int ngram_max = 1;
  bool sublinear_tf = false;
  int top_k = 5;
  double min_similarity = 0.0;

  // Throws ConfigError on the first invalid field.
  void validate() const;
};

// JSON object with any subset of the fields above. "stopwords" is a list of
// words, "english" or "none". Unknown keys are rejected.
RetrievalConfig config_from_json(const std::string& text);
std::string config_to_json(const RetrievalConfig& cfg);

RetrievalConfig load_config(const std::string& path);
