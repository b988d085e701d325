#include "config.hpp"
#include "text.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

using json = nlohmann::json;

void RetrievalConfig::validate() const {
  if (chunk_size <= 0)
    throw ConfigError("chunk_size must be positive");
  if (chunk_overlap < 0)
    throw ConfigError("chunk_overlap must not be negative");
  if (chunk_overlap >= chunk_size)
    throw ConfigError("chunk_overlap must be smaller than chunk_size");
  if (max_features <= 0)
    throw ConfigError("max_features must be positive");
  if (ngram_min < 1 || ngram_max < ngram_min)
    throw ConfigError("ngram range must satisfy 1 <= min <= max");
  if (top_k < 0)
    throw ConfigError("top_k must not be negative");
}

namespace {
StopwordSet stopwords_from_json(const json& j) {
  if (j.is_string()) {
    auto name = j.get<std::string>();
    if (name == "english") return english_stopwords();
    if (name == "none") return {};
    throw ConfigError("unknown stopword list: " + name);
  }
  if (!j.is_array()) throw ConfigError("stopwords must be a list or a name");
  StopwordSet out;
  for (auto& w : j) out.insert(to_lower(w.get<std::string>()));
  return out;
}
}

RetrievalConfig config_from_json(const std::string& text) {
  RetrievalConfig cfg;
  try {
    auto j = json::parse(text);
    if (!j.is_object()) throw ConfigError("config must be a JSON object");
    for (auto it = j.begin(); it != j.end(); ++it) {
      const auto& k = it.key();
      const auto& v = it.value();
      if (k == "chunk_size") cfg.chunk_size = v.get<int>();
      else if (k == "chunk_overlap") cfg.chunk_overlap = v.get<int>();
      else if (k == "max_features") cfg.max_features = v.get<int>();
      else if (k == "stopwords") cfg.stopwords = stopwords_from_json(v);
      else if (k == "ngram_min") cfg.ngram_min = v.get<int>();
      else if (k == "ngram_max") cfg.ngram_max = v.get<int>();
      else if (k == "sublinear_tf") cfg.sublinear_tf = v.get<bool>();
      else if (k == "top_k") cfg.top_k = v.get<int>();
      else if (k == "min_similarity") cfg.min_similarity = v.get<double>();
      else throw ConfigError("unknown config key: " + k);
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("config: ") + e.what());
  }
  cfg.validate();
  return cfg;
}

std::string config_to_json(const RetrievalConfig& cfg) {
  json j;
  j["chunk_size"] = cfg.chunk_size;
  j["chunk_overlap"] = cfg.chunk_overlap;
  j["max_features"] = cfg.max_features;
  if (cfg.stopwords == english_stopwords()) {
    j["stopwords"] = "english";
  } else {
    std::vector<std::string> words(cfg.stopwords.begin(), cfg.stopwords.end());
    std::sort(words.begin(), words.end());
    j["stopwords"] = words;
  }
  j["ngram_min"] = cfg.ngram_min;
  j["ngram_max"] = cfg.ngram_max;
  j["sublinear_tf"] = cfg.sublinear_tf;
  j["top_k"] = cfg.top_k;
  j["min_similarity"] = cfg.min_similarity;
  return j.dump();
}

RetrievalConfig load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open config file: " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return config_from_json(ss.str());
}
