#pragma once
#include "config.hpp"
#include <optional>
#include <string>

struct Args {
  std::string mode;          // "index" or "query"
  std::string root_path;
  std::string sqlite_path = "./index/docqa.sqlite";
  bool sqlite_given = false;
  std::string config_path;
  std::string query;
  bool json = false;
  int max_context = 0;       // code points, 0 = unbounded

  // overrides on top of the config file (or the defaults)
  std::optional<int> chunk_size;
  std::optional<int> chunk_overlap;
  std::optional<int> max_features;
  std::optional<std::string> stopwords;   // "english", "none" or a file
  std::optional<int> ngram_min;
  std::optional<int> ngram_max;
  bool sublinear = false;
  std::optional<int> k;
  std::optional<double> min_similarity;
};

// Prints usage and exits on malformed arguments.
Args parse_cli(int argc, char** argv);

// True when any flag that shapes how an index is built was given. A query
// answered from a saved index ignores them.
bool has_build_options(const Args& a);

// Config file first, then command-line overrides. Throws ConfigError.
RetrievalConfig resolve_config(const Args& a);
