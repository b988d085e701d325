#include "cli.hpp"
#include <cstdlib>
#include <iostream>

static const char* USAGE =
"docqa index <root> [--sqlite path] [options]\n"
"docqa query \"text\" (--root dir | --sqlite path) [options] [--json] [--max-context N]\n"
"options: --config file.json --chunk-size N --chunk-overlap N --max-features N\n"
"         --stopwords english|none|<file> --ngram MIN,MAX --sublinear\n"
"         -k N --min-similarity X\n";

[[noreturn]] static void usage() {
  std::cerr << USAGE;
  std::exit(1);
}

static int to_int(const std::string& flag, const std::string& v) {
  try {
    size_t used = 0;
    int n = std::stoi(v, &used);
    if (used == v.size()) return n;
  } catch (const std::exception&) {}
  std::cerr << "Bad integer for " << flag << ": " << v << "\n";
  std::exit(1);
}

static double to_double(const std::string& flag, const std::string& v) {
  try {
    size_t used = 0;
    double x = std::stod(v, &used);
    if (used == v.size()) return x;
  } catch (const std::exception&) {}
  std::cerr << "Bad number for " << flag << ": " << v << "\n";
  std::exit(1);
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 3) usage();
  a.mode = argv[1];
  int i = 2;
  if (a.mode == "index") a.root_path = argv[i++];
  else if (a.mode == "query") a.query = argv[i++];
  else usage();

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&]() -> std::string {
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      return argv[i++];
    };
    if (f == "--sqlite") { a.sqlite_path = next(); a.sqlite_given = true; }
    else if (f == "--root") a.root_path = next();
    else if (f == "--config") a.config_path = next();
    else if (f == "--json") a.json = true;
    else if (f == "--max-context") a.max_context = to_int(f, next());
    else if (f == "--chunk-size") a.chunk_size = to_int(f, next());
    else if (f == "--chunk-overlap") a.chunk_overlap = to_int(f, next());
    else if (f == "--max-features") a.max_features = to_int(f, next());
    else if (f == "--stopwords") a.stopwords = next();
    else if (f == "--ngram") {
      std::string v = next();
      auto comma = v.find(',');
      if (comma == std::string::npos) {
        a.ngram_min = a.ngram_max = to_int(f, v);
      } else {
        a.ngram_min = to_int(f, v.substr(0, comma));
        a.ngram_max = to_int(f, v.substr(comma + 1));
      }
    }
    else if (f == "--sublinear") a.sublinear = true;
    else if (f == "-k") a.k = to_int(f, next());
    else if (f == "--min-similarity") a.min_similarity = to_double(f, next());
    else { std::cerr << "Unknown flag: " << f << "\n"; usage(); }
  }
  if (a.max_context < 0) { std::cerr << "--max-context must not be negative\n"; std::exit(1); }
  return a;
}

bool has_build_options(const Args& a) {
  return !a.config_path.empty() || a.chunk_size || a.chunk_overlap || a.max_features ||
         a.stopwords || a.ngram_min || a.ngram_max || a.sublinear;
}

RetrievalConfig resolve_config(const Args& a) {
  RetrievalConfig cfg = a.config_path.empty() ? RetrievalConfig() : load_config(a.config_path);
  if (a.chunk_size) cfg.chunk_size = *a.chunk_size;
  if (a.chunk_overlap) cfg.chunk_overlap = *a.chunk_overlap;
  if (a.max_features) cfg.max_features = *a.max_features;
  if (a.stopwords) {
    if (*a.stopwords == "english") cfg.stopwords = english_stopwords();
    else if (*a.stopwords == "none") cfg.stopwords.clear();
    else cfg.stopwords = load_stopwords(*a.stopwords);
  }
  if (a.ngram_min) cfg.ngram_min = *a.ngram_min;
  if (a.ngram_max) cfg.ngram_max = *a.ngram_max;
  if (a.sublinear) cfg.sublinear_tf = true;
  if (a.k) cfg.top_k = *a.k;
  if (a.min_similarity) cfg.min_similarity = *a.min_similarity;
  cfg.validate();
  return cfg;
}
