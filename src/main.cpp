#include "cli.hpp"
#include "context.hpp"
#include "corpus.hpp"
#include "index.hpp"
#include "store.hpp"

#include <nlohmann/json.hpp>
#include <iomanip>
#include <iostream>

static void print_json(const QueryResult& r) {
  nlohmann::json out = nlohmann::json::array();
  int rank = 1;
  for (auto& h : r.hits) {
    out.push_back({ {"rank", rank++}, {"score", h.score}, {"source", h.document},
                    {"chunk_id", h.chunk_id}, {"text", h.text} });
  }
  std::cout << out.dump(2) << "\n";
}

static void print_hits(const QueryResult& r, int max_context) {
  if (!r.indexed) {
    std::cout << "No index available: the corpus had no searchable text.\n";
    return;
  }
  if (r.hits.empty()) {
    std::cout << "No relevant information found in documents.\n";
    return;
  }
  std::cout << "Retrieved context:\n";
  int i = 1;
  for (auto& h : r.hits) {
    std::cout << "  " << i++ << ". [" << h.document << "] ("
              << std::fixed << std::setprecision(4) << h.score << ") "
              << preview(h.text) << "...\n";
  }
  std::cout << "\n" << build_context(r.hits, (size_t)max_context) << "\n";
}

static int run(const Args& args) {
  if (args.mode == "index") {
    Index index(resolve_config(args));
    index.build(load_corpus(args.root_path));
    Store store(args.sqlite_path);
    store.save(index);
    auto s = index.stats();
    std::cerr << "Saved " << s.indexed_chunks << " chunk(s) and " << s.terms
              << " term(s) to " << args.sqlite_path << "\n";
    return 0;
  }

  // query: rebuild from --root, otherwise read the saved index
  Index index;
  int k;
  double min_similarity;
  if (!args.root_path.empty() && !args.sqlite_given) {
    auto cfg = resolve_config(args);
    index = Index(cfg);
    index.build(load_corpus(args.root_path));
    k = cfg.top_k;
    min_similarity = cfg.min_similarity;
  } else {
    if (has_build_options(args))
      std::cerr << "Ignoring --config and indexing options: the saved index keeps the settings it was built with\n";
    Store store(args.sqlite_path, /*read_only=*/true);
    index = store.load();
    k = args.k.value_or(index.config().top_k);
    min_similarity = args.min_similarity.value_or(index.config().min_similarity);
  }

  auto result = index.query(args.query, k, min_similarity);
  if (args.json) print_json(result);
  else print_hits(result, args.max_context);
  return 0;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);
  try {
    return run(args);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
  }
  return 1;
}
