#pragma once
#include "chunker.hpp"
#include "config.hpp"
#include "vectorizer.hpp"
#include <memory>
#include <string>
#include <vector>

struct Hit {
  int chunk_id;
  std::string document;
  std::string text;
  double score;
};

struct QueryResult {
  bool indexed = false;      // false: nothing to search
  std::vector<Hit> hits;     // best first
};

struct IndexStats {
  int documents = 0;
  int chunks = 0;            // chunks the vocabulary was fitted on
  int indexed_chunks = 0;    // chunks with a non-zero vector
  int terms = 0;
};

// Vocabulary plus (chunk, vector) pairs. build() replaces everything;
// query() never mutates, so a built Index can serve concurrent readers.
class Index {
public:
  // Throws ConfigError when cfg is invalid.
  explicit Index(const RetrievalConfig& cfg = RetrievalConfig());
  ~Index();
  Index(Index&&) noexcept;
  Index& operator=(Index&&) noexcept;

  void build(const Corpus& corpus);

  // Rebuilds vectors for already-chunked text against a stored vocabulary.
  void restore(std::vector<Chunk> chunks, Vocabulary vocab, int documents);

  QueryResult query(const std::string& text) const;
  QueryResult query(const std::string& text, int k) const;
  // Throws ConfigError when k is negative.
  QueryResult query(const std::string& text, int k, double min_similarity) const;

  bool empty() const;
  IndexStats stats() const;
  const RetrievalConfig& config() const;
  const Vocabulary& vocabulary() const;
  // chunks()[i] pairs with vectors()[i]
  const std::vector<Chunk>& chunks() const;
  const std::vector<ChunkVector>& vectors() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
