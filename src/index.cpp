#include "index.hpp"
#include "ranker.hpp"
#include <iostream>

struct Index::Impl {
  RetrievalConfig cfg;
  Vectorizer vectorizer;
  std::vector<Chunk> chunks;
  std::vector<ChunkVector> vectors;
  int documents = 0;

  explicit Impl(const RetrievalConfig& c) : cfg(c), vectorizer(c) {}

  void reset() {
    vectorizer = Vectorizer(cfg);
    chunks.clear();
    vectors.clear();
    documents = 0;
  }

  // keeps only chunks with a usable vector
  void store(std::vector<Chunk>& all, std::vector<ChunkVector>& vecs) {
    for (size_t i = 0; i < all.size(); ++i) {
      if (vecs[i].empty()) {
        std::cerr << "Skipping chunk " << all[i].id << " of " << all[i].document
                  << ": no vocabulary terms\n";
        continue;
      }
      chunks.push_back(std::move(all[i]));
      vectors.push_back(std::move(vecs[i]));
    }
  }
};

Index::Index(const RetrievalConfig& cfg) {
  cfg.validate();
  impl_.reset(new Impl(cfg));
}

Index::~Index() = default;
Index::Index(Index&&) noexcept = default;
Index& Index::operator=(Index&&) noexcept = default;

void Index::build(const Corpus& corpus) {
  impl_->reset();
  impl_->documents = (int)corpus.size();
  if (corpus.empty()) {
    std::cerr << "Index: no documents\n";
    return;
  }

  auto all = chunk_corpus(corpus, impl_->cfg.chunk_size, impl_->cfg.chunk_overlap);
  if (all.empty()) {
    std::cerr << "Index: documents produced no chunks\n";
    return;
  }

  std::vector<std::string> texts;
  texts.reserve(all.size());
  for (auto& c : all) texts.push_back(c.text);
  auto vecs = impl_->vectorizer.fit_transform(texts);
  if (impl_->vectorizer.vocabulary().empty()) {
    std::cerr << "Index: empty vocabulary, nothing to search\n";
    return;
  }
  impl_->store(all, vecs);

  std::cerr << "Indexed " << impl_->documents << " document(s), "
            << texts.size() << " chunk(s), "
            << impl_->vectorizer.vocabulary().size() << " term(s)\n";
}

void Index::restore(std::vector<Chunk> chunks, Vocabulary vocab, int documents) {
  impl_->reset();
  impl_->documents = documents;
  impl_->vectorizer.set_vocabulary(std::move(vocab));
  std::vector<ChunkVector> vecs;
  vecs.reserve(chunks.size());
  for (auto& c : chunks) vecs.push_back(impl_->vectorizer.transform(c.text));
  impl_->store(chunks, vecs);
}

QueryResult Index::query(const std::string& text) const {
  return query(text, impl_->cfg.top_k, impl_->cfg.min_similarity);
}

QueryResult Index::query(const std::string& text, int k) const {
  return query(text, k, impl_->cfg.min_similarity);
}

QueryResult Index::query(const std::string& text, int k, double min_similarity) const {
  if (k < 0) throw ConfigError("top_k must not be negative");
  QueryResult r;
  if (empty()) return r;
  r.indexed = true;

  auto q = impl_->vectorizer.transform(text);
  for (auto& s : rank(q, impl_->vectors, k, min_similarity)) {
    const Chunk& c = impl_->chunks[s.index];
    r.hits.push_back(Hit{ c.id, c.document, c.text, s.score });
  }
  return r;
}

bool Index::empty() const {
  return impl_->chunks.empty() || impl_->vectorizer.vocabulary().empty();
}

IndexStats Index::stats() const {
  IndexStats s;
  s.documents = impl_->documents;
  s.chunks = impl_->vectorizer.vocabulary().n_chunks();
  s.indexed_chunks = (int)impl_->chunks.size();
  s.terms = impl_->vectorizer.vocabulary().size();
  return s;
}

const RetrievalConfig& Index::config() const { return impl_->cfg; }
const Vocabulary& Index::vocabulary() const { return impl_->vectorizer.vocabulary(); }
const std::vector<Chunk>& Index::chunks() const { return impl_->chunks; }
const std::vector<ChunkVector>& Index::vectors() const { return impl_->vectors; }
