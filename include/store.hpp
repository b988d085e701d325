#pragma once
#include "index.hpp"
#include <string>

// SQLite file holding a built index: chunk texts, the vocabulary with its
// document frequencies, and the config the index was built with. Vectors
// are recomputed on load.
class Store {
public:
  // A read-only store never creates the file; it throws if the file is
  // missing, and save() fails on it.
  explicit Store(const std::string& sqlite_path, bool read_only = false);
  ~Store();
  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  void ensure_schema();
  bool has_index() const;
  // Replaces whatever the file held before, in one transaction.
  void save(const Index& index);
  Index load() const;

private:
  struct Impl;
  Impl* impl_;
};
