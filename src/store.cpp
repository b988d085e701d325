#include "store.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <memory>
#include <stdexcept>

struct Store::Impl {
  sqlite3* db = nullptr;
  std::string path;

  [[noreturn]] void fail(const std::string& what) const {
    throw std::runtime_error("sqlite " + what + ": " + sqlite3_errmsg(db));
  }

  void exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
      std::string e = err ? err : "unknown";
      sqlite3_free(err);
      throw std::runtime_error("sqlite exec: " + e);
    }
  }

  sqlite3_stmt* prepare(const char* sql) const {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) fail("prepare");
    return st;
  }

  void step_done(sqlite3_stmt* st) {
    if (sqlite3_step(st) != SQLITE_DONE) {
      sqlite3_finalize(st);
      fail("insert");
    }
    sqlite3_reset(st);
    sqlite3_clear_bindings(st);
  }

  std::string meta(const std::string& key) const {
    sqlite3_stmt* st = prepare("SELECT value FROM meta WHERE key=?");
    sqlite3_bind_text(st, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    std::string v;
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
      v = reinterpret_cast<const char*>(sqlite3_column_text(st, 0));
    } else {
      sqlite3_finalize(st);
      throw std::runtime_error("store: missing meta key '" + key + "' in " + path);
    }
    sqlite3_finalize(st);
    return v;
  }
};

Store::Store(const std::string& path, bool read_only) : impl_(nullptr) {
  if (read_only) {
    if (!std::filesystem::exists(path))
      throw std::runtime_error("store: no index at " + path);
  } else {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
  }

  std::unique_ptr<Impl> holder(new Impl);
  holder->path = path;
  int flags = read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  if (sqlite3_open_v2(path.c_str(), &holder->db, flags, nullptr) != SQLITE_OK) {
    std::string e = holder->db ? sqlite3_errmsg(holder->db) : "out of memory";
    sqlite3_close(holder->db);
    throw std::runtime_error("sqlite open failed: " + e);
  }
  impl_ = holder.get();
  if (!read_only) {
    try {
      ensure_schema();
    } catch (...) {
      sqlite3_close(holder->db);
      impl_ = nullptr;
      throw;
    }
  }
  holder.release();
}

Store::~Store() {
  if (impl_) {
    if (impl_->db) sqlite3_close(impl_->db);
    delete impl_;
  }
}

void Store::ensure_schema() {
  impl_->exec(
    "CREATE TABLE IF NOT EXISTS meta ("
    " key TEXT PRIMARY KEY,"
    " value TEXT NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS chunks ("
    " id INTEGER PRIMARY KEY,"
    " document TEXT NOT NULL,"
    " start INTEGER NOT NULL,"
    " text TEXT NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS terms ("
    " id INTEGER PRIMARY KEY,"
    " term TEXT NOT NULL UNIQUE,"
    " df INTEGER NOT NULL"
    ");");
}

bool Store::has_index() const {
  sqlite3_stmt* st = impl_->prepare("SELECT COUNT(*) FROM meta WHERE key='config'");
  bool found = sqlite3_step(st) == SQLITE_ROW && sqlite3_column_int(st, 0) > 0;
  sqlite3_finalize(st);
  return found;
}

void Store::save(const Index& index) {
  impl_->exec("BEGIN");
  sqlite3_stmt* st = nullptr;
  try {
    impl_->exec("DELETE FROM meta; DELETE FROM chunks; DELETE FROM terms;");

    st = impl_->prepare("INSERT INTO meta (key, value) VALUES (?, ?)");
    auto put = [&](const char* key, const std::string& value) {
      sqlite3_bind_text(st, 1, key, -1, SQLITE_TRANSIENT);
      sqlite3_bind_text(st, 2, value.c_str(), -1, SQLITE_TRANSIENT);
      impl_->step_done(st);
    };
    auto stats = index.stats();
    put("config", config_to_json(index.config()));
    put("n_chunks", std::to_string(index.vocabulary().n_chunks()));
    put("n_documents", std::to_string(stats.documents));
    sqlite3_finalize(st);

    st = impl_->prepare("INSERT INTO chunks (id, document, start, text) VALUES (?, ?, ?, ?)");
    for (auto& c : index.chunks()) {
      sqlite3_bind_int(st, 1, c.id);
      sqlite3_bind_text(st, 2, c.document.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_int64(st, 3, (sqlite3_int64)c.start);
      sqlite3_bind_text(st, 4, c.text.c_str(), (int)c.text.size(), SQLITE_TRANSIENT);
      impl_->step_done(st);
    }
    sqlite3_finalize(st);

    st = impl_->prepare("INSERT INTO terms (id, term, df) VALUES (?, ?, ?)");
    const auto& vocab = index.vocabulary();
    for (int i = 0; i < vocab.size(); ++i) {
      sqlite3_bind_int(st, 1, i);
      sqlite3_bind_text(st, 2, vocab.term(i).c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_int(st, 3, vocab.df(i));
      impl_->step_done(st);
    }
    sqlite3_finalize(st);

    impl_->exec("COMMIT");
  } catch (...) {
    // step_done finalizes on failure itself
    sqlite3_exec(impl_->db, "ROLLBACK", nullptr, nullptr, nullptr);
    throw;
  }
}

Index Store::load() const {
  if (!has_index()) throw std::runtime_error("store: no index saved in " + impl_->path);

  Index index(config_from_json(impl_->meta("config")));
  int n_chunks = std::stoi(impl_->meta("n_chunks"));
  int n_documents = std::stoi(impl_->meta("n_documents"));

  std::vector<std::string> terms;
  std::vector<int> df;
  sqlite3_stmt* st = impl_->prepare("SELECT id, term, df FROM terms ORDER BY id");
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    if (sqlite3_column_int(st, 0) != (int)terms.size()) {
      sqlite3_finalize(st);
      throw std::runtime_error("store: term ids are not contiguous");
    }
    terms.push_back(reinterpret_cast<const char*>(sqlite3_column_text(st, 1)));
    df.push_back(sqlite3_column_int(st, 2));
  }
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) impl_->fail("read terms");

  std::vector<Chunk> chunks;
  st = impl_->prepare("SELECT id, document, start, text FROM chunks ORDER BY id");
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    Chunk c;
    c.id = sqlite3_column_int(st, 0);
    c.document = reinterpret_cast<const char*>(sqlite3_column_text(st, 1));
    c.start = (size_t)sqlite3_column_int64(st, 2);
    c.text.assign(reinterpret_cast<const char*>(sqlite3_column_blob(st, 3)),
                  (size_t)sqlite3_column_bytes(st, 3));
    chunks.push_back(std::move(c));
  }
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) impl_->fail("read chunks");

  index.restore(std::move(chunks),
                Vocabulary(std::move(terms), std::move(df), n_chunks),
                n_documents);
  return index;
}
