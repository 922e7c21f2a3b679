#include "newsdesk/index/document_store.hpp"

#include <sqlite3.h>

#include <algorithm>

namespace newsdesk::index {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::IoError, msg);
  }
  return common::Status::success();
}

struct DbCloser {
  void operator()(sqlite3 *db) const { sqlite3_close(db); }
};

struct StmtFinalizer {
  void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
};

using DbHandle = std::unique_ptr<sqlite3, DbCloser>;
using StmtHandle = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional(sqlite3_stmt *stmt, const int index, const std::optional<std::string> &value) {
  if (value.has_value()) {
    bind_text(stmt, index, *value);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::string column_text(sqlite3_stmt *stmt, const int index) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
  if (text == nullptr) {
    return {};
  }
  return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

std::optional<std::string> column_optional(sqlite3_stmt *stmt, const int index) {
  if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, index);
}

constexpr const char *kSchema = R"(
CREATE TABLE documents (
  id TEXT PRIMARY KEY,
  content_hash TEXT NOT NULL UNIQUE,
  category TEXT NOT NULL,
  text TEXT NOT NULL,
  source_url TEXT,
  title TEXT,
  chunk_index INTEGER NOT NULL DEFAULT 0,
  ingested_at TEXT NOT NULL,
  sequence INTEGER NOT NULL UNIQUE
);
CREATE INDEX idx_documents_category ON documents(category);
)";

} // namespace

std::optional<std::string> DocumentStore::find_by_hash(const std::string &content_hash) const {
  const auto it = id_by_hash_.find(content_hash);
  if (it == id_by_hash_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const Document *DocumentStore::get(const std::string &id) const {
  const auto it = by_id_.find(id);
  return it == by_id_.end() ? nullptr : it->second.get();
}

bool DocumentStore::contains(const std::string &id) const { return by_id_.contains(id); }

common::Status DocumentStore::add(Document document) {
  if (by_id_.contains(document.id)) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "duplicate document id: " + document.id);
  }
  if (id_by_hash_.contains(document.content_hash)) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "duplicate content hash: " + document.content_hash);
  }
  if (document.sequence == 0 || id_by_sequence_.contains(document.sequence)) {
    document.sequence = next_sequence_;
  }
  next_sequence_ = std::max(next_sequence_, document.sequence + 1);

  id_by_hash_[document.content_hash] = document.id;
  id_by_sequence_[document.sequence] = document.id;
  auto id = document.id;
  by_id_.emplace(std::move(id), std::make_shared<const Document>(std::move(document)));
  return common::Status::success();
}

bool DocumentStore::remove(const std::string &id) {
  const auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return false;
  }
  id_by_hash_.erase(it->second->content_hash);
  id_by_sequence_.erase(it->second->sequence);
  by_id_.erase(it);
  return true;
}

void DocumentStore::clear() {
  by_id_.clear();
  id_by_hash_.clear();
  id_by_sequence_.clear();
}

std::vector<const Document *> DocumentStore::documents() const {
  std::vector<const Document *> out;
  out.reserve(by_id_.size());
  for (const auto &[sequence, id] : id_by_sequence_) {
    out.push_back(by_id_.at(id).get());
  }
  return out;
}

std::size_t DocumentStore::count_in(const std::string &category) const {
  return static_cast<std::size_t>(
      std::count_if(by_id_.begin(), by_id_.end(),
                    [&](const auto &entry) { return entry.second->category == category; }));
}

common::Status DocumentStore::save(const std::filesystem::path &path) const {
  std::error_code ec;
  std::filesystem::remove(path, ec);

  sqlite3 *raw = nullptr;
  if (sqlite3_open(path.string().c_str(), &raw) != SQLITE_OK) {
    const std::string message = raw == nullptr ? "out of memory" : sqlite3_errmsg(raw);
    sqlite3_close(raw);
    return common::Status::error(common::ErrorCode::IoError,
                                 "failed to create " + path.string() + ": " + message);
  }
  DbHandle db(raw);

  auto status = exec_sql(db.get(), kSchema);
  if (!status.ok()) {
    return status;
  }
  status = exec_sql(db.get(), "BEGIN;");
  if (!status.ok()) {
    return status;
  }

  constexpr const char *kInsert =
      "INSERT INTO documents (id, content_hash, category, text, source_url, title, chunk_index, "
      "ingested_at, sequence) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9);";
  sqlite3_stmt *raw_stmt = nullptr;
  if (sqlite3_prepare_v2(db.get(), kInsert, -1, &raw_stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorCode::IoError, sqlite3_errmsg(db.get()));
  }
  StmtHandle stmt(raw_stmt);

  for (const auto *doc : documents()) {
    bind_text(stmt.get(), 1, doc->id);
    bind_text(stmt.get(), 2, doc->content_hash);
    bind_text(stmt.get(), 3, doc->category);
    bind_text(stmt.get(), 4, doc->text);
    bind_optional(stmt.get(), 5, doc->source_url);
    bind_optional(stmt.get(), 6, doc->title);
    sqlite3_bind_int64(stmt.get(), 7, static_cast<sqlite3_int64>(doc->chunk_index));
    bind_text(stmt.get(), 8, doc->ingested_at);
    sqlite3_bind_int64(stmt.get(), 9, static_cast<sqlite3_int64>(doc->sequence));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      const std::string message = sqlite3_errmsg(db.get());
      stmt.reset();
      (void)exec_sql(db.get(), "ROLLBACK;");
      return common::Status::error(common::ErrorCode::IoError, "insert failed: " + message);
    }
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
  }
  stmt.reset();

  return exec_sql(db.get(), "COMMIT;");
}

common::Result<DocumentStore> DocumentStore::load(const std::filesystem::path &path) {
  using StoreResult = common::Result<DocumentStore>;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return StoreResult::failure(common::ErrorCode::Corrupt,
                                "document database missing: " + path.string());
  }

  sqlite3 *raw = nullptr;
  if (sqlite3_open_v2(path.string().c_str(), &raw, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
    const std::string message = raw == nullptr ? "out of memory" : sqlite3_errmsg(raw);
    sqlite3_close(raw);
    return StoreResult::failure(common::ErrorCode::Corrupt,
                                "cannot open " + path.string() + ": " + message);
  }
  DbHandle db(raw);

  constexpr const char *kSelect =
      "SELECT id, content_hash, category, text, source_url, title, chunk_index, ingested_at, "
      "sequence FROM documents ORDER BY sequence;";
  sqlite3_stmt *raw_stmt = nullptr;
  if (sqlite3_prepare_v2(db.get(), kSelect, -1, &raw_stmt, nullptr) != SQLITE_OK) {
    return StoreResult::failure(common::ErrorCode::Corrupt,
                                "document table unreadable: " +
                                    std::string(sqlite3_errmsg(db.get())));
  }
  StmtHandle stmt(raw_stmt);

  DocumentStore store;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    Document doc{
        .id = column_text(stmt.get(), 0),
        .text = column_text(stmt.get(), 3),
        .category = column_text(stmt.get(), 2),
        .source_url = column_optional(stmt.get(), 4),
        .title = column_optional(stmt.get(), 5),
        .chunk_index = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 6)),
        .content_hash = column_text(stmt.get(), 1),
        .ingested_at = column_text(stmt.get(), 7),
        .sequence = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 8)),
    };
    if (content_hash_for(doc.text) != doc.content_hash) {
      return StoreResult::failure(common::ErrorCode::Corrupt,
                                  "content hash mismatch for " + doc.id);
    }
    const std::uint64_t sequence = doc.sequence;
    auto status = store.add(std::move(doc));
    if (!status.ok()) {
      return StoreResult::failure(common::ErrorCode::Corrupt, status.error());
    }
    if (store.id_by_sequence_.rbegin()->first != sequence) {
      return StoreResult::failure(common::ErrorCode::Corrupt,
                                  "invalid sequence number " + std::to_string(sequence));
    }
  }
  if (rc != SQLITE_DONE) {
    return StoreResult::failure(common::ErrorCode::Corrupt,
                                "document scan failed: " + std::string(sqlite3_errmsg(db.get())));
  }

  return StoreResult::success(std::move(store));
}

} // namespace newsdesk::index
