#include "store.hpp"
#include "projection.hpp"
#include <sqlite3.h>
#include <stdexcept>

struct Store::Impl {
  sqlite3* db = nullptr;

  sqlite3_stmt* prepare(const char* sql) const {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
      throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    return st;
  }
};

Store::Store(const std::string& path, bool read_only) : impl_(new Impl) {
  int flags = read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  if (sqlite3_open_v2(path.c_str(), &impl_->db, flags, nullptr) != SQLITE_OK) {
    std::string e = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
    sqlite3_close(impl_->db);
    delete impl_;
    throw std::runtime_error("sqlite open failed: " + e);
  }
  if (read_only) return;
  try {
    ensure_schema();
  } catch (...) {
    sqlite3_close(impl_->db);
    delete impl_;
    throw;
  }
}

Store::~Store() {
  if (impl_) {
    if (impl_->db) sqlite3_close(impl_->db);
    delete impl_;
  }
}

void Store::ensure_schema() {
  const char* sql =
    "CREATE TABLE IF NOT EXISTS documents ("
    " doc_id TEXT PRIMARY KEY,"
    " title TEXT,"
    " node_count INTEGER NOT NULL,"
    " tree_json TEXT NOT NULL"
    ");";
  char* err=nullptr;
  if (sqlite3_exec(impl_->db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string e = err ? err : "unknown";
    sqlite3_free(err);
    throw std::runtime_error("sqlite schema: " + e);
  }
}

void Store::upsert_document(const DocumentIndex& doc) {
  const char* sql =
    "INSERT INTO documents (doc_id, title, node_count, tree_json) "
    "VALUES (?, ?, ?, ?) "
    "ON CONFLICT(doc_id) DO UPDATE SET "
    " title=excluded.title, node_count=excluded.node_count, tree_json=excluded.tree_json;";
  std::string tree = to_json(doc);
  sqlite3_stmt* st = impl_->prepare(sql);
  sqlite3_bind_text(st, 1, doc.doc_id().c_str(), -1, SQLITE_TRANSIENT);
  if (doc.title()) sqlite3_bind_text(st, 2, doc.title()->c_str(), -1, SQLITE_TRANSIENT);
  else sqlite3_bind_null(st, 2);
  sqlite3_bind_int(st, 3, (int)doc.size());
  sqlite3_bind_text(st, 4, tree.c_str(), (int)tree.size(), SQLITE_TRANSIENT);

  if (sqlite3_step(st) != SQLITE_DONE) {
    std::string e = sqlite3_errmsg(impl_->db);
    sqlite3_finalize(st);
    throw std::runtime_error("sqlite upsert failed: " + e);
  }
  sqlite3_finalize(st);
}

DocumentIndex Store::load_document(const std::string& doc_id) const {
  sqlite3_stmt* st = impl_->prepare("SELECT tree_json FROM documents WHERE doc_id=?");
  sqlite3_bind_text(st, 1, doc_id.c_str(), -1, SQLITE_TRANSIENT);
  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(st);
    if (rc == SQLITE_DONE) throw NotFound(doc_id);
    throw std::runtime_error(std::string("sqlite select failed: ") + sqlite3_errmsg(impl_->db));
  }
  std::string tree(reinterpret_cast<const char*>(sqlite3_column_text(st, 0)),
                   (size_t)sqlite3_column_bytes(st, 0));
  sqlite3_finalize(st);
  return from_json(tree);
}

std::vector<StoredDocument> Store::list_documents() const {
  sqlite3_stmt* st = impl_->prepare(
    "SELECT doc_id, title, node_count FROM documents ORDER BY doc_id");
  std::vector<StoredDocument> out;
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    StoredDocument d;
    d.doc_id = reinterpret_cast<const char*>(sqlite3_column_text(st, 0));
    auto* t = sqlite3_column_text(st, 1);
    d.title = t ? reinterpret_cast<const char*>(t) : "";
    d.node_count = sqlite3_column_int(st, 2);
    out.push_back(std::move(d));
  }
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite list failed");
  return out;
}

bool Store::remove_document(const std::string& doc_id) {
  sqlite3_stmt* st = impl_->prepare("DELETE FROM documents WHERE doc_id=?");
  sqlite3_bind_text(st, 1, doc_id.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(st) != SQLITE_DONE) {
    std::string e = sqlite3_errmsg(impl_->db);
    sqlite3_finalize(st);
    throw std::runtime_error("sqlite delete failed: " + e);
  }
  sqlite3_finalize(st);
  return sqlite3_changes(impl_->db) > 0;
}
