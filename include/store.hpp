#pragma once
#include "document.hpp"
#include <string>
#include <vector>

struct StoredDocument {
  std::string doc_id;
  std::string title;      // empty when the document has no top-level heading
  int node_count;
};

// SQLite table of JSON projections keyed by doc_id. One connection per Store.
// A read-only Store never creates the file or the schema.
class Store {
public:
  explicit Store(const std::string& sqlite_path, bool read_only = false);
  ~Store();
  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  void ensure_schema();
  void upsert_document(const DocumentIndex& doc);
  DocumentIndex load_document(const std::string& doc_id) const;   // throws NotFound
  std::vector<StoredDocument> list_documents() const;
  bool remove_document(const std::string& doc_id);

private:
  struct Impl;
  Impl* impl_;
};
