#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

struct SectionNode {
  std::string id;                  // dotted identifier, e.g. "2.3.1"
  std::string title;
  int depth = 0;                   // raw heading level (# count)
  std::string text;                // trimmed body between this heading and the next
  std::vector<size_t> children;    // arena indices, document order
};

struct NodeRecord {
  std::string node_id;
  std::string title;
  std::string text;
  int depth = 0;
  std::vector<std::string> breadcrumb; // ancestors' titles then own title
};

struct ChildEntry {
  std::string node_id;
  std::string title;
};

inline bool operator==(const ChildEntry& a, const ChildEntry& b) {
  return a.node_id == b.node_id && a.title == b.title;
}

// Thrown when a node or stored document identifier does not exist.
class NotFound : public std::runtime_error {
public:
  explicit NotFound(const std::string& id)
    : std::runtime_error("not found: " + id), id_(id) {}
  const std::string& id() const { return id_; }

private:
  std::string id_;
};
