#pragma once
#include "section.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class DocumentIndex {
public:
  DocumentIndex() = default;

  const std::string& doc_id() const { return doc_id_; }
  const std::optional<std::string>& title() const { return title_; }

  size_t size() const { return nodes_.size(); }
  bool is_empty() const { return nodes_.empty(); }
  bool contains(const std::string& id) const { return lookup_.count(id) != 0; }

  // Indented "[id] title" lines in pre-order.
  std::string outline() const;
  std::vector<std::string> node_ids() const;

  NodeRecord get_node(const std::string& id) const;
  NodeRecord get_node_with_children(const std::string& id) const;
  std::vector<ChildEntry> get_children(const std::string& id) const;

  // Raw access for serializers; indices come from roots() and SectionNode::children.
  const std::vector<size_t>& roots() const { return roots_; }
  const SectionNode& node(size_t i) const { return nodes_[i]; }

private:
  friend class IndexBuilder;

  const SectionNode& resolve(const std::string& id) const;
  std::vector<size_t> preorder() const;   // arena indices, parents before descendants
  std::vector<std::string> breadcrumb(const std::string& id) const;

  std::string doc_id_;
  std::optional<std::string> title_;
  std::vector<SectionNode> nodes_;                  // arena, insertion order
  std::vector<size_t> roots_;                       // top-level nodes
  std::unordered_map<std::string, size_t> lookup_;  // id -> arena index
};
