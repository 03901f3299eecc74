#include "document.hpp"
#include <algorithm>

namespace {
size_t nesting_of(const std::string& id) {
  return (size_t)std::count(id.begin(), id.end(), '.') + 1;
}

void collect_text(const std::vector<SectionNode>& nodes, size_t i, std::vector<const std::string*>& out) {
  if (!nodes[i].text.empty()) out.push_back(&nodes[i].text);
  for (size_t c : nodes[i].children) collect_text(nodes, c, out);
}

void collect_preorder(const std::vector<SectionNode>& nodes, size_t i, std::vector<size_t>& out) {
  out.push_back(i);
  for (size_t c : nodes[i].children) collect_preorder(nodes, c, out);
}
}

std::vector<size_t> DocumentIndex::preorder() const {
  std::vector<size_t> order;
  order.reserve(nodes_.size());
  for (size_t r : roots_) collect_preorder(nodes_, r, order);
  return order;
}

const SectionNode& DocumentIndex::resolve(const std::string& id) const {
  auto it = lookup_.find(id);
  if (it == lookup_.end()) throw NotFound(id);
  return nodes_[it->second];
}

std::vector<std::string> DocumentIndex::breadcrumb(const std::string& id) const {
  std::vector<std::string> out;
  size_t dot = 0;
  while (true) {
    dot = id.find('.', dot);
    out.push_back(resolve(id.substr(0, dot)).title);
    if (dot == std::string::npos) break;
    ++dot;
  }
  return out;
}

std::string DocumentIndex::outline() const {
  std::string out;
  for (size_t i : preorder()) {
    const auto& n = nodes_[i];
    if (!out.empty()) out += '\n';
    out.append(2 * (nesting_of(n.id) - 1), ' ');
    out += "[" + n.id + "] " + n.title;
  }
  return out;
}

std::vector<std::string> DocumentIndex::node_ids() const {
  std::vector<std::string> ids;
  ids.reserve(nodes_.size());
  for (size_t i : preorder()) ids.push_back(nodes_[i].id);
  return ids;
}

NodeRecord DocumentIndex::get_node(const std::string& id) const {
  const auto& n = resolve(id);
  return NodeRecord{ n.id, n.title, n.text, n.depth, breadcrumb(id) };
}

NodeRecord DocumentIndex::get_node_with_children(const std::string& id) const {
  auto it = lookup_.find(id);
  if (it == lookup_.end()) throw NotFound(id);

  std::vector<const std::string*> parts;
  collect_text(nodes_, it->second, parts);
  std::string text;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) text += "\n\n";
    text += *parts[i];
  }

  const auto& n = nodes_[it->second];
  return NodeRecord{ n.id, n.title, std::move(text), n.depth, breadcrumb(id) };
}

std::vector<ChildEntry> DocumentIndex::get_children(const std::string& id) const {
  const auto& n = resolve(id);
  std::vector<ChildEntry> out;
  out.reserve(n.children.size());
  for (size_t c : n.children) out.push_back(ChildEntry{ nodes_[c].id, nodes_[c].title });
  return out;
}
