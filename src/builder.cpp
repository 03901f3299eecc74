#include "builder.hpp"
#include <re2/re2.h>
#include <stdexcept>
#include <utility>

namespace {
std::string trim(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n");
  auto b = s.find_last_not_of(" \t\r\n");
  if (a == std::string::npos) return "";
  return s.substr(a, b - a + 1);
}

std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += '\n';
    out += lines[i];
  }
  return out;
}
}

Line classify_line(const std::string& line) {
  static const RE2 heading_re("(#+)(.*)", RE2::Latin1);
  std::string marks, rest;
  if (RE2::FullMatch(line, heading_re, &marks, &rest)) {
    std::string title = trim(rest);
    if (!title.empty()) return HeadingLine{ (int)marks.size(), std::move(title) };
  }
  return ContentLine{ line };
}

IndexBuilder::IndexBuilder(const std::string& doc_id) {
  if (doc_id.empty()) throw std::invalid_argument("doc_id must not be empty");
  doc_.doc_id_ = doc_id;
}

size_t IndexBuilder::add_node(std::optional<size_t> parent, std::string title, int depth,
                              std::string text) {
  auto& nodes = doc_.nodes_;
  size_t idx = nodes.size();

  SectionNode n;
  if (parent) {
    auto& siblings = nodes[*parent].children;
    n.id = nodes[*parent].id + "." + std::to_string(siblings.size() + 1);
    siblings.push_back(idx);
  } else {
    n.id = std::to_string(doc_.roots_.size() + 1);
    doc_.roots_.push_back(idx);
  }
  n.title = std::move(title);
  n.depth = depth;
  n.text = std::move(text);

  if (depth == 1 && !doc_.title_) doc_.title_ = n.title;
  doc_.lookup_.emplace(n.id, idx);
  nodes.push_back(std::move(n));
  return idx;
}

void IndexBuilder::close_body() {
  if (current_) doc_.nodes_[*current_].text = trim(join_lines(body_));
  body_.clear();
  current_.reset();
}

void IndexBuilder::heading(int depth, std::string title) {
  close_body();
  // a skipped level still nests one step: "# A" then "### B" makes B a child of A
  while (!open_.empty() && doc_.nodes_[open_.back()].depth >= depth) open_.pop_back();

  std::optional<size_t> parent;
  if (!open_.empty()) parent = open_.back();
  size_t idx = add_node(parent, std::move(title), depth);
  open_.push_back(idx);
  current_ = idx;
}

void IndexBuilder::content(const std::string& line) {
  // text before the first heading belongs to no node
  if (current_) body_.push_back(line);
}

DocumentIndex IndexBuilder::finish() {
  close_body();
  open_.clear();
  return std::move(doc_);
}

DocumentIndex build_index(const std::string& doc_id, const std::string& text) {
  IndexBuilder b(doc_id);
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string::npos) nl = text.size();
    std::string line = text.substr(pos, nl - pos);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    auto parsed = classify_line(line);
    if (auto* h = std::get_if<HeadingLine>(&parsed)) b.heading(h->level, std::move(h->title));
    else b.content(std::get<ContentLine>(parsed).text);

    pos = nl + 1;
  }
  return b.finish();
}
