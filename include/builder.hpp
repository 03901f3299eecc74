#pragma once
#include "document.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct HeadingLine {
  int level;           // number of leading '#'
  std::string title;   // trimmed, never empty
};

struct ContentLine {
  std::string text;
};

using Line = std::variant<HeadingLine, ContentLine>;

// "#...# title" is a heading; anything else (including a bare "###") is content.
Line classify_line(const std::string& line);

// Folds headings and content lines into a DocumentIndex. add_node() may attach
// to any earlier node; the builder is spent after finish().
class IndexBuilder {
public:
  explicit IndexBuilder(const std::string& doc_id);

  // Appends a node under `parent` (or at top level) and assigns the next
  // sibling identifier. Returns the node's arena index.
  size_t add_node(std::optional<size_t> parent, std::string title, int depth,
                  std::string text = {});
  const std::string& id_of(size_t idx) const { return doc_.nodes_[idx].id; }

  void heading(int depth, std::string title);
  void content(const std::string& line);

  DocumentIndex finish();

private:
  void close_body();

  DocumentIndex doc_;
  std::vector<size_t> open_;       // open ancestors, innermost last
  std::optional<size_t> current_;  // node receiving content lines
  std::vector<std::string> body_;
};

// One-pass build. Text without headings gives a zero-node index.
DocumentIndex build_index(const std::string& doc_id, const std::string& text);
