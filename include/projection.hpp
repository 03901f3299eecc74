#pragma once
#include "document.hpp"
#include <stdexcept>
#include <string>

// Thrown when a JSON projection cannot be turned back into an index.
class ProjectionError : public std::runtime_error {
public:
  explicit ProjectionError(const std::string& what)
    : std::runtime_error("projection: " + what) {}
};

// {"doc_id", "title", "nodes": [{"node_id","title","depth","text","children"}]}
std::string to_json(const DocumentIndex& doc, int indent = 2);

// Rebuilds an index from to_json() output. Identifiers are re-derived from
// position and must match the stored ones.
DocumentIndex from_json(const std::string& text);
