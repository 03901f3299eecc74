#include "projection.hpp"
#include "builder.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <optional>

using json = nlohmann::ordered_json;

namespace {
json node_to_json(const DocumentIndex& doc, size_t i) {
  const auto& n = doc.node(i);
  json j;
  j["node_id"] = n.id;
  j["title"] = n.title;
  j["depth"] = n.depth;
  j["text"] = n.text;
  j["children"] = json::array();
  for (size_t c : n.children) j["children"].push_back(node_to_json(doc, c));
  return j;
}

const json& field(const json& j, const char* key) {
  if (!j.is_object() || !j.contains(key)) throw ProjectionError(std::string("missing field '") + key + "'");
  return j.at(key);
}

void add_nodes(IndexBuilder& b, const json& arr, std::optional<size_t> parent) {
  if (!arr.is_array()) throw ProjectionError("'nodes'/'children' must be an array");
  for (auto& jn : arr) {
    std::string id, title, text;
    int depth = 0;
    try {
      id = field(jn, "node_id").get<std::string>();
      title = field(jn, "title").get<std::string>();
      const json& jd = field(jn, "depth");
      if (!jd.is_number_integer()) throw ProjectionError("node " + id + " has a non-integer depth");
      auto raw = jd.get<std::int64_t>();
      if (raw < 1 || raw > std::numeric_limits<int>::max())
        throw ProjectionError("node " + id + " has depth out of range");
      depth = (int)raw;
      text = field(jn, "text").get<std::string>();
    } catch (const json::type_error& e) {
      throw ProjectionError(e.what());
    }

    size_t idx = b.add_node(parent, std::move(title), depth, std::move(text));
    // compare against the identifier the builder derived from position
    const std::string& derived = b.id_of(idx);
    if (derived != id) throw ProjectionError("node " + id + " found where " + derived + " belongs");

    if (jn.contains("children")) add_nodes(b, jn.at("children"), idx);
  }
}
}

std::string to_json(const DocumentIndex& doc, int indent) {
  json j;
  j["doc_id"] = doc.doc_id();
  if (doc.title()) j["title"] = *doc.title();
  else j["title"] = nullptr;
  j["nodes"] = json::array();
  for (size_t r : doc.roots()) j["nodes"].push_back(node_to_json(doc, r));
  return j.dump(indent);
}

DocumentIndex from_json(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ProjectionError(e.what());
  }

  std::string doc_id;
  try {
    doc_id = field(j, "doc_id").get<std::string>();
  } catch (const json::type_error& e) {
    throw ProjectionError(e.what());
  }
  if (doc_id.empty()) throw ProjectionError("empty doc_id");

  IndexBuilder b(doc_id);
  add_nodes(b, field(j, "nodes"), std::nullopt);
  return b.finish();
}
