#include "builder.hpp"
#include "projection.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const char* DOC = R"(# Guide
intro "quoted" \ backslash
## Install
### Linux
apt install x
## Usage
#### Flags
--help
# Appendix
tail
)";

void expect_same_tree(const DocumentIndex& a, const DocumentIndex& b) {
  EXPECT_EQ(a.doc_id(), b.doc_id());
  EXPECT_EQ(a.title(), b.title());
  ASSERT_EQ(a.node_ids(), b.node_ids());
  for (auto& id : a.node_ids()) {
    auto x = a.get_node(id), y = b.get_node(id);
    EXPECT_EQ(x.title, y.title) << id;
    EXPECT_EQ(x.depth, y.depth) << id;
    EXPECT_EQ(x.text, y.text) << id;
    EXPECT_EQ(a.get_children(id), b.get_children(id)) << id;
  }
  EXPECT_EQ(a.outline(), b.outline());
}

}

TEST(ProjectionTest, ShapeMirrorsTree) {
  auto doc = build_index("guide", DOC);
  auto j = json::parse(to_json(doc));

  EXPECT_EQ(j["doc_id"], "guide");
  EXPECT_EQ(j["title"], "Guide");
  ASSERT_EQ(j["nodes"].size(), 2u);

  auto& guide = j["nodes"][0];
  EXPECT_EQ(guide["node_id"], "1");
  EXPECT_EQ(guide["depth"], 1);
  EXPECT_EQ(guide["text"], "intro \"quoted\" \\ backslash");
  ASSERT_EQ(guide["children"].size(), 2u);
  EXPECT_EQ(guide["children"][1]["children"][0]["node_id"], "1.2.1");
  EXPECT_EQ(guide["children"][1]["children"][0]["depth"], 4);
  EXPECT_TRUE(j["nodes"][1]["children"].empty());
}

TEST(ProjectionTest, KeysKeepDeclarationOrder) {
  auto out = to_json(build_index("d", "# A\nx"));
  EXPECT_LT(out.find("\"doc_id\""), out.find("\"title\""));
  EXPECT_LT(out.find("\"title\""), out.find("\"nodes\""));
  EXPECT_LT(out.find("\"node_id\""), out.find("\"children\""));
}

TEST(ProjectionTest, MissingTitleIsNull) {
  auto j = json::parse(to_json(build_index("d", "## Sub only")));
  EXPECT_TRUE(j["title"].is_null());
}

TEST(ProjectionTest, RoundTripPreservesTree) {
  auto doc = build_index("guide", DOC);
  auto back = from_json(to_json(doc));
  expect_same_tree(doc, back);
  EXPECT_EQ(to_json(back), to_json(doc));
}

TEST(ProjectionTest, RoundTripSkippedLevels) {
  auto doc = build_index("d", "# A\n### B\n## C\n##### D\n# E");
  expect_same_tree(doc, from_json(to_json(doc, 0)));
}

TEST(ProjectionTest, RoundTripEmptyIndex) {
  auto doc = build_index("empty", "no headings");
  auto back = from_json(to_json(doc));
  EXPECT_TRUE(back.is_empty());
  EXPECT_EQ(back.doc_id(), "empty");
}

TEST(ProjectionTest, RejectsInvalidJson) {
  EXPECT_THROW(from_json("{not json"), ProjectionError);
  EXPECT_THROW(from_json("[]"), ProjectionError);
}

TEST(ProjectionTest, RejectsMissingFields) {
  EXPECT_THROW(from_json(R"({"nodes": []})"), ProjectionError);
  EXPECT_THROW(from_json(R"({"doc_id": "d"})"), ProjectionError);
  EXPECT_THROW(from_json(R"({"doc_id": "d", "nodes": [{"node_id": "1", "title": "A", "depth": 1}]})"),
               ProjectionError);
}

TEST(ProjectionTest, RejectsWrongTypes) {
  EXPECT_THROW(from_json(R"({"doc_id": 7, "nodes": []})"), ProjectionError);
  EXPECT_THROW(from_json(R"({"doc_id": "d", "nodes": {}})"), ProjectionError);
  EXPECT_THROW(
    from_json(R"({"doc_id": "d", "nodes": [{"node_id": "1", "title": "A", "depth": "1", "text": ""}]})"),
    ProjectionError);
}

TEST(ProjectionTest, RejectsMisplacedIdentifier) {
  const char* gap = R"({"doc_id": "d", "nodes": [
    {"node_id": "1", "title": "A", "depth": 1, "text": "", "children": []},
    {"node_id": "3", "title": "B", "depth": 1, "text": "", "children": []}
  ]})";
  try {
    from_json(gap);
    FAIL() << "expected ProjectionError";
  } catch (const ProjectionError& e) {
    EXPECT_NE(std::string(e.what()).find("node 3"), std::string::npos);
  }
}

TEST(ProjectionTest, RejectsNonPositiveDepth) {
  EXPECT_THROW(
    from_json(R"({"doc_id": "d", "nodes": [{"node_id": "1", "title": "A", "depth": 0, "text": ""}]})"),
    ProjectionError);
}

TEST(ProjectionTest, RejectsFractionalOrOversizedDepth) {
  EXPECT_THROW(
    from_json(R"({"doc_id": "d", "nodes": [{"node_id": "1", "title": "A", "depth": 2.9, "text": ""}]})"),
    ProjectionError);
  EXPECT_THROW(
    from_json(R"({"doc_id": "d", "nodes": [{"node_id": "1", "title": "A", "depth": 4294967297, "text": ""}]})"),
    ProjectionError);
  EXPECT_THROW(
    from_json(R"({"doc_id": "d", "nodes": [{"node_id": "1", "title": "A", "depth": -3, "text": ""}]})"),
    ProjectionError);
}
