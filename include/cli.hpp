#pragma once
#include <string>

struct Args {
  std::string mode;          // index, title, outline, ids, json, node, children, list, remove
  std::string file_path;     // input for "index", or --file for queries
  std::string doc_id;
  std::string node_id;
  std::string sqlite_path = "./index/pageindex.sqlite";
  bool with_children = false;
};

Args parse_cli(int argc, char** argv);
