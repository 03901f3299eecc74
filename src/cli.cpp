#include "cli.hpp"
#include <cstdlib>
#include <iostream>

static const char* USAGE =
"pageindex index <file> [--doc-id ID] [--sqlite path]\n"
"pageindex title|outline|ids|json <doc-id> [--sqlite path] [--file path]\n"
"pageindex node <doc-id> <node-id> [--with-children] [--sqlite path] [--file path]\n"
"pageindex children <doc-id> <node-id> [--sqlite path] [--file path]\n"
"pageindex list [--sqlite path]\n"
"pageindex remove <doc-id> [--sqlite path]\n";

[[noreturn]] static void usage() {
  std::cerr << USAGE;
  std::exit(1);
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) usage();
  a.mode = argv[1];
  int i = 2;
  // every flag is spelled "--name", so "-notes.md" is still a positional
  auto positional = [&](std::string& dst) {
    if (i >= argc || std::string(argv[i]).rfind("--", 0) == 0) usage();
    dst = argv[i++];
  };

  if (a.mode == "index") {
    positional(a.file_path);
  } else if (a.mode == "title" || a.mode == "outline" || a.mode == "ids" ||
             a.mode == "json" || a.mode == "remove") {
    positional(a.doc_id);
  } else if (a.mode == "node" || a.mode == "children") {
    positional(a.doc_id);
    positional(a.node_id);
  } else if (a.mode != "list") {
    usage();
  }

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    if (f == "--sqlite") next(a.sqlite_path);
    else if (f == "--doc-id" && a.mode == "index") next(a.doc_id);
    else if (f == "--file" && a.mode != "index" && a.mode != "list" && a.mode != "remove") next(a.file_path);
    else if (f == "--with-children" && a.mode == "node") a.with_children = true;
    else { std::cerr << "Unknown flag: " << f << "\n"; std::exit(1); }
  }
  return a;
}
