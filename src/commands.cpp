#include "commands.hpp"
#include "builder.hpp"
#include "loader.hpp"
#include "projection.hpp"
#include "store.hpp"

#include <filesystem>

static void print_record(std::ostream& out, const NodeRecord& r) {
  out << "[" << r.node_id << "] " << r.title << " (depth " << r.depth << ")\n";
  out << "path: ";
  for (size_t i = 0; i < r.breadcrumb.size(); ++i) {
    if (i) out << " > ";
    out << r.breadcrumb[i];
  }
  out << "\n\n" << r.text << "\n";
}

static DocumentIndex open_document(const Args& args) {
  if (!args.file_path.empty()) return build_index(args.doc_id, read_document(args.file_path));
  Store store(args.sqlite_path, /*read_only=*/true);
  return store.load_document(args.doc_id);
}

static void run(const Args& args, std::ostream& out, std::ostream& err) {
  if (args.mode == "index") {
    std::string doc_id = args.doc_id.empty() ? default_doc_id(args.file_path) : args.doc_id;
    auto doc = build_index(doc_id, read_document(args.file_path));
    if (doc.is_empty()) err << "warning: no headings in " << args.file_path << "\n";

    auto dir = std::filesystem::path(args.sqlite_path).parent_path();
    if (!dir.empty()) std::filesystem::create_directories(dir);
    Store store(args.sqlite_path);
    store.upsert_document(doc);
    err << "Indexed " << doc_id << ": " << doc.size() << " sections.\n";
    return;
  }

  if (args.mode == "list") {
    Store store(args.sqlite_path, /*read_only=*/true);
    for (auto& d : store.list_documents())
      out << d.doc_id << "\t" << d.node_count << "\t" << d.title << "\n";
    return;
  }

  if (args.mode == "remove") {
    Store store(args.sqlite_path);
    if (!store.remove_document(args.doc_id)) throw NotFound(args.doc_id);
    err << "Removed " << args.doc_id << ".\n";
    return;
  }

  auto doc = open_document(args);
  if (args.mode == "title") {
    out << doc.title().value_or(doc.doc_id()) << "\n";
  } else if (args.mode == "outline") {
    out << doc.outline() << "\n";
  } else if (args.mode == "ids") {
    for (auto& id : doc.node_ids()) out << id << "\n";
  } else if (args.mode == "json") {
    out << to_json(doc) << "\n";
  } else if (args.mode == "node") {
    print_record(out, args.with_children ? doc.get_node_with_children(args.node_id)
                                         : doc.get_node(args.node_id));
  } else if (args.mode == "children") {
    for (auto& c : doc.get_children(args.node_id)) out << c.node_id << "\t" << c.title << "\n";
  }
}

int run_command(const Args& args, std::ostream& out, std::ostream& err) {
  try {
    run(args, out, err);
    return 0;
  } catch (const std::exception& e) {
    err << "error: " << e.what() << "\n";
    return 2;
  }
}
