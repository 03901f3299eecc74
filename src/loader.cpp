#include "loader.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

std::string read_document(const std::string& path) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) throw IOFailure(path, "is a directory");
  std::ifstream in(path, std::ios::binary);
  if (!in) throw IOFailure(path, std::strerror(errno));
  std::ostringstream ss; ss << in.rdbuf();
  if (in.bad()) throw IOFailure(path, "read error");
  return ss.str();
}

std::string default_doc_id(const std::string& path) {
  auto stem = fs::path(path).stem().string();
  return stem.empty() ? path : stem;
}
