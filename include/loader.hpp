#pragma once
#include <stdexcept>
#include <string>

class IOFailure : public std::runtime_error {
public:
  IOFailure(const std::string& path, const std::string& reason)
    : std::runtime_error("cannot read " + path + ": " + reason), path_(path) {}
  const std::string& path() const { return path_; }

private:
  std::string path_;
};

// Whole file as text; throws IOFailure.
std::string read_document(const std::string& path);

// "docs/guide.md" -> "guide"
std::string default_doc_id(const std::string& path);
