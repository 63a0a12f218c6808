#include "catalyst/evaluation/content_source.h"

#include "catalyst/core/file_io.h"

namespace catalyst::evaluation {

core::Result<std::string, std::string> FilesystemContentSource::read(
    const std::string& relative_path) const {
  return core::read_text_file(root_ + "/" + relative_path);
}

void InMemoryContentSource::put(const std::string& relative_path, std::string content) {
  entries_.insert_or_assign(relative_path,
                            core::Result<std::string, std::string>::ok(std::move(content)));
}

void InMemoryContentSource::put_error(const std::string& relative_path, std::string message) {
  entries_.insert_or_assign(relative_path,
                            core::Result<std::string, std::string>::err(std::move(message)));
}

core::Result<std::string, std::string> InMemoryContentSource::read(
    const std::string& relative_path) const {
  const auto it = entries_.find(relative_path);
  if (it == entries_.end()) {
    return core::Result<std::string, std::string>::err("Failed to open file: " + relative_path);
  }
  return it->second;
}

}  // namespace catalyst::evaluation
