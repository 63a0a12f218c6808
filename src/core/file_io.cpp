#include "catalyst/core/file_io.h"

#include <fstream>
#include <sstream>

namespace catalyst::core {

Result<std::string, std::string> read_text_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Result<std::string, std::string>::err("Failed to open file: " + path);
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<std::string, std::string>::err("Failed to read file: " + path);
  }

  return Result<std::string, std::string>::ok(buffer.str());
}

}  // namespace catalyst::core
