#pragma once

#include "catalyst/core/result.h"

#include <string>

namespace catalyst::core {

// read_text_file reads a whole file as raw bytes.
// Returns an error message naming the path when the file cannot be opened or read.
[[nodiscard]] Result<std::string, std::string> read_text_file(const std::string& path);

}  // namespace catalyst::core
