#pragma once

#include <string>

namespace catalyst::scanning {

enum class ScanErrorKind {
  kNotFound,
  kNotADirectory,
  kCancelled,
  kDeadlineExceeded,
  kIoError,
};

// ScanError is fatal to one scan. A scan that fails never yields a partial snapshot.
struct ScanError {
  ScanErrorKind kind{ScanErrorKind::kIoError};
  std::string path;
  std::string message;
};

[[nodiscard]] std::string to_string(ScanErrorKind kind);

}  // namespace catalyst::scanning
