#include "catalyst/scanning/scan_error.h"

namespace catalyst::scanning {

std::string to_string(const ScanErrorKind kind) {
  switch (kind) {
    case ScanErrorKind::kNotFound:
      return "not_found";
    case ScanErrorKind::kNotADirectory:
      return "not_a_directory";
    case ScanErrorKind::kCancelled:
      return "cancelled";
    case ScanErrorKind::kDeadlineExceeded:
      return "deadline_exceeded";
    case ScanErrorKind::kIoError:
      return "io_error";
  }
  return "io_error";
}

}  // namespace catalyst::scanning
