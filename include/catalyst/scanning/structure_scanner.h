#pragma once

#include "catalyst/core/result.h"
#include "catalyst/domain/project_snapshot.h"
#include "catalyst/scanning/scan_error.h"
#include "catalyst/scanning/scan_options.h"

#include <string>

namespace catalyst::scanning {

// scan walks root and builds an immutable snapshot of its structure.
//
// - Paths in the snapshot are relative to root and '/'-separated.
// - Per-entry I/O failures are recorded in skipped_entries and the walk continues.
// - Symlinks are recorded by what they point to but never followed into.
// - With max_workers > 1 each top-level directory is walked by a pooled worker; the
//   result is identical to a single-threaded walk.
[[nodiscard]] core::Result<domain::ProjectSnapshot, ScanError> scan(
    const std::string& root, const ScanOptions& options = {});

}  // namespace catalyst::scanning
