#pragma once

#include "catalyst/domain/project_snapshot.h"

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace catalyst::scanning {

// Directory names that are recorded but never descended.
[[nodiscard]] bool is_denied_directory(std::string_view name);

// Compiled or cached artefacts that are not recorded at all.
[[nodiscard]] bool is_skipped_file(std::string_view name);

// detect_project_types tests every recorded path's basename against the marker table.
// Multiple types may co-occur.
[[nodiscard]] std::set<domain::ProjectType> detect_project_types(
    const std::set<std::string>& files, const std::set<std::string>& directories);

// detect_frameworks reads only root-level manifests that appear in files.
// Unreadable or unparsable manifests are appended to skipped and contribute no tags.
[[nodiscard]] std::set<std::string> detect_frameworks(
    const std::string& root, const std::set<std::string>& files,
    std::vector<domain::SkippedEntry>& skipped);

// Fills hasGit, hasCI, hasTests and hasDocker.
void compute_flags(domain::SnapshotData& data);

}  // namespace catalyst::scanning
