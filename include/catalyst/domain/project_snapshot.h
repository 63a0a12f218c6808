#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace catalyst::domain {

enum class ProjectType {
  kNode,
  kPython,
  kJava,
  kRust,
  kGo,
  kRuby,
  kPhp,
  kCsharp,
};

[[nodiscard]] std::string to_string(ProjectType type);
[[nodiscard]] std::optional<ProjectType> parse_project_type(std::string_view text);

// Well-known flag names. Every snapshot produced by the scanner carries all of them.
inline constexpr std::string_view kFlagHasGit = "hasGit";
inline constexpr std::string_view kFlagHasCi = "hasCI";
inline constexpr std::string_view kFlagHasTests = "hasTests";
inline constexpr std::string_view kFlagHasDocker = "hasDocker";

// An entry the scanner could not stat or read. Recorded, never fatal.
struct SkippedEntry {
  std::string path;    // NOLINT(readability-identifier-naming)
  std::string reason;  // NOLINT(readability-identifier-naming)

  bool operator==(const SkippedEntry&) const = default;
};

// SnapshotData is the mutable staging form used while a scan is in progress.
// Paths are relative to root and use '/' separators.
struct SnapshotData {
  std::string root;                            // NOLINT(readability-identifier-naming)
  std::string project_name;                    // NOLINT(readability-identifier-naming)
  std::set<std::string> files;                 // NOLINT(readability-identifier-naming)
  std::set<std::string> directories;           // NOLINT(readability-identifier-naming)
  std::set<ProjectType> project_types;         // NOLINT(readability-identifier-naming)
  std::set<std::string> frameworks;            // NOLINT(readability-identifier-naming)
  std::map<std::string, bool, std::less<>> flags;  // NOLINT(readability-identifier-naming)
  std::vector<SkippedEntry> skipped_entries;   // NOLINT(readability-identifier-naming)
};

// ProjectSnapshot is the immutable result of one scan.
// It is a class (not struct) because it maintains an invariant: once constructed, nothing
// may change it. Rule evaluation relies on this to read it from several threads at once.
class ProjectSnapshot {
 public:
  explicit ProjectSnapshot(SnapshotData data) : data_(std::move(data)) {}

  [[nodiscard]] const std::string& root() const noexcept { return data_.root; }
  [[nodiscard]] const std::string& project_name() const noexcept { return data_.project_name; }
  [[nodiscard]] const std::set<std::string>& files() const noexcept { return data_.files; }
  [[nodiscard]] const std::set<std::string>& directories() const noexcept {
    return data_.directories;
  }
  [[nodiscard]] const std::set<ProjectType>& project_types() const noexcept {
    return data_.project_types;
  }
  [[nodiscard]] const std::set<std::string>& frameworks() const noexcept {
    return data_.frameworks;
  }
  [[nodiscard]] const std::map<std::string, bool, std::less<>>& flags() const noexcept {
    return data_.flags;
  }
  [[nodiscard]] const std::vector<SkippedEntry>& skipped_entries() const noexcept {
    return data_.skipped_entries;
  }

  [[nodiscard]] bool has_file(const std::string& path) const { return data_.files.contains(path); }
  [[nodiscard]] bool has_directory(const std::string& path) const {
    return data_.directories.contains(path);
  }
  [[nodiscard]] bool has_project_type(ProjectType type) const {
    return data_.project_types.contains(type);
  }
  [[nodiscard]] bool has_framework(const std::string& name) const {
    return data_.frameworks.contains(name);
  }

  // Returns the named flag, or false when the flag was never computed.
  [[nodiscard]] bool flag(std::string_view name) const;

 private:
  SnapshotData data_;
};

// Exchange format. Keys are sorted alphabetically (nlohmann::json uses std::map).
[[nodiscard]] nlohmann::json snapshot_to_json(const ProjectSnapshot& snapshot);

// Throws nlohmann::json::exception on missing fields or type mismatches and
// std::invalid_argument on an unknown project type tag.
[[nodiscard]] ProjectSnapshot snapshot_from_json(const nlohmann::json& j);

}  // namespace catalyst::domain
