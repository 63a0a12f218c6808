#include "catalyst/scanning/project_indicators.h"

#include "catalyst/core/file_io.h"
#include "catalyst/core/normalization.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <optional>
#include <utility>

namespace catalyst::scanning {

namespace {

constexpr std::array<std::string_view, 11> kDeniedDirectories = {
    "node_modules", ".git", "__pycache__", ".venv", "venv",  "target",
    "dist",         "build", "vendor",     ".next", ".nuxt",
};

constexpr std::array<std::string_view, 4> kSkippedSuffixes = {".pyc", ".class", ".o", ".so"};

// Marker syntax: "name" matches a file basename, "name/" a directory basename and
// "*.ext" a file suffix.
struct MarkerSet {
  domain::ProjectType type;
  std::vector<std::string_view> markers;
};

const std::vector<MarkerSet>& marker_table() {
  static const std::vector<MarkerSet> kTable = {
      {domain::ProjectType::kNode, {"package.json", "package-lock.json", "node_modules/"}},
      {domain::ProjectType::kPython,
       {"requirements.txt", "setup.py", "pyproject.toml", "__pycache__/"}},
      {domain::ProjectType::kJava, {"pom.xml", "build.gradle", "build.gradle.kts", "gradlew"}},
      {domain::ProjectType::kRust, {"Cargo.toml", "Cargo.lock", "target/"}},
      {domain::ProjectType::kGo, {"go.mod", "go.sum"}},
      {domain::ProjectType::kRuby, {"Gemfile", "Gemfile.lock"}},
      {domain::ProjectType::kPhp, {"composer.json", "composer.lock"}},
      {domain::ProjectType::kCsharp, {"*.csproj", "*.sln"}},
  };
  return kTable;
}

constexpr std::array<std::string_view, 5> kCiFiles = {
    ".gitlab-ci.yml", ".circleci/config.yml", "azure-pipelines.yml", "Jenkinsfile", ".travis.yml",
};

constexpr std::array<std::string_view, 4> kTestDirectoryNames = {"test", "tests", "spec",
                                                                 "__tests__"};

std::string_view basename(std::string_view path) {
  const auto slash = path.rfind('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

bool matches_file_marker(std::string_view name, std::string_view marker) {
  if (marker.starts_with("*")) {
    return name.size() > marker.size() - 1 && name.ends_with(marker.substr(1));
  }
  return name == marker;
}

void tag_if_contains(const std::string& lowered, std::string_view needle, const char* tag,
                     std::set<std::string>& out) {
  if (lowered.find(needle) != std::string::npos) {
    out.insert(tag);
  }
}

void scan_package_json(const std::string& content, std::set<std::string>& out, bool& parsed) {
  const auto doc = nlohmann::json::parse(content, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    parsed = false;
    return;
  }
  parsed = true;

  // Substring of a dependency key -> framework tag.
  static const std::vector<std::pair<std::string_view, const char*>> kIndicators = {
      {"react", "react"},     {"@types/react", "react"}, {"vue", "vue"},
      {"@vue/", "vue"},       {"@angular/", "angular"},  {"express", "express"},
      {"next", "next"},       {"@nestjs/", "nestjs"},
  };

  for (const char* section : {"dependencies", "devDependencies"}) {
    if (!doc.contains(section) || !doc.at(section).is_object()) {
      continue;
    }
    for (const auto& [package, version] : doc.at(section).items()) {
      (void)version;
      for (const auto& [indicator, tag] : kIndicators) {
        if (package.find(indicator) != std::string::npos) {
          out.insert(tag);
        }
      }
    }
  }
}

}  // namespace

bool is_denied_directory(std::string_view name) {
  return std::find(kDeniedDirectories.begin(), kDeniedDirectories.end(), name) !=
         kDeniedDirectories.end();
}

bool is_skipped_file(std::string_view name) {
  return std::any_of(kSkippedSuffixes.begin(), kSkippedSuffixes.end(),
                     [name](std::string_view suffix) { return name.ends_with(suffix); });
}

std::set<domain::ProjectType> detect_project_types(const std::set<std::string>& files,
                                                   const std::set<std::string>& directories) {
  std::set<domain::ProjectType> types;
  for (const auto& entry : marker_table()) {
    const bool present = std::any_of(
        entry.markers.begin(), entry.markers.end(), [&](std::string_view marker) {
          if (marker.ends_with("/")) {
            const auto dir_name = marker.substr(0, marker.size() - 1);
            return std::any_of(directories.begin(), directories.end(),
                               [dir_name](const std::string& d) { return basename(d) == dir_name; });
          }
          return std::any_of(files.begin(), files.end(), [marker](const std::string& f) {
            return matches_file_marker(basename(f), marker);
          });
        });
    if (present) {
      types.insert(entry.type);
    }
  }
  return types;
}

std::set<std::string> detect_frameworks(const std::string& root,
                                        const std::set<std::string>& files,
                                        std::vector<domain::SkippedEntry>& skipped) {
  std::set<std::string> frameworks;

  const auto read_manifest = [&](const std::string& name) -> std::optional<std::string> {
    if (!files.contains(name)) {
      return std::nullopt;
    }
    auto content = core::read_text_file(root + "/" + name);
    if (!content.has_value()) {
      skipped.push_back({name, content.error()});
      return std::nullopt;
    }
    return content.value();
  };

  if (const auto content = read_manifest("package.json")) {
    bool parsed = false;
    scan_package_json(*content, frameworks, parsed);
    if (!parsed) {
      skipped.push_back({"package.json", "unparsable manifest"});
    }
  }

  for (const char* name : {"requirements.txt", "pyproject.toml"}) {
    if (const auto content = read_manifest(name)) {
      const auto lowered = core::normalize_ascii_lower(*content);
      tag_if_contains(lowered, "django", "django", frameworks);
      tag_if_contains(lowered, "flask", "flask", frameworks);
      tag_if_contains(lowered, "fastapi", "fastapi", frameworks);
    }
  }

  for (const char* name : {"pom.xml", "build.gradle", "build.gradle.kts"}) {
    if (const auto content = read_manifest(name)) {
      tag_if_contains(core::normalize_ascii_lower(*content), "spring", "spring", frameworks);
    }
  }

  if (const auto content = read_manifest("composer.json")) {
    tag_if_contains(core::normalize_ascii_lower(*content), "laravel", "laravel", frameworks);
  }

  if (const auto content = read_manifest("Gemfile")) {
    tag_if_contains(core::normalize_ascii_lower(*content), "rails", "rails", frameworks);
  }

  return frameworks;
}

void compute_flags(domain::SnapshotData& data) {
  const bool has_git = data.directories.contains(".git");

  const bool has_ci =
      data.directories.contains(".github/workflows") ||
      std::any_of(kCiFiles.begin(), kCiFiles.end(),
                  [&data](std::string_view path) { return data.files.contains(std::string(path)); });

  // A test directory only counts when something was recorded beneath it.
  const auto has_children = [&data](const std::string& dir) {
    const std::string prefix = dir + "/";
    const auto in = [&prefix](const std::set<std::string>& paths) {
      const auto it = paths.lower_bound(prefix);
      return it != paths.end() && it->starts_with(prefix);
    };
    return in(data.files) || in(data.directories);
  };
  const bool has_tests =
      std::any_of(data.directories.begin(), data.directories.end(), [&](const std::string& dir) {
        const auto name = core::normalize_ascii_lower(basename(dir));
        const bool is_test_dir =
            std::find(kTestDirectoryNames.begin(), kTestDirectoryNames.end(), name) !=
            kTestDirectoryNames.end();
        return is_test_dir && has_children(dir);
      });

  const bool has_docker =
      data.files.contains("Dockerfile") || data.files.contains("docker-compose.yml");

  data.flags[std::string(domain::kFlagHasGit)] = has_git;
  data.flags[std::string(domain::kFlagHasCi)] = has_ci;
  data.flags[std::string(domain::kFlagHasTests)] = has_tests;
  data.flags[std::string(domain::kFlagHasDocker)] = has_docker;
}

}  // namespace catalyst::scanning
