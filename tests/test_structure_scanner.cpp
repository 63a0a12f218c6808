#include "catalyst/scanning/project_indicators.h"
#include "catalyst/scanning/structure_scanner.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <utility>

#include <unistd.h>

using namespace catalyst;

namespace {

domain::ProjectSnapshot scan_ok(const std::string& root, std::size_t workers = 1) {
  scanning::ScanOptions options;
  options.max_workers = workers;
  auto result = scanning::scan(root, options);
  REQUIRE(result.has_value());
  return result.value();
}

void build_node_project(const test::TempProject& project) {
  project.write("package.json",
                R"({"name": "web", "dependencies": {"react": "^18.0.0", "express": "^4"}})");
  project.write("README.md", "# Web\n");
  project.write("src/index.js", "console.log('hi');\n");
  project.write("src/components/App.jsx");
  project.write("tests/app.test.js");
  project.write(".github/workflows/ci.yml", "on: push\n");
  project.write("node_modules/react/index.js");
  project.write("node_modules/react/package.json", "{}");
  project.write("build/cache.o");
  project.write("lib/native.so");
  project.write("Dockerfile", "FROM node:20\n");
  project.mkdir(".git/objects");
}

// Restores owner access so TempProject can remove the tree.
class PermissionRestorer {
 public:
  explicit PermissionRestorer(std::filesystem::path dir) : dir_(std::move(dir)) {}
  ~PermissionRestorer() {
    std::error_code ec;
    std::filesystem::permissions(dir_, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
  }
  PermissionRestorer(const PermissionRestorer&) = delete;
  PermissionRestorer& operator=(const PermissionRestorer&) = delete;

 private:
  std::filesystem::path dir_;
};

}  // namespace

TEST_CASE("Scanner: records relative paths and skips denied subtrees", "[scanner]") {
  const test::TempProject project("web-app");
  build_node_project(project);

  const auto snapshot = scan_ok(project.root());

  CHECK(snapshot.project_name() == "web-app");
  CHECK(snapshot.has_file("package.json"));
  CHECK(snapshot.has_file("src/index.js"));
  CHECK(snapshot.has_file("src/components/App.jsx"));
  CHECK(snapshot.has_directory("src/components"));
  CHECK(snapshot.has_file(".github/workflows/ci.yml"));

  // Denied directories are recorded but never descended.
  CHECK(snapshot.has_directory("node_modules"));
  CHECK_FALSE(snapshot.has_directory("node_modules/react"));
  CHECK_FALSE(snapshot.has_file("node_modules/react/index.js"));
  CHECK(snapshot.has_directory(".git"));
  CHECK_FALSE(snapshot.has_directory(".git/objects"));
  CHECK_FALSE(snapshot.has_file("build/cache.o"));

  // Compiled artifacts are filtered by suffix.
  CHECK(snapshot.has_directory("lib"));
  CHECK_FALSE(snapshot.has_file("lib/native.so"));
}

TEST_CASE("Scanner: project types, frameworks and flags", "[scanner]") {
  const test::TempProject project("web-app");
  build_node_project(project);

  const auto snapshot = scan_ok(project.root());

  CHECK(snapshot.has_project_type(domain::ProjectType::kNode));
  CHECK_FALSE(snapshot.has_project_type(domain::ProjectType::kPython));
  CHECK(snapshot.has_framework("react"));
  CHECK(snapshot.has_framework("express"));
  CHECK_FALSE(snapshot.has_framework("vue"));

  CHECK(snapshot.flag(domain::kFlagHasGit));
  CHECK(snapshot.flag(domain::kFlagHasCi));
  CHECK(snapshot.flag(domain::kFlagHasTests));
  CHECK(snapshot.flag(domain::kFlagHasDocker));
  CHECK(snapshot.skipped_entries().empty());
}

TEST_CASE("Scanner: framework indicators match inside dependency names", "[scanner]") {
  const test::TempProject project("scoped-deps");
  project.write("package.json", R"({
    "dependencies": {"react-dom": "^18", "@vue/runtime-core": "^3"},
    "devDependencies": {"@angular/common": "^17", "lodash": "^4"}
  })");

  const auto snapshot = scan_ok(project.root());

  CHECK(snapshot.has_framework("react"));
  CHECK(snapshot.has_framework("vue"));
  CHECK(snapshot.has_framework("angular"));
  CHECK_FALSE(snapshot.has_framework("express"));
  CHECK(snapshot.frameworks().size() == 3);
}

TEST_CASE("Scanner: every well-known flag is present on a bare project", "[scanner]") {
  const test::TempProject project("bare");
  project.write("main.go", "package main\n");
  project.write("go.mod", "module bare\n");
  project.mkdir("tests");  // empty test directories do not count

  const auto snapshot = scan_ok(project.root());

  CHECK(snapshot.flags().size() >= 4);
  CHECK(snapshot.flags().contains("hasGit"));
  CHECK(snapshot.flags().contains("hasCI"));
  CHECK(snapshot.flags().contains("hasTests"));
  CHECK(snapshot.flags().contains("hasDocker"));
  CHECK_FALSE(snapshot.flag(domain::kFlagHasTests));
  CHECK_FALSE(snapshot.flag(domain::kFlagHasCi));
  CHECK(snapshot.has_project_type(domain::ProjectType::kGo));
}

TEST_CASE("Scanner: python frameworks and CI files", "[scanner]") {
  const test::TempProject project("api");
  project.write("requirements.txt", "Django==5.0\nrequests\n");
  project.write(".gitlab-ci.yml", "stages: [test]\n");
  project.write("Spec/test_views.py");

  const auto snapshot = scan_ok(project.root());

  CHECK(snapshot.has_project_type(domain::ProjectType::kPython));
  CHECK(snapshot.has_framework("django"));
  CHECK_FALSE(snapshot.has_framework("flask"));
  CHECK(snapshot.flag(domain::kFlagHasCi));
  // Test directory names match case-insensitively.
  CHECK(snapshot.flag(domain::kFlagHasTests));
}

TEST_CASE("Scanner: an unparsable package.json is recorded as skipped", "[scanner]") {
  const test::TempProject project("broken");
  project.write("package.json", "{ this is not json");

  const auto snapshot = scan_ok(project.root());

  CHECK(snapshot.has_project_type(domain::ProjectType::kNode));
  CHECK(snapshot.frameworks().empty());
  REQUIRE(snapshot.skipped_entries().size() == 1);
  CHECK(snapshot.skipped_entries()[0].path == "package.json");
  CHECK(snapshot.skipped_entries()[0].reason == "unparsable manifest");
}

TEST_CASE("Scanner: symlinks are recorded but not followed", "[scanner]") {
  const test::TempProject project("links");
  project.write("real/inner.txt", "x");
  std::error_code ec;
  std::filesystem::create_directory_symlink(project.path() / "real", project.path() / "alias",
                                            ec);
  if (ec) {
    SKIP("symlinks unavailable: " << ec.message());
  }
  std::filesystem::create_symlink(project.path() / "missing-target",
                                  project.path() / "dangling", ec);
  REQUIRE_FALSE(ec);

  const auto snapshot = scan_ok(project.root());

  CHECK(snapshot.has_directory("alias"));
  CHECK_FALSE(snapshot.has_file("alias/inner.txt"));
  CHECK(snapshot.has_file("real/inner.txt"));
  CHECK_FALSE(snapshot.has_file("dangling"));
  REQUIRE(snapshot.skipped_entries().size() == 1);
  CHECK(snapshot.skipped_entries()[0].path == "dangling");
}

TEST_CASE("Scanner: an unreadable directory is skipped and the walk continues", "[scanner]") {
  if (::geteuid() == 0) {
    SKIP("permission checks do not apply to root");
  }
  const test::TempProject project("locked");
  project.write("src/main.c", "int main(void) { return 0; }\n");
  project.write("locked/secret.txt", "x");
  project.write("notes.md", "# Notes\n");

  const auto locked = project.path() / "locked";
  const PermissionRestorer restore(locked);
  std::filesystem::permissions(locked, std::filesystem::perms::none,
                               std::filesystem::perm_options::replace);

  const auto snapshot = scan_ok(project.root());

  CHECK(snapshot.has_directory("locked"));
  CHECK_FALSE(snapshot.has_file("locked/secret.txt"));
  REQUIRE(snapshot.skipped_entries().size() == 1);
  CHECK(snapshot.skipped_entries()[0].path == "locked");
  CHECK_FALSE(snapshot.skipped_entries()[0].reason.empty());

  CHECK(snapshot.has_file("src/main.c"));
  CHECK(snapshot.has_file("notes.md"));
}

TEST_CASE("Scanner: root errors", "[scanner]") {
  const test::TempProject project("errors");
  project.write("file.txt", "x");

  const auto missing = scanning::scan(project.root() + "/does-not-exist");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().kind == scanning::ScanErrorKind::kNotFound);

  const auto not_dir = scanning::scan(project.root() + "/file.txt");
  REQUIRE_FALSE(not_dir.has_value());
  CHECK(not_dir.error().kind == scanning::ScanErrorKind::kNotADirectory);
  CHECK(scanning::to_string(not_dir.error().kind) == "not_a_directory");
}

TEST_CASE("Scanner: cancellation and deadlines yield errors, not partial snapshots",
          "[scanner]") {
  const test::TempProject project("stopped");
  build_node_project(project);

  SECTION("cancelled token") {
    auto token = std::make_shared<scanning::CancellationToken>();
    token->cancel();
    scanning::ScanOptions options;
    options.cancel = token;

    const auto result = scanning::scan(project.root(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == scanning::ScanErrorKind::kCancelled);
  }

  SECTION("deadline already passed") {
    scanning::ScanOptions options;
    options.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

    const auto result = scanning::scan(project.root(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == scanning::ScanErrorKind::kDeadlineExceeded);
  }
}

TEST_CASE("Scanner: worker count does not change the snapshot", "[scanner][determinism]") {
  const test::TempProject project("many");
  build_node_project(project);
  for (int i = 0; i < 12; ++i) {
    const std::string dir = "pkg" + std::to_string(i);
    project.write(dir + "/index.js");
    project.write(dir + "/nested/deeper/file.txt");
  }

  const auto sequential = scan_ok(project.root(), 1);
  const auto pooled = scan_ok(project.root(), 8);

  CHECK(domain::snapshot_to_json(sequential) == domain::snapshot_to_json(pooled));
}

TEST_CASE("Project indicators: deny list and skipped suffixes", "[scanner][indicators]") {
  CHECK(scanning::is_denied_directory("node_modules"));
  CHECK(scanning::is_denied_directory("__pycache__"));
  CHECK_FALSE(scanning::is_denied_directory("src"));
  CHECK(scanning::is_skipped_file("module.pyc"));
  CHECK(scanning::is_skipped_file("Main.class"));
  CHECK_FALSE(scanning::is_skipped_file("main.cpp"));
}

TEST_CASE("Project indicators: marker table", "[scanner][indicators]") {
  const auto types =
      scanning::detect_project_types({"App.csproj", "Cargo.toml", "nested/go.mod"}, {"target"});
  CHECK(types.contains(domain::ProjectType::kCsharp));
  CHECK(types.contains(domain::ProjectType::kRust));
  CHECK(types.contains(domain::ProjectType::kGo));
  CHECK_FALSE(types.contains(domain::ProjectType::kNode));
}
