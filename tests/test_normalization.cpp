#include "catalyst/core/normalization.h"

#include <catch2/catch_test_macros.hpp>

using namespace catalyst::core;

TEST_CASE("normalize_ascii_lower only touches ASCII letters", "[normalization]") {
  CHECK(normalize_ascii_lower("README.MD") == "readme.md");
  CHECK(normalize_ascii_lower("Spec_Dir-2") == "spec_dir-2");
  CHECK(normalize_ascii_lower("\xC3\x89t\xC3\xA9") == "\xC3\x89t\xC3\xA9");
  CHECK(normalize_ascii_lower("").empty());
}

TEST_CASE("trim strips surrounding whitespace", "[normalization]") {
  CHECK(trim("  a or b \t\r\n") == "a or b");
  CHECK(trim("\n\n").empty());
  CHECK(trim("inner  space") == "inner  space");
}

TEST_CASE("title_from_id", "[normalization]") {
  CHECK(title_from_id("missing-ci-workflow") == "Missing Ci Workflow");
  CHECK(title_from_id("missing_editorconfig") == "Missing Editorconfig");
  CHECK(title_from_id("readme") == "Readme");
  CHECK(title_from_id("v2-API") == "V2 API");
}

TEST_CASE("count_lines", "[normalization]") {
  CHECK(count_lines("") == 0);
  CHECK(count_lines("one") == 1);
  CHECK(count_lines("one\n") == 1);
  CHECK(count_lines("one\ntwo") == 2);
  CHECK(count_lines("\n\n\n") == 3);
}
