#pragma once

#include <string>
#include <string_view>

namespace catalyst::core {

// Deterministic ASCII-only text helpers.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// title_from_id turns a kebab/snake-case identifier into a display title:
// "missing-ci-workflow" -> "Missing Ci Workflow".
inline std::string title_from_id(const std::string_view id) {
  std::string result;
  result.reserve(id.size());

  bool word_start = true;
  for (const char ch : id) {
    if (ch == '-' || ch == '_') {
      result.push_back(' ');
      word_start = true;
      continue;
    }
    if (word_start && ch >= 'a' && ch <= 'z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch - kCaseOffset));
    } else {
      result.push_back(ch);
    }
    word_start = false;
  }

  return result;
}

// count_lines counts text lines: every '\n' terminates a line, and trailing text
// without a final newline counts as one more line. Empty content has zero lines.
inline std::size_t count_lines(const std::string_view content) {
  std::size_t lines = 0;
  for (const char ch : content) {
    if (ch == '\n') {
      ++lines;
    }
  }
  if (!content.empty() && content.back() != '\n') {
    ++lines;
  }
  return lines;
}

}  // namespace catalyst::core
