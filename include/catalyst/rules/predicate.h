#pragma once

#include "catalyst/core/result.h"
#include "catalyst/domain/project_snapshot.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace catalyst::rules {

// Predicate is a small boolean expression over a ProjectSnapshot, used by applies_when
// and by recommendation variants. The operator set is closed; new conditions are data,
// composed from these operators.
//
// Wire forms (JSON):
//   {"project_type": "node"}            {"framework": "react"}
//   {"flag": "hasCI", "equals": false}  {"file_exists": "a" | ["a", "b"]}
//   {"directory_exists": "src"}         {"all": [...]}  {"any": [...]}  {"not": {...}}
//   "package.json exists"               "requirements.txt or setup.py exists"
struct Predicate {
  enum class Op {
    kProjectType,
    kFramework,
    kFlag,
    kFileExists,
    kDirectoryExists,
    kPathExists,  // string shorthand: file or directory
    kAll,
    kAny,
    kNot,
  };

  Op op{Op::kAll};
  std::string name;                // project type, framework or flag name
  std::vector<std::string> paths;  // candidates for the *_exists operators (any-of)
  bool expected{true};             // kFlag only
  std::vector<Predicate> children;

  // Pure; reads only the snapshot.
  [[nodiscard]] bool evaluate(const domain::ProjectSnapshot& snapshot) const;
};

// parse_predicate validates and converts a wire predicate.
// Returns a human-readable message describing the first problem found.
[[nodiscard]] core::Result<Predicate, std::string> parse_predicate(const nlohmann::json& j);

[[nodiscard]] nlohmann::json predicate_to_json(const Predicate& predicate);

}  // namespace catalyst::rules
