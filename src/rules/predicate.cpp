#include "catalyst/rules/predicate.h"

#include "catalyst/core/normalization.h"

#include <algorithm>
#include <string_view>

namespace catalyst::rules {

namespace {

using PredicateResult = core::Result<Predicate, std::string>;

constexpr std::string_view kExistsSuffix = " exists";

// Parses "a exists" and "a or b exists" into a kPathExists predicate.
PredicateResult parse_shorthand(const std::string& text) {
  const std::string trimmed = core::trim(text);
  if (!trimmed.ends_with(kExistsSuffix)) {
    return PredicateResult::err("Unsupported condition string: '" + text +
                                "' (expected '<path> exists')");
  }

  const std::string body = trimmed.substr(0, trimmed.size() - kExistsSuffix.size());
  Predicate predicate;
  predicate.op = Predicate::Op::kPathExists;

  std::size_t start = 0;
  constexpr std::string_view kOr = " or ";
  while (start <= body.size()) {
    const auto pos = body.find(kOr, start);
    const auto piece = core::trim(std::string_view(body).substr(
        start, pos == std::string::npos ? std::string::npos : pos - start));
    if (piece.empty()) {
      return PredicateResult::err("Empty path in condition: '" + text + "'");
    }
    predicate.paths.push_back(piece);
    if (pos == std::string::npos) {
      break;
    }
    start = pos + kOr.size();
  }

  return PredicateResult::ok(std::move(predicate));
}

core::Result<std::vector<std::string>, std::string> parse_paths(const nlohmann::json& value,
                                                               const char* key) {
  using PathsResult = core::Result<std::vector<std::string>, std::string>;
  const std::string expected =
      std::string("'") + key + "' must be a non-empty path or array of paths";

  std::vector<std::string> paths;
  if (value.is_string()) {
    paths.push_back(value.get<std::string>());
  } else if (value.is_array() && !value.empty()) {
    for (const auto& item : value) {
      if (!item.is_string()) {
        return PathsResult::err(expected + ", found a non-string element");
      }
      paths.push_back(item.get<std::string>());
    }
  } else {
    return PathsResult::err(expected);
  }

  const bool any_empty =
      std::any_of(paths.begin(), paths.end(), [](const std::string& p) { return p.empty(); });
  if (any_empty) {
    return PathsResult::err(expected + ", found an empty path");
  }
  return PathsResult::ok(std::move(paths));
}

PredicateResult parse_children(const nlohmann::json& value, const Predicate::Op op,
                               const char* key) {
  if (!value.is_array() || value.empty()) {
    return PredicateResult::err(std::string("'") + key + "' requires a non-empty array");
  }

  Predicate predicate;
  predicate.op = op;
  for (const auto& child_json : value) {
    auto child = parse_predicate(child_json);
    if (!child.has_value()) {
      return child;
    }
    predicate.children.push_back(child.value());
  }
  return PredicateResult::ok(std::move(predicate));
}

}  // namespace

bool Predicate::evaluate(const domain::ProjectSnapshot& snapshot) const {
  switch (op) {
    case Op::kProjectType: {
      const auto type = domain::parse_project_type(name);
      return type.has_value() && snapshot.has_project_type(type.value());
    }
    case Op::kFramework:
      return snapshot.has_framework(name);
    case Op::kFlag:
      return snapshot.flag(name) == expected;
    case Op::kFileExists:
      return std::any_of(paths.begin(), paths.end(),
                         [&snapshot](const std::string& p) { return snapshot.has_file(p); });
    case Op::kDirectoryExists:
      return std::any_of(paths.begin(), paths.end(),
                         [&snapshot](const std::string& p) { return snapshot.has_directory(p); });
    case Op::kPathExists:
      return std::any_of(paths.begin(), paths.end(), [&snapshot](const std::string& p) {
        return snapshot.has_file(p) || snapshot.has_directory(p);
      });
    case Op::kAll:
      return std::all_of(children.begin(), children.end(),
                         [&snapshot](const Predicate& c) { return c.evaluate(snapshot); });
    case Op::kAny:
      return std::any_of(children.begin(), children.end(),
                         [&snapshot](const Predicate& c) { return c.evaluate(snapshot); });
    case Op::kNot:
      return !children.empty() && !children.front().evaluate(snapshot);
  }
  return false;
}

PredicateResult parse_predicate(const nlohmann::json& j) {
  if (j.is_string()) {
    return parse_shorthand(j.get<std::string>());
  }
  if (!j.is_object()) {
    return PredicateResult::err("Condition must be an object or a '<path> exists' string");
  }

  if (j.contains("project_type")) {
    const auto& value = j.at("project_type");
    if (!value.is_string() || !domain::parse_project_type(value.get<std::string>())) {
      return PredicateResult::err("'project_type' must name a known project type");
    }
    Predicate predicate;
    predicate.op = Predicate::Op::kProjectType;
    predicate.name = value.get<std::string>();
    return PredicateResult::ok(std::move(predicate));
  }

  if (j.contains("framework")) {
    const auto& value = j.at("framework");
    if (!value.is_string() || value.get<std::string>().empty()) {
      return PredicateResult::err("'framework' must be a non-empty string");
    }
    Predicate predicate;
    predicate.op = Predicate::Op::kFramework;
    predicate.name = value.get<std::string>();
    return PredicateResult::ok(std::move(predicate));
  }

  if (j.contains("flag")) {
    const auto& value = j.at("flag");
    if (!value.is_string() || value.get<std::string>().empty()) {
      return PredicateResult::err("'flag' must be a non-empty string");
    }
    Predicate predicate;
    predicate.op = Predicate::Op::kFlag;
    predicate.name = value.get<std::string>();
    if (j.contains("equals")) {
      if (!j.at("equals").is_boolean()) {
        return PredicateResult::err("'equals' must be a boolean");
      }
      predicate.expected = j.at("equals").get<bool>();
    }
    return PredicateResult::ok(std::move(predicate));
  }

  if (j.contains("file_exists") || j.contains("directory_exists")) {
    const bool is_file = j.contains("file_exists");
    const char* key = is_file ? "file_exists" : "directory_exists";
    auto paths = parse_paths(j.at(key), key);
    if (!paths.has_value()) {
      return PredicateResult::err(paths.error());
    }
    Predicate predicate;
    predicate.op = is_file ? Predicate::Op::kFileExists : Predicate::Op::kDirectoryExists;
    predicate.paths = paths.value();
    return PredicateResult::ok(std::move(predicate));
  }

  if (j.contains("all")) {
    return parse_children(j.at("all"), Predicate::Op::kAll, "all");
  }
  if (j.contains("any")) {
    return parse_children(j.at("any"), Predicate::Op::kAny, "any");
  }

  if (j.contains("not")) {
    auto child = parse_predicate(j.at("not"));
    if (!child.has_value()) {
      return child;
    }
    Predicate predicate;
    predicate.op = Predicate::Op::kNot;
    predicate.children.push_back(child.value());
    return PredicateResult::ok(std::move(predicate));
  }

  return PredicateResult::err("Condition has no recognised operator");
}

nlohmann::json predicate_to_json(const Predicate& predicate) {
  using json = nlohmann::json;

  const auto children_json = [&predicate]() {
    json arr = json::array();
    for (const auto& child : predicate.children) {
      arr.push_back(predicate_to_json(child));
    }
    return arr;
  };

  switch (predicate.op) {
    case Predicate::Op::kProjectType:
      return {{"project_type", predicate.name}};
    case Predicate::Op::kFramework:
      return {{"framework", predicate.name}};
    case Predicate::Op::kFlag:
      return {{"equals", predicate.expected}, {"flag", predicate.name}};
    case Predicate::Op::kFileExists:
      return {{"file_exists", predicate.paths}};
    case Predicate::Op::kDirectoryExists:
      return {{"directory_exists", predicate.paths}};
    case Predicate::Op::kPathExists: {
      std::string text;
      for (const auto& path : predicate.paths) {
        if (!text.empty()) {
          text += " or ";
        }
        text += path;
      }
      return json(text + std::string(kExistsSuffix));
    }
    case Predicate::Op::kAll:
      return {{"all", children_json()}};
    case Predicate::Op::kAny:
      return {{"any", children_json()}};
    case Predicate::Op::kNot:
      return {{"not", predicate.children.empty() ? json::object()
                                                 : predicate_to_json(predicate.children.front())}};
  }
  return json::object();
}

}  // namespace catalyst::rules
