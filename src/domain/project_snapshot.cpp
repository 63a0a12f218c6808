#include "catalyst/domain/project_snapshot.h"

#include <stdexcept>

namespace catalyst::domain {

namespace {

struct ProjectTypeName {
  ProjectType type;
  std::string_view name;
};

constexpr ProjectTypeName kProjectTypeNames[] = {
    {ProjectType::kNode, "node"},     {ProjectType::kPython, "python"},
    {ProjectType::kJava, "java"},     {ProjectType::kRust, "rust"},
    {ProjectType::kGo, "go"},         {ProjectType::kRuby, "ruby"},
    {ProjectType::kPhp, "php"},       {ProjectType::kCsharp, "csharp"},
};

}  // namespace

std::string to_string(const ProjectType type) {
  for (const auto& entry : kProjectTypeNames) {
    if (entry.type == type) {
      return std::string{entry.name};
    }
  }
  return "unknown";
}

std::optional<ProjectType> parse_project_type(const std::string_view text) {
  for (const auto& entry : kProjectTypeNames) {
    if (entry.name == text) {
      return entry.type;
    }
  }
  return std::nullopt;
}

bool ProjectSnapshot::flag(const std::string_view name) const {
  const auto it = data_.flags.find(name);
  return it != data_.flags.end() && it->second;
}

nlohmann::json snapshot_to_json(const ProjectSnapshot& snapshot) {
  using json = nlohmann::json;

  json types = json::array();
  for (const auto type : snapshot.project_types()) {
    types.push_back(to_string(type));
  }

  json flags = json::object();
  for (const auto& [name, value] : snapshot.flags()) {
    flags[name] = value;
  }

  json skipped = json::array();
  for (const auto& entry : snapshot.skipped_entries()) {
    skipped.push_back({{"path", entry.path}, {"reason", entry.reason}});
  }

  json j;
  j["directories"] = snapshot.directories();
  j["files"] = snapshot.files();
  j["flags"] = std::move(flags);
  j["frameworks"] = snapshot.frameworks();
  j["project_name"] = snapshot.project_name();
  j["project_types"] = std::move(types);
  j["root"] = snapshot.root();
  j["skipped_entries"] = std::move(skipped);
  return j;
}

ProjectSnapshot snapshot_from_json(const nlohmann::json& j) {
  SnapshotData data;
  data.root = j.at("root").get<std::string>();
  data.project_name = j.at("project_name").get<std::string>();
  data.files = j.at("files").get<std::set<std::string>>();
  data.directories = j.at("directories").get<std::set<std::string>>();
  data.frameworks = j.at("frameworks").get<std::set<std::string>>();

  for (const auto& tag : j.at("project_types")) {
    const auto name = tag.get<std::string>();
    const auto type = parse_project_type(name);
    if (!type.has_value()) {
      throw std::invalid_argument("Unknown project type: " + name);
    }
    data.project_types.insert(type.value());
  }

  for (const auto& [name, value] : j.at("flags").items()) {
    data.flags[name] = value.get<bool>();
  }

  if (j.contains("skipped_entries")) {
    for (const auto& entry : j.at("skipped_entries")) {
      data.skipped_entries.push_back(
          {entry.at("path").get<std::string>(), entry.at("reason").get<std::string>()});
    }
  }

  return ProjectSnapshot{std::move(data)};
}

}  // namespace catalyst::domain
