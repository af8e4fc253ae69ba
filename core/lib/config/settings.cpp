// awkls/config/settings.cpp - Settings loading implementation
#include "awkls/config/settings.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <nlohmann/json.hpp>

namespace awkls
{

namespace
{

std::vector<std::string> env_include_path()
{
  const char * value = std::getenv("AWKPATH");
  if (value == nullptr) {
    return {"."};
  }
  auto path = split_search_path(value);
  if (path.empty()) {
    path.emplace_back(".");
  }
  return path;
}

std::optional<bool> parse_mode(const std::string & mode)
{
  if (mode == "gawk") {
    return true;
  }
  if (mode == "awk") {
    return false;
  }
  return std::nullopt;
}

/// Read an optional boolean member of a JSON object
bool read_flag(const nlohmann::json & obj, const char * key, bool & out, std::string & error)
{
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return true;
  }
  if (!it->is_boolean()) {
    error = std::string("stylisticWarnings.") + key + " must be a boolean";
    return false;
  }
  out = it->get<bool>();
  return true;
}

}  // namespace

std::vector<std::string> split_search_path(std::string_view list)
{
  std::vector<std::string> out;
  size_t begin = 0;
  while (begin <= list.size()) {
    size_t end = list.find(':', begin);
    if (end == std::string_view::npos) {
      end = list.size();
    }
    if (end > begin) {
      out.emplace_back(list.substr(begin, end - begin));
    }
    begin = end + 1;
  }
  return out;
}

Settings default_settings()
{
  Settings s;
  s.include_path = env_include_path();
  return s;
}

SettingsLoadResult settings_from_json(const nlohmann::json & config, Settings base)
{
  const nlohmann::json * obj = &config;
  if (config.is_object() && config.contains("awk")) {
    obj = &config.at("awk");
  }
  if (!obj->is_object()) {
    return SettingsLoadResult::fail("configuration must be an object");
  }

  Settings s = std::move(base);

  if (auto it = obj->find("maxNumberOfProblems"); it != obj->end() && !it->is_null()) {
    if (!it->is_number_integer() && !it->is_number_unsigned()) {
      return SettingsLoadResult::fail("maxNumberOfProblems must be an integer");
    }
    const auto n = it->get<int64_t>();
    s.max_number_of_problems = n > 0 ? static_cast<uint32_t>(n) : k_default_max_number_of_problems;
  }

  if (auto it = obj->find("mode"); it != obj->end() && it->is_string()) {
    const auto mode = parse_mode(it->get<std::string>());
    if (!mode) {
      return SettingsLoadResult::fail("mode must be 'gawk' or 'awk'");
    }
    s.gawk = *mode;
  } else {
    s.gawk = true;
  }

  if (auto it = obj->find("stylisticWarnings"); it != obj->end() && it->is_object()) {
    std::string error;
    if (
      !read_flag(*it, "missingSemicolon", s.stylistic_warnings.missing_semicolon, error) ||
      !read_flag(*it, "compatibility", s.stylistic_warnings.compatibility, error) ||
      !read_flag(*it, "functionCalls", s.stylistic_warnings.function_calls, error)) {
      return SettingsLoadResult::fail(error);
    }
  }

  auto path = obj->find("path");
  if (path != obj->end() && path->is_array()) {
    std::vector<std::string> dirs;
    for (const auto & entry : *path) {
      if (!entry.is_string()) {
        return SettingsLoadResult::fail("path entries must be strings");
      }
      dirs.push_back(entry.get<std::string>());
    }
    s.include_path = std::move(dirs);
  } else if (path != obj->end() && path->is_string()) {
    s.include_path = split_search_path(path->get<std::string>());
  } else {
    s.include_path = env_include_path();
  }

  return SettingsLoadResult::ok(std::move(s));
}

SettingsLoadResult load_settings_file(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return SettingsLoadResult::fail("configuration file not found: " + config_path.string());
  }

  Settings s = default_settings();
  const fs::path root = fs::absolute(config_path).parent_path();

  try {
    const YAML::Node doc = YAML::LoadFile(config_path.string());
    if (!doc || doc.IsNull()) {
      return SettingsLoadResult::ok(std::move(s));
    }
    if (!doc.IsMap()) {
      return SettingsLoadResult::fail("configuration must be a map");
    }

    if (doc["max_number_of_problems"]) {
      const auto n = doc["max_number_of_problems"].as<int64_t>();
      s.max_number_of_problems =
        n > 0 ? static_cast<uint32_t>(n) : k_default_max_number_of_problems;
    }

    if (doc["mode"]) {
      const auto mode = parse_mode(doc["mode"].as<std::string>());
      if (!mode) {
        return SettingsLoadResult::fail(
          "invalid mode: '" + doc["mode"].as<std::string>() + "' (must be 'gawk' or 'awk')");
      }
      s.gawk = *mode;
    }

    if (const auto warnings = doc["stylistic_warnings"]) {
      if (!warnings.IsMap()) {
        return SettingsLoadResult::fail("stylistic_warnings must be a map");
      }
      if (warnings["missing_semicolon"]) {
        s.stylistic_warnings.missing_semicolon = warnings["missing_semicolon"].as<bool>();
      }
      if (warnings["compatibility"]) {
        s.stylistic_warnings.compatibility = warnings["compatibility"].as<bool>();
      }
      if (warnings["function_calls"]) {
        s.stylistic_warnings.function_calls = warnings["function_calls"].as<bool>();
      }
    }

    if (const auto include_path = doc["include_path"]) {
      if (!include_path.IsSequence()) {
        return SettingsLoadResult::fail("include_path must be a list");
      }
      s.include_path.clear();
      for (const auto & entry : include_path) {
        fs::path dir = entry.as<std::string>();
        if (dir.is_relative()) {
          dir = (root / dir).lexically_normal();
        }
        s.include_path.push_back(dir.string());
      }
    }
  } catch (const YAML::Exception & e) {
    return SettingsLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return SettingsLoadResult::ok(std::move(s));
}

std::optional<std::filesystem::path> find_settings_file(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_settings_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }
    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }
  return std::nullopt;
}

}  // namespace awkls
