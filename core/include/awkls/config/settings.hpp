// awkls/config/settings.hpp - Analysis settings (awkls.yaml, editor configuration)
//
// Settings come from three places: the editor's configuration object (JSON),
// an awkls.yaml project file, and the AWKPATH environment variable, which
// only supplies the include path when nothing else does.
//
#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace awkls
{

// ============================================================================
// Settings Structures
// ============================================================================

/// Diagnostics that can be switched off
struct StylisticWarnings
{
  /// Warn when a newline ends a statement that has no semicolon
  bool missing_semicolon = false;

  /// Warn about gawk extensions used in extended mode
  bool compatibility = true;

  /// Check calls against declared functions and built-ins
  bool function_calls = true;

  [[nodiscard]] bool operator==(const StylisticWarnings & other) const noexcept
  {
    return missing_semicolon == other.missing_semicolon && compatibility == other.compatibility &&
           function_calls == other.function_calls;
  }
  [[nodiscard]] bool operator!=(const StylisticWarnings & other) const noexcept
  {
    return !(*this == other);
  }
};

inline constexpr uint32_t k_default_max_number_of_problems = 100;

struct Settings
{
  /// Diagnostics published per document
  uint32_t max_number_of_problems = k_default_max_number_of_problems;

  /// Extended (gawk) mode; false selects strict POSIX awk
  bool gawk = true;

  StylisticWarnings stylistic_warnings;

  /// Directories searched for @include targets
  std::vector<std::string> include_path{"."};

  /// True when switching from `other` to this requires parsing again
  [[nodiscard]] bool requires_reparse(const Settings & other) const
  {
    return gawk != other.gawk || stylistic_warnings != other.stylistic_warnings ||
           include_path != other.include_path;
  }

  [[nodiscard]] bool operator==(const Settings & other) const
  {
    return max_number_of_problems == other.max_number_of_problems && !requires_reparse(other);
  }
  [[nodiscard]] bool operator!=(const Settings & other) const { return !(*this == other); }
};

// ============================================================================
// Settings Loading Result
// ============================================================================

struct SettingsLoadResult
{
  /// Loaded settings (only valid if success == true)
  Settings settings;

  bool success = false;

  std::string error;

  static SettingsLoadResult ok(Settings s)
  {
    SettingsLoadResult r;
    r.settings = std::move(s);
    r.success = true;
    return r;
  }

  static SettingsLoadResult fail(std::string msg)
  {
    SettingsLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Settings Loading API
// ============================================================================

/// Split a colon-separated path list, dropping empty entries
[[nodiscard]] std::vector<std::string> split_search_path(std::string_view list);

/// Defaults, with the include path taken from AWKPATH when it is set
[[nodiscard]] Settings default_settings();

/**
 * Apply an editor configuration object on top of `base`.
 *
 * Accepts either `{"awk": {...}}` or the inner object. Keys: maxNumberOfProblems,
 * mode ("gawk" | "awk"), stylisticWarnings.{missingSemicolon, compatibility,
 * functionCalls}, path (list or colon-separated string). When no path is
 * given the include path falls back to AWKPATH, then ".".
 */
[[nodiscard]] SettingsLoadResult settings_from_json(const nlohmann::json & config, Settings base);

/**
 * Load settings from an awkls.yaml file.
 *
 * Relative include_path entries are resolved against the file's directory.
 */
[[nodiscard]] SettingsLoadResult load_settings_file(const std::filesystem::path & config_path);

/// Search for awkls.yaml from `start_dir` up to the filesystem root
[[nodiscard]] std::optional<std::filesystem::path> find_settings_file(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_settings_file_name = "awkls.yaml";

}  // namespace awkls
