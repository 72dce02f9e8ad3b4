// wire_check/project/project_config.hpp - Project configuration (wirec.yaml)
//
// Parses and validates wirec.yaml project configuration files.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wire_check
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Checker configuration section.
 */
struct CheckerConfig
{
  /// Manifest files to check (relative to wirec.yaml)
  std::vector<std::filesystem::path> manifests;

  /// Bound on consecutive alias expansions along one path
  size_t max_alias_depth = 64;
};

enum class OutputFormat {
  Text,
  Json,
};

enum class ColorMode {
  Auto,    ///< Color when stdout is a terminal
  Always,
  Never,
};

/**
 * Output configuration section.
 */
struct OutputConfig
{
  OutputFormat format = OutputFormat::Text;
  ColorMode color = ColorMode::Auto;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (wirec.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CheckerConfig checker;
  OutputConfig output;

  /// Directory containing wirec.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Manifest paths resolved against project_root.
  [[nodiscard]] std::vector<std::filesystem::path> resolved_manifests() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a wirec.yaml file.
 *
 * @param config_path Path to wirec.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse a project configuration from YAML text.
 *
 * @param project_root Directory relative manifest paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to wirec.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "wirec.yaml";

}  // namespace wire_check
