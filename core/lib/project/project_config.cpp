// wire_check/project/project_config.cpp - Project configuration implementation
//
#include "wire_check/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace wire_check
{

namespace
{

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'checker' section
  if (root["checker"]) {
    const auto & chk = root["checker"];

    if (chk["manifests"]) {
      if (!chk["manifests"].IsSequence()) {
        return ConfigLoadResult::fail("checker.manifests must be a list");
      }
      for (const auto & m : chk["manifests"]) {
        config.checker.manifests.emplace_back(m.as<std::string>());
      }
    }

    if (chk["max_alias_depth"]) {
      const auto depth = chk["max_alias_depth"].as<long long>();
      if (depth <= 0) {
        return ConfigLoadResult::fail(
          "invalid checker.max_alias_depth: " + std::to_string(depth) + " (must be positive)");
      }
      config.checker.max_alias_depth = static_cast<size_t>(depth);
    }
  }

  // Parse 'output' section
  if (root["output"]) {
    const auto & out = root["output"];

    if (out["format"]) {
      const auto format = out["format"].as<std::string>();
      if (format == "text") {
        config.output.format = OutputFormat::Text;
      } else if (format == "json") {
        config.output.format = OutputFormat::Json;
      } else {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + format + "' (must be 'text' or 'json')");
      }
    }

    if (out["color"]) {
      const auto color = out["color"].as<std::string>();
      if (color == "auto") {
        config.output.color = ColorMode::Auto;
      } else if (color == "always") {
        config.output.color = ColorMode::Always;
      } else if (color == "never") {
        config.output.color = ColorMode::Never;
      } else {
        return ConfigLoadResult::fail(
          "invalid output.color: '" + color + "' (must be 'auto', 'always' or 'never')");
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::vector<std::filesystem::path> ProjectConfig::resolved_manifests() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(checker.manifests.size());
  for (const auto & m : checker.manifests) {
    out.push_back(m.is_absolute() ? m : (project_root / m).lexically_normal());
  }
  return out;
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace wire_check
