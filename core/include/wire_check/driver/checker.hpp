// wire_check/driver/checker.hpp - Declaration check driver
//
// Runs the wire checker over every port and the loopback classifier over
// every loopback of one or more modules, and aggregates the diagnostics.
// Used by the CLI and can be embedded in other tools.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "wire_check/basic/diagnostic.hpp"
#include "wire_check/driver/manifest.hpp"
#include "wire_check/project/project_config.hpp"
#include "wire_check/types/type_context.hpp"
#include "wire_check/wire/declaration.hpp"

namespace wire_check
{

// ============================================================================
// Check Options
// ============================================================================

struct CheckOptions
{
  /// Overrides checker.max_alias_depth from the project config
  std::optional<size_t> max_alias_depth;

  /// Enable verbose output (progress on stderr)
  bool verbose = false;
};

// ============================================================================
// Check Result
// ============================================================================

/**
 * Outcome for one module.
 */
struct ModuleReport
{
  std::string module_name;

  /// Manifest file (empty for in-memory manifests)
  std::filesystem::path source_path;

  DiagnosticBag diagnostics;

  /// Classified loopbacks, in declaration order
  std::vector<LoopbackDecl> loopbacks;

  /// Name used when printing diagnostics: the file, else the module name.
  [[nodiscard]] std::string origin() const
  {
    return source_path.empty() ? module_name : source_path.string();
  }
};

struct CheckResult
{
  /// Whether every declaration of every module passed
  bool success = false;

  /// All diagnostics, in module then declaration order
  DiagnosticBag diagnostics;

  /// All classified loopbacks, in module then declaration order
  std::vector<LoopbackDecl> loopbacks;

  std::vector<ModuleReport> modules;

  /// Owns the types referenced by `loopbacks` (set by check_file / check_project)
  std::unique_ptr<TypeContext> types;
};

// ============================================================================
// Checker
// ============================================================================

/**
 * Driver for module-level checks.
 *
 * Each declaration is checked independently; a failing declaration does not
 * stop the others. A module fails if any of its declarations fails.
 */
class Checker
{
public:
  /**
   * Check one already-loaded module.
   *
   * @param manifest Declarations whose types live in `types`
   * @param types Context used for alias expansion and promise rewriting
   */
  [[nodiscard]] static CheckResult check_module(
    const ModuleManifest & manifest, TypeContext & types, const CheckOptions & options);

  /**
   * Load and check a single manifest file.
   */
  [[nodiscard]] static CheckResult check_file(
    const std::filesystem::path & file, const CheckOptions & options);

  /**
   * Check every manifest listed by a project configuration.
   */
  [[nodiscard]] static CheckResult check_project(
    const ProjectConfig & config, const CheckOptions & options);

private:
  static ModuleReport run_module(
    const ModuleManifest & manifest, TypeContext & types, size_t max_alias_depth, bool verbose);

  static void append(CheckResult & result, ModuleReport report);
};

}  // namespace wire_check
