// wire_check/driver/checker.cpp - Declaration check driver
//
#include "wire_check/driver/checker.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <utility>

#include "wire_check/wire/loopback.hpp"
#include "wire_check/wire/wire_checker.hpp"

namespace wire_check
{

namespace
{

constexpr size_t k_default_max_alias_depth = CheckerOptions{}.max_alias_depth;

/// Report for a manifest that could not be loaded.
[[nodiscard]] ModuleReport load_error_report(
  const std::filesystem::path & path, const std::string & message)
{
  ModuleReport report;
  report.source_path = path;
  report.diagnostics.report_error("Manifest Error")
    .with_code("E0001")
    .with_block(Doc::text(message));
  return report;
}

}  // namespace

CheckResult Checker::check_module(
  const ModuleManifest & manifest, TypeContext & types, const CheckOptions & options)
{
  CheckResult result;
  append(
    result, run_module(
              manifest, types, options.max_alias_depth.value_or(k_default_max_alias_depth),
              options.verbose));
  result.success = !result.diagnostics.has_errors();
  return result;
}

CheckResult Checker::check_file(const std::filesystem::path & file, const CheckOptions & options)
{
  CheckResult result;
  result.types = std::make_unique<TypeContext>();

  if (options.verbose) {
    fmt::print(stderr, "Loading {}\n", file.string());
  }

  auto loaded = load_manifest(file, *result.types);
  if (!loaded.success) {
    append(result, load_error_report(file, loaded.error));
    return result;
  }

  append(
    result, run_module(
              loaded.manifest, *result.types,
              options.max_alias_depth.value_or(k_default_max_alias_depth), options.verbose));
  result.success = !result.diagnostics.has_errors();
  return result;
}

CheckResult Checker::check_project(const ProjectConfig & config, const CheckOptions & options)
{
  CheckResult result;
  result.types = std::make_unique<TypeContext>();

  const auto manifests = config.resolved_manifests();
  if (manifests.empty()) {
    result.diagnostics.report_error("no manifests defined in project configuration")
      .with_help("list manifest files under checker.manifests in wirec.yaml");
    return result;
  }

  const size_t max_alias_depth = options.max_alias_depth.value_or(config.checker.max_alias_depth);

  for (const auto & path : manifests) {
    if (options.verbose) {
      fmt::print(stderr, "Loading {}\n", path.string());
    }

    auto loaded = load_manifest(path, *result.types);
    if (!loaded.success) {
      // Continue with the remaining manifests to collect more errors
      append(result, load_error_report(path, loaded.error));
      continue;
    }
    append(result, run_module(loaded.manifest, *result.types, max_alias_depth, options.verbose));
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

ModuleReport Checker::run_module(
  const ModuleManifest & manifest, TypeContext & types, size_t max_alias_depth, bool verbose)
{
  ModuleReport report;
  report.module_name = manifest.module_name;
  report.source_path = manifest.source_path;

  if (verbose) {
    fmt::print(
      stderr, "Checking module '{}': {} port(s), {} loopback(s)\n", manifest.module_name,
      manifest.ports.size(), manifest.loopbacks.size());
  }

  WireChecker wires(types, CheckerOptions{max_alias_depth});
  for (const auto & port : manifest.ports) {
    auto r = wires.check(port);
    if (!r.success) {
      report.diagnostics.add(std::move(*r.diagnostic));
    }
  }

  LoopbackClassifier classifier(types, max_alias_depth);
  for (const auto & source : manifest.loopbacks) {
    auto r = classifier.classify(source);
    if (r.success) {
      report.loopbacks.push_back(std::move(*r.declaration));
    } else {
      report.diagnostics.add(std::move(*r.diagnostic));
    }
  }

  if (verbose) {
    fmt::print(
      stderr, "Module '{}': {} error(s)\n", manifest.module_name,
      report.diagnostics.errors().size());
  }
  return report;
}

void Checker::append(CheckResult & result, ModuleReport report)
{
  result.diagnostics.merge(report.diagnostics);
  result.loopbacks.insert(result.loopbacks.end(), report.loopbacks.begin(), report.loopbacks.end());
  result.modules.push_back(std::move(report));
}

}  // namespace wire_check
