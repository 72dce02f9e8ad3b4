// wire_check/driver/manifest.hpp - Declaration manifests
//
// A manifest lists the port and loopback declarations of one module with
// their canonical types, as produced by the upstream canonicalizer:
//
// @code
//   {
//     "module": "Main",
//     "ports": [
//       {"name": "clicks", "direction": "input", "type": {"app": "Stream", "args": ["Int"]}}
//     ],
//     "loopbacks": [
//       {"name": "results", "implementation": "Http.get url", "type": ...}
//     ]
//   }
// @endcode
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

#include "wire_check/types/type_context.hpp"
#include "wire_check/wire/declaration.hpp"

namespace wire_check
{

/**
 * Declarations of one module. Types are owned by the TypeContext the
 * manifest was parsed into.
 */
struct ModuleManifest
{
  std::string module_name;
  std::vector<PortDecl> ports;
  std::vector<LoopbackSource> loopbacks;

  /// File the manifest was read from (empty for in-memory manifests)
  std::filesystem::path source_path;
};

/**
 * Result of loading a manifest.
 */
struct ManifestLoadResult
{
  /// Loaded manifest (only valid if success == true)
  ModuleManifest manifest;

  bool success = false;

  std::string error;

  static ManifestLoadResult ok(ModuleManifest m)
  {
    ManifestLoadResult r;
    r.manifest = std::move(m);
    r.success = true;
    return r;
  }

  static ManifestLoadResult fail(std::string msg)
  {
    ManifestLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Build a manifest from parsed JSON.
 *
 * Errors name the JSON path of the offending value, e.g.
 * "$.ports[1].type.args[0]: unknown type name 'Foo'".
 */
[[nodiscard]] ManifestLoadResult parse_manifest(const nlohmann::json & j, TypeContext & types);

/// Read and parse a manifest file.
[[nodiscard]] ManifestLoadResult load_manifest(
  const std::filesystem::path & path, TypeContext & types);

/**
 * Encode a classified loopback for downstream code generation.
 *
 * @code
 *   {"kind": "mailbox", "name": "m", "type": ...}
 *   {"kind": "promise", "name": "r", "type": <Stream (Promise x a)>,
 *    "implementation": "...", "originalType": <Stream (Result x a)>}
 * @endcode
 */
[[nodiscard]] nlohmann::json loopback_to_json(const LoopbackDecl & decl);

}  // namespace wire_check
