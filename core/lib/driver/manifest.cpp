// wire_check/driver/manifest.cpp - Declaration manifests
//
#include "wire_check/driver/manifest.hpp"

#include <fmt/core.h>

#include <fstream>
#include <optional>
#include <variant>

#include "wire_check/types/type_json.hpp"

namespace wire_check
{

namespace
{

using nlohmann::json;

std::optional<WireDirection> parse_direction(const std::string & s)
{
  if (s == "input" || s == "in") return WireDirection::In;
  if (s == "output" || s == "out") return WireDirection::Out;
  return std::nullopt;
}

/// Non-empty string member, or an error naming `path`.
std::optional<std::string> required_name(const json & j, const std::string & path, std::string & error)
{
  if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty()) {
    error = fmt::format("{}.name: expected a non-empty string", path);
    return std::nullopt;
  }
  return j["name"].get<std::string>();
}

}  // namespace

ManifestLoadResult parse_manifest(const nlohmann::json & j, TypeContext & types)
{
  if (!j.is_object()) {
    return ManifestLoadResult::fail("$: manifest must be an object");
  }

  ModuleManifest manifest;
  if (j.contains("module")) {
    if (!j["module"].is_string()) {
      return ManifestLoadResult::fail("$.module: expected a string");
    }
    manifest.module_name = j["module"].get<std::string>();
  }

  // Ports
  if (j.contains("ports")) {
    const auto & ports = j["ports"];
    if (!ports.is_array()) {
      return ManifestLoadResult::fail("$.ports: expected an array");
    }
    for (size_t i = 0; i < ports.size(); ++i) {
      const std::string path = fmt::format("$.ports[{}]", i);
      const auto & p = ports[i];
      if (!p.is_object()) {
        return ManifestLoadResult::fail(path + ": expected an object");
      }

      std::string error;
      auto name = required_name(p, path, error);
      if (!name) return ManifestLoadResult::fail(error);

      if (!p.contains("direction") || !p["direction"].is_string()) {
        return ManifestLoadResult::fail(path + ".direction: expected \"input\" or \"output\"");
      }
      const auto direction = parse_direction(p["direction"].get<std::string>());
      if (!direction) {
        return ManifestLoadResult::fail(fmt::format(
          "{}.direction: invalid direction '{}' (must be 'input' or 'output')", path,
          p["direction"].get<std::string>()));
      }

      if (!p.contains("type")) {
        return ManifestLoadResult::fail(path + ": missing 'type'");
      }
      auto type = type_from_json(p["type"], types, path + ".type");
      if (!type.success) return ManifestLoadResult::fail(type.error);

      manifest.ports.push_back(PortDecl{std::move(*name), *direction, type.type});
    }
  }

  // Loopbacks
  if (j.contains("loopbacks")) {
    const auto & loopbacks = j["loopbacks"];
    if (!loopbacks.is_array()) {
      return ManifestLoadResult::fail("$.loopbacks: expected an array");
    }
    for (size_t i = 0; i < loopbacks.size(); ++i) {
      const std::string path = fmt::format("$.loopbacks[{}]", i);
      const auto & l = loopbacks[i];
      if (!l.is_object()) {
        return ManifestLoadResult::fail(path + ": expected an object");
      }

      std::string error;
      auto name = required_name(l, path, error);
      if (!name) return ManifestLoadResult::fail(error);

      std::optional<ImplementationExpr> implementation;
      if (l.contains("implementation") && !l["implementation"].is_null()) {
        if (!l["implementation"].is_string()) {
          return ManifestLoadResult::fail(path + ".implementation: expected a string");
        }
        implementation = ImplementationExpr{l["implementation"].get<std::string>()};
      }

      if (!l.contains("type")) {
        return ManifestLoadResult::fail(path + ": missing 'type'");
      }
      auto type = type_from_json(l["type"], types, path + ".type");
      if (!type.success) return ManifestLoadResult::fail(type.error);

      manifest.loopbacks.push_back(
        LoopbackSource{std::move(*name), std::move(implementation), type.type});
    }
  }

  return ManifestLoadResult::ok(std::move(manifest));
}

ManifestLoadResult load_manifest(const std::filesystem::path & path, TypeContext & types)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return ManifestLoadResult::fail("manifest not found: " + path.string());
  }

  std::ifstream in(path);
  if (!in) {
    return ManifestLoadResult::fail("cannot open manifest: " + path.string());
  }

  json j;
  try {
    j = json::parse(in);
  } catch (const json::parse_error & e) {
    return ManifestLoadResult::fail(
      fmt::format("failed to parse JSON in {}: {}", path.string(), e.what()));
  }

  ManifestLoadResult result;
  try {
    result = parse_manifest(j, types);
  } catch (const json::exception & e) {
    return ManifestLoadResult::fail(fmt::format("malformed manifest {}: {}", path.string(), e.what()));
  }
  if (!result.success) {
    result.error = fmt::format("{}: {}", path.string(), result.error);
    return result;
  }
  result.manifest.source_path = path;
  return result;
}

nlohmann::json loopback_to_json(const LoopbackDecl & decl)
{
  if (const auto * mailbox = std::get_if<MailboxLoopback>(&decl)) {
    return json{{"kind", "mailbox"}, {"name", mailbox->name}, {"type", type_to_json(mailbox->type)}};
  }

  const auto & promise = std::get<PromiseLoopback>(decl);
  return json{
    {"kind", "promise"},
    {"name", promise.name},
    {"type", type_to_json(promise.promise_type)},
    {"implementation", promise.implementation.source},
    {"originalType", type_to_json(promise.original_type)}};
}

}  // namespace wire_check
