// wire_check/types/type_json.hpp - JSON encoding of canonical types
//
// Encoding used by declaration manifests:
//
//   "Int"                                      well-known constructor
//   {"named": {"home": "module", "module": "Http", "name": "Error"}}
//   {"app": <type>, "args": [<type>, ...]}
//   {"var": "a"}
//   {"lambda": [<arg>, ..., <result>]}        curried
//   {"record": [{"name": "x", "type": <type>}], "extension": "r"}
//   {"alias": <identity>, "args": [{"name": "a", "type": <type>}], "body": <type>}
//   {"tuple": [<type>, ...]}                  [] is unit
//
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "wire_check/types/type.hpp"
#include "wire_check/types/type_context.hpp"

namespace wire_check
{

/**
 * Result of decoding a type.
 */
struct TypeDecodeResult
{
  /// Decoded type (only valid if success == true)
  const CanonicalType * type = nullptr;

  bool success = false;

  /// Error message, prefixed with the JSON path of the offending value
  std::string error;

  static TypeDecodeResult ok(const CanonicalType * t)
  {
    TypeDecodeResult r;
    r.type = t;
    r.success = true;
    return r;
  }

  static TypeDecodeResult fail(std::string msg)
  {
    TypeDecodeResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Decode a type into `types`.
 *
 * @param path JSON path of `j`, used in error messages (e.g. "$.ports[0].type")
 */
[[nodiscard]] TypeDecodeResult type_from_json(
  const nlohmann::json & j, TypeContext & types, const std::string & path = "$");

/// Encode a type. Well-known constructors use their short spelling.
[[nodiscard]] nlohmann::json type_to_json(const CanonicalType * type);

}  // namespace wire_check
