// wire_check/types/builtins.hpp - Well-known constructor identities
//
// The closed set of constructors the wire checker and the loopback
// classifier treat specially. Every predicate is an identity comparison
// against these constants; spelled names are never matched on their own.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "wire_check/types/canonical_var.hpp"

namespace wire_check
{

namespace builtins
{

// Primitives
inline constexpr CanonicalVar k_int = CanonicalVar::builtin("Int");
inline constexpr CanonicalVar k_float = CanonicalVar::builtin("Float");
inline constexpr CanonicalVar k_bool = CanonicalVar::builtin("Bool");
inline constexpr CanonicalVar k_string = CanonicalVar::builtin("String");
inline constexpr CanonicalVar k_char = CanonicalVar::builtin("Char");

// Containers
inline constexpr CanonicalVar k_list = CanonicalVar::builtin("List");
inline constexpr CanonicalVar k_maybe = CanonicalVar::from_module("Maybe", "Maybe");
inline constexpr CanonicalVar k_array = CanonicalVar::from_module("Array", "Array");

// Opaque JSON value
inline constexpr CanonicalVar k_json_value = CanonicalVar::from_module("Json.Encode", "Value");

// Signals, loopbacks and effects
inline constexpr CanonicalVar k_stream = CanonicalVar::from_module("Stream", "Stream");
inline constexpr CanonicalVar k_varying = CanonicalVar::from_module("Varying", "Varying");
inline constexpr CanonicalVar k_mailbox = CanonicalVar::from_module("Stream", "Mailbox");
inline constexpr CanonicalVar k_result = CanonicalVar::from_module("Result", "Result");
inline constexpr CanonicalVar k_promise = CanonicalVar::from_module("Promise", "Promise");

/// Tuple constructors are built-ins named "_Tuple<N>"; "_Tuple0" is unit.
inline constexpr std::string_view k_tuple_prefix = "_Tuple";

}  // namespace builtins

// ============================================================================
// Identity Predicates
// ============================================================================

/// Int, Float, Bool, String or Char.
[[nodiscard]] bool is_primitive(const CanonicalVar & v) noexcept;

[[nodiscard]] bool is_json(const CanonicalVar & v) noexcept;

/// Built-in tuple constructor of any arity (including unit).
[[nodiscard]] bool is_tuple(const CanonicalVar & v) noexcept;

[[nodiscard]] inline bool is_maybe(const CanonicalVar & v) noexcept
{
  return v == builtins::k_maybe;
}
[[nodiscard]] inline bool is_array(const CanonicalVar & v) noexcept
{
  return v == builtins::k_array;
}
[[nodiscard]] inline bool is_list(const CanonicalVar & v) noexcept
{
  return v == builtins::k_list;
}
[[nodiscard]] inline bool is_stream(const CanonicalVar & v) noexcept
{
  return v == builtins::k_stream;
}
[[nodiscard]] inline bool is_varying(const CanonicalVar & v) noexcept
{
  return v == builtins::k_varying;
}
[[nodiscard]] inline bool is_mailbox(const CanonicalVar & v) noexcept
{
  return v == builtins::k_mailbox;
}
[[nodiscard]] inline bool is_result(const CanonicalVar & v) noexcept
{
  return v == builtins::k_result;
}

/// Arity of a tuple constructor, std::nullopt if `v` is not one.
[[nodiscard]] std::optional<size_t> tuple_arity(const CanonicalVar & v) noexcept;

/**
 * Look up a well-known constructor by its short spelling.
 *
 * Accepts "Int", "Float", "Bool", "String", "Char", "List", "Maybe",
 * "Array", "Json.Value" (or "Json.Encode.Value"), "Stream", "Varying",
 * "Mailbox", "Result" and "Promise". Tuples are not covered here.
 *
 * @return The identity, or std::nullopt for unknown names
 */
[[nodiscard]] std::optional<CanonicalVar> lookup_well_known(std::string_view name) noexcept;

}  // namespace wire_check
