// wire_check/types/alias_resolver.hpp - Type alias expansion
//
#pragma once

#include <cstddef>
#include <gsl/span>

#include "wire_check/types/type.hpp"
#include "wire_check/types/type_context.hpp"

namespace wire_check
{

/// Nested alias expansions allowed along one path of a type.
inline constexpr size_t k_default_max_alias_depth = 64;

/**
 * Substitute alias parameters into an alias body.
 *
 * Every free variable of `body` named by one of `args` is replaced by the
 * bound type. Nested alias uses keep their own body (it is closed over
 * their parameters) but have their argument bindings substituted.
 * Subtrees without substitutions are shared, not copied.
 *
 * @return The expanded type (one level: aliases inside it are kept)
 */
[[nodiscard]] const CanonicalType * dealias(
  TypeContext & types, gsl::span<const AliasArg> args, const CanonicalType * body);

/// One-level expansion of an alias use.
[[nodiscard]] inline const CanonicalType * dealias(TypeContext & types, const AliasedType * alias)
{
  return dealias(types, alias->args, alias->body);
}

/**
 * Remove every alias node, at any depth.
 *
 * Types are built bottom-up, so an alias body never refers back to the
 * alias itself and the expansion always terminates.
 */
[[nodiscard]] const CanonicalType * deep_dealias(TypeContext & types, const CanonicalType * type);

/**
 * Remove every alias node, giving up once one path through the type
 * expands more than `max_depth` nested aliases.
 *
 * @return The expanded type, or nullptr when the limit is exceeded
 */
[[nodiscard]] const CanonicalType * deep_dealias(
  TypeContext & types, const CanonicalType * type, size_t max_depth);

}  // namespace wire_check
