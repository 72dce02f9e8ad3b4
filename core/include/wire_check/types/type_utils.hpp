// wire_check/types/type_utils.hpp - Type printing and comparison
//
#pragma once

#include <string>
#include <vector>

#include "wire_check/types/type.hpp"

namespace wire_check
{

/**
 * Render a type the way diagnostics show it.
 *
 * @code
 *   Int
 *   Maybe (List Int)
 *   (Int -> Int) -> Int
 *   (Int, String)
 *   { r | x : Int, y : Bool }
 *   Stream (Result Http.Error String)
 * @endcode
 *
 * Well-known constructors print by their short name (`Maybe`, `Stream`);
 * other module types are qualified (`Json.Encode.Value`, `Http.Error`).
 * Aliases are rendered by name with their arguments, not expanded.
 */
[[nodiscard]] std::string to_string(const CanonicalType * type);

/**
 * Structural equality.
 *
 * Constructors compare by identity, variables by name, records by field
 * names, order and extension. Alias nodes compare by alias identity and
 * arguments; call deep_dealias first to compare expansions.
 */
[[nodiscard]] bool structurally_equal(const CanonicalType * lhs, const CanonicalType * rhs);

/**
 * Split a curried function into its argument types followed by its result.
 *
 * `a -> b -> r` yields {a, b, r}; a non-function yields {type}. Only the
 * arrow spine is followed: an alias in result position is not expanded.
 */
[[nodiscard]] std::vector<const CanonicalType *> collect_lambdas(const CanonicalType * type);

}  // namespace wire_check
