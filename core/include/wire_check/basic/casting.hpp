// wire_check/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any class hierarchy that implements the `classof` static
// method pattern (the canonical type nodes in wire_check/types/type.hpp).
//
// Usage:
//   if (isa<FunctionType>(t)) { ... }
//   const auto * fn = cast<FunctionType>(t);           // asserts on failure
//   if (const auto * rec = dyn_cast<RecordType>(t)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <type_traits>

namespace wire_check
{

namespace detail
{

/// Check if T has a classof static method accepting From
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

// ============================================================================
// isa<T>
// ============================================================================

/**
 * Check if a node is of type T.
 *
 * @return true if node is non-null and of type T
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

// ============================================================================
// cast<T> - Unchecked cast (asserts on failure)
// ============================================================================

/**
 * Cast a node to type T.
 *
 * @note The node must be non-null and of type T. Use dyn_cast otherwise.
 */
template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

// ============================================================================
// dyn_cast<T> - Checked cast (nullptr on failure)
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace wire_check
