// wire_check/wire/wire_diagnostics.hpp - Errors of the wire and loopback checks
//
// Each error carries everything needed to render its diagnostic; the
// make_*_diagnostic functions only format.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "wire_check/basic/diagnostic.hpp"
#include "wire_check/types/type.hpp"
#include "wire_check/wire/declaration.hpp"

namespace wire_check
{

// ============================================================================
// Wire Type Errors
// ============================================================================

enum class WireErrorReason : uint8_t {
  UnsupportedType,
  FreeTypeVariable,
  ContainsFunctions,        ///< Any function on an input
  HigherOrderFunctions,     ///< Output function taking or returning a function
  StreamContainsFunction,   ///< Output function under a Stream wrapper
  VaryingContainsFunction,  ///< Output function under a Varying wrapper
  ExtendedRecord,
  AliasDepthExceeded,  ///< More nested aliases than CheckerOptions::max_alias_depth
};

/// Sentence used in the diagnostic, e.g. "It contains functions".
[[nodiscard]] std::string_view reason_message(WireErrorReason reason) noexcept;

/// Stable diagnostic code, e.g. "E0303".
[[nodiscard]] std::string_view reason_code(WireErrorReason reason) noexcept;

struct WireTypeError
{
  std::string name;
  WireDirection direction = WireDirection::In;
  const CanonicalType * root_type = nullptr;   ///< Declared type
  const CanonicalType * local_type = nullptr;  ///< First offending subtype
  WireErrorReason reason = WireErrorReason::UnsupportedType;
  size_t alias_limit = 0;  ///< Limit that was hit, for AliasDepthExceeded
};

// ============================================================================
// Loopback Shape Errors
// ============================================================================

/// Shape a loopback was expected to have.
enum class LoopbackShape : uint8_t {
  Mailbox,  ///< No implementation: { mailbox : Mailbox a, stream : Stream a }
  Promise,  ///< With implementation: Stream (Result x a)
};

struct LoopbackShapeError
{
  std::string name;
  const CanonicalType * type = nullptr;
  LoopbackShape expected = LoopbackShape::Mailbox;

  /// Nonzero when the type could not be expanded within this many nested aliases
  size_t alias_limit = 0;
};

/// Explanation lines printed under the declared type.
[[nodiscard]] std::vector<std::string> loopback_explanation(LoopbackShape shape);

[[nodiscard]] std::string_view loopback_code(LoopbackShape shape) noexcept;

/// Code of a loopback whose type exceeds the alias expansion limit.
inline constexpr std::string_view k_loopback_alias_limit_code = "E0313";

// ============================================================================
// Diagnostic Builders
// ============================================================================

/**
 * Render a wire type error.
 *
 * @code
 *   Output Error:
 *       The output named 'handler' has an invalid type.
 *
 *           (Int -> Int) -> Int
 *
 *       It contains higher-order functions:
 *
 *           Int -> Int
 *
 *       Acceptable values for outputs include:
 *         Ints, Floats, Bools, Strings, Maybes, Lists, Arrays, Tuples, unit values,
 *         Json.Values, first-order functions, promises, and concrete records.
 * @endcode
 */
[[nodiscard]] Diagnostic make_wire_diagnostic(const WireTypeError & error);

/**
 * Render a loopback shape error: headline, declared type, explanation.
 */
[[nodiscard]] Diagnostic make_loopback_diagnostic(const LoopbackShapeError & error);

}  // namespace wire_check
