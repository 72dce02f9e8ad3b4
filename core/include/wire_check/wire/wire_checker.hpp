// wire_check/wire/wire_checker.hpp - Port type validation
//
// Decides whether the type of an input or output port can cross the
// boundary between the host runtime and managed code.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

#include "wire_check/basic/diagnostic.hpp"
#include "wire_check/types/alias_resolver.hpp"
#include "wire_check/types/type.hpp"
#include "wire_check/types/type_context.hpp"
#include "wire_check/wire/declaration.hpp"
#include "wire_check/wire/wire_diagnostics.hpp"

namespace wire_check
{

struct CheckerOptions
{
  /// Alias expansions allowed along one path from the root before giving up.
  size_t max_alias_depth = k_default_max_alias_depth;
};

/**
 * Outcome of checking one port.
 */
struct WireCheckResult
{
  bool success = false;

  /// Set when success == false
  std::optional<WireTypeError> error;
  std::optional<Diagnostic> diagnostic;

  static WireCheckResult ok()
  {
    WireCheckResult r;
    r.success = true;
    return r;
  }

  static WireCheckResult fail(WireTypeError err)
  {
    WireCheckResult r;
    r.diagnostic = make_wire_diagnostic(err);
    r.error = std::move(err);
    r.success = false;
    return r;
  }
};

/**
 * Wire type checker.
 *
 * ## Rules
 * - One Stream or Varying wrapper is stripped at the outermost position.
 * - Accepted: primitives, Json values, tuples (and unit), Maybe, List and
 *   Array of accepted types, closed records of accepted types.
 * - Inputs never accept functions. Outputs accept first-order functions
 *   whose arguments and result are accepted, except under a signal.
 * - The traversal is depth-first, left to right, and stops at the first
 *   violation; only that one is reported.
 *
 * ## Usage
 * ```cpp
 * WireChecker checker(types);
 * auto r = checker.check_output("handler", type);
 * if (!r.success) bag.add(*r.diagnostic);
 * ```
 *
 * Alias expansion may allocate in `types`; a checker must not share its
 * context with a thread that is building types.
 */
class WireChecker
{
public:
  explicit WireChecker(TypeContext & types, CheckerOptions options = {});

  [[nodiscard]] WireCheckResult check_input(std::string_view name, const CanonicalType * type);
  [[nodiscard]] WireCheckResult check_output(std::string_view name, const CanonicalType * type);

  [[nodiscard]] WireCheckResult check(
    WireDirection direction, std::string_view name, const CanonicalType * type);

  [[nodiscard]] WireCheckResult check(const PortDecl & port)
  {
    return check(port.direction, port.name, port.type);
  }

private:
  /// Fixed for one declaration.
  struct Root
  {
    WireDirection direction;
    std::string_view name;
    const CanonicalType * type;
  };

  [[nodiscard]] std::optional<WireTypeError> validate(
    const Root & root, bool seen_func, std::optional<SignalKind> seen_signal,
    const CanonicalType * type, size_t alias_depth);

  [[nodiscard]] std::optional<WireTypeError> validate_function(
    const Root & root, bool seen_func, std::optional<SignalKind> seen_signal,
    const FunctionType * fn, size_t alias_depth);

  [[nodiscard]] WireTypeError make_error(
    const Root & root, const CanonicalType * local, WireErrorReason reason) const;

  TypeContext & types_;
  CheckerOptions options_;
};

/// Convenience wrappers with default options.
[[nodiscard]] WireCheckResult check_input(
  TypeContext & types, std::string_view name, const CanonicalType * type);
[[nodiscard]] WireCheckResult check_output(
  TypeContext & types, std::string_view name, const CanonicalType * type);

}  // namespace wire_check
