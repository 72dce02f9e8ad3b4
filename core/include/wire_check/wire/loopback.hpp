// wire_check/wire/loopback.hpp - Loopback declaration classifier
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

/**
 * Outcome of classifying one loopback.
 */
struct LoopbackResult
{
  bool success = false;

  /// Set when success == true
  std::optional<LoopbackDecl> declaration;

  /// Set when success == false
  std::optional<LoopbackShapeError> error;
  std::optional<Diagnostic> diagnostic;

  static LoopbackResult ok(LoopbackDecl decl)
  {
    LoopbackResult r;
    r.success = true;
    r.declaration = std::move(decl);
    return r;
  }

  static LoopbackResult fail(LoopbackShapeError err)
  {
    LoopbackResult r;
    r.diagnostic = make_loopback_diagnostic(err);
    r.error = std::move(err);
    r.success = false;
    return r;
  }
};

/**
 * Recognizes the two loopback shapes.
 *
 * Without an implementation the type must expand to
 * `{ mailbox : Mailbox a, stream : Stream a }` (field order free, no other
 * fields, both `a` equal after expansion).
 *
 * With an implementation the type must expand to `Stream (Result x a)`; the
 * declaration is rewritten to `Stream (Promise x a)`.
 *
 * Expansion stops after `max_alias_depth` nested aliases on one path; such a
 * loopback fails with the alias limit set in its error.
 */
class LoopbackClassifier
{
public:
  explicit LoopbackClassifier(
    TypeContext & types, size_t max_alias_depth = k_default_max_alias_depth)
  : types_(types), max_alias_depth_(max_alias_depth)
  {
  }

  [[nodiscard]] LoopbackResult classify(
    std::string_view name, const std::optional<ImplementationExpr> & implementation,
    const CanonicalType * type);

  [[nodiscard]] LoopbackResult classify(const LoopbackSource & source)
  {
    return classify(source.name, source.implementation, source.type);
  }

private:
  [[nodiscard]] LoopbackResult classify_mailbox(std::string_view name, const CanonicalType * type);

  [[nodiscard]] LoopbackResult classify_promise(
    std::string_view name, const ImplementationExpr & implementation, const CanonicalType * type);

  [[nodiscard]] LoopbackResult fail(
    std::string_view name, const CanonicalType * type, LoopbackShape expected,
    bool alias_limit_hit) const;

  TypeContext & types_;
  size_t max_alias_depth_;
};

/// Classify with a temporary classifier.
[[nodiscard]] LoopbackResult classify_loopback(
  TypeContext & types, std::string_view name,
  const std::optional<ImplementationExpr> & implementation, const CanonicalType * type);

}  // namespace wire_check
