// wire_check/wire/declaration.hpp - Port and loopback declarations
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "wire_check/types/type.hpp"

namespace wire_check
{

/**
 * Which way a port carries values.
 */
enum class WireDirection : uint8_t {
  In,   ///< Host runtime -> managed code
  Out,  ///< Managed code -> host runtime
};

/**
 * Signal wrapper stripped from the outermost position of a port type.
 */
enum class SignalKind : uint8_t {
  Stream,
  Varying,
};

[[nodiscard]] std::string_view to_string(WireDirection direction) noexcept;

/**
 * Implementation expression attached to a loopback. Opaque to the checks;
 * carried through to code generation.
 */
struct ImplementationExpr
{
  std::string source;
};

/// An `input` or `output` declaration.
struct PortDecl
{
  std::string name;
  WireDirection direction = WireDirection::In;
  const CanonicalType * type = nullptr;
};

/// A loopback declaration as written, before classification.
struct LoopbackSource
{
  std::string name;
  std::optional<ImplementationExpr> implementation;
  const CanonicalType * type = nullptr;
};

// ============================================================================
// Classified Loopbacks
// ============================================================================

/// `{ mailbox : Mailbox a, stream : Stream a }` feedback loop.
struct MailboxLoopback
{
  std::string name;
  const CanonicalType * type = nullptr;
};

/// `Stream (Result x a)` driven by an implementation, rewritten to `Stream (Promise x a)`.
struct PromiseLoopback
{
  std::string name;
  const CanonicalType * promise_type = nullptr;
  ImplementationExpr implementation;
  const CanonicalType * original_type = nullptr;
};

using LoopbackDecl = std::variant<MailboxLoopback, PromiseLoopback>;

/// Declared name of either loopback form.
[[nodiscard]] const std::string & loopback_name(const LoopbackDecl & decl) noexcept;

}  // namespace wire_check
