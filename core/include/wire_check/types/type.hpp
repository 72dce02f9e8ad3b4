// wire_check/types/type.hpp - Canonical type representation
//
// Types as they come out of inference: every name resolved to a
// CanonicalVar, aliases kept alongside their parameter bindings.
// Nodes are immutable and owned by a TypeContext.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "wire_check/basic/casting.hpp"
#include "wire_check/types/canonical_var.hpp"

namespace wire_check
{

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of canonical type node. Closed: every switch over it is written
 * without a default so the compiler flags unhandled kinds.
 */
enum class TypeKind : uint8_t {
  Named,     ///< Reference to a constructor, used with no arguments
  Applied,   ///< Constructor applied to argument types
  Variable,  ///< Free type variable
  Function,  ///< a -> b (curried)
  Record,    ///< { x : T, ... } or { r | x : T, ... }
  Aliased,   ///< Alias use: name, argument bindings, alias body
};

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all canonical type nodes.
 *
 * Nodes are non-copyable and managed by TypeContext.
 */
class CanonicalType
{
public:
  CanonicalType(const CanonicalType &) = delete;
  CanonicalType & operator=(const CanonicalType &) = delete;
  CanonicalType(CanonicalType &&) = delete;
  CanonicalType & operator=(CanonicalType &&) = delete;

  [[nodiscard]] TypeKind get_kind() const noexcept { return kind_; }

protected:
  explicit CanonicalType(TypeKind k) : kind_(k) {}
  ~CanonicalType() = default;  // Non-virtual, protected: prevents polymorphic delete

private:
  const TypeKind kind_;
};

/**
 * CRTP base that implements classof() for a single kind.
 */
template <typename Derived, TypeKind K>
class TypeBase : public CanonicalType
{
public:
  static constexpr TypeKind kind = K;

  static bool classof(const CanonicalType * t) { return t->get_kind() == K; }

protected:
  TypeBase() : CanonicalType(K) {}
};

// ============================================================================
// Concrete Nodes
// ============================================================================

/**
 * A constructor used on its own: `Int`, `Json.Encode.Value`, `()`.
 */
class NamedType final : public TypeBase<NamedType, TypeKind::Named>
{
public:
  CanonicalVar var;

  explicit NamedType(CanonicalVar v) : var(v) {}
};

/**
 * `head arg1 arg2 ...`. The head is usually a NamedType but may be any type.
 */
class AppliedType final : public TypeBase<AppliedType, TypeKind::Applied>
{
public:
  const CanonicalType * head = nullptr;
  gsl::span<const CanonicalType * const> args;

  AppliedType(const CanonicalType * h, gsl::span<const CanonicalType * const> a)
  : head(h), args(a)
  {
  }
};

class VariableType final : public TypeBase<VariableType, TypeKind::Variable>
{
public:
  std::string_view name;

  explicit VariableType(std::string_view n) : name(n) {}
};

/**
 * `arg -> result`. Multi-argument functions are right-nested.
 */
class FunctionType final : public TypeBase<FunctionType, TypeKind::Function>
{
public:
  const CanonicalType * arg = nullptr;
  const CanonicalType * result = nullptr;

  FunctionType(const CanonicalType * a, const CanonicalType * r) : arg(a), result(r) {}
};

struct RecordField
{
  std::string_view name;
  const CanonicalType * type = nullptr;
};

/**
 * Record with fields in declaration order and an optional extension
 * variable (`{ r | x : Int }`).
 */
class RecordType final : public TypeBase<RecordType, TypeKind::Record>
{
public:
  gsl::span<const RecordField> fields;
  const VariableType * extension = nullptr;  ///< nullptr for closed records

  RecordType(gsl::span<const RecordField> f, const VariableType * ext)
  : fields(f), extension(ext)
  {
  }

  [[nodiscard]] bool is_extended() const noexcept { return extension != nullptr; }

  /// Field type by name, nullptr if absent.
  [[nodiscard]] const CanonicalType * find_field(std::string_view field_name) const noexcept
  {
    for (const auto & f : fields) {
      if (f.name == field_name) return f.type;
    }
    return nullptr;
  }
};

/// Binding of one alias parameter.
struct AliasArg
{
  std::string_view name;
  const CanonicalType * type = nullptr;
};

/**
 * Use of a type alias.
 *
 * `body` is the alias definition with its parameters left as free
 * variables; `args` binds each parameter for this use. The expansion is
 * obtained with dealias().
 */
class AliasedType final : public TypeBase<AliasedType, TypeKind::Aliased>
{
public:
  CanonicalVar alias;
  gsl::span<const AliasArg> args;
  const CanonicalType * body = nullptr;

  AliasedType(CanonicalVar name, gsl::span<const AliasArg> a, const CanonicalType * b)
  : alias(name), args(a), body(b)
  {
  }
};

}  // namespace wire_check
