// wire_check/types/canonical_var.hpp - Resolved constructor identities
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace wire_check
{

/**
 * Where a resolved name lives.
 */
enum class VarHome : uint8_t {
  BuiltIn,  ///< Compiler-provided (Int, List, tuples, ...)
  Module,   ///< Defined in a module; `module` holds the dotted path
  Local,    ///< Defined in the module being compiled
};

/**
 * Fully resolved identity of a type constructor or alias.
 *
 * Two identities denote the same constructor iff home, module and name all
 * match. A user type named `Stream` in module `App` is therefore never
 * mistaken for the built-in `Stream.Stream`.
 *
 * The views are not owned: they point at string literals (well-known
 * identities) or at strings interned by a TypeContext.
 */
struct CanonicalVar
{
  VarHome home = VarHome::Local;
  std::string_view module;
  std::string_view name;

  [[nodiscard]] static constexpr CanonicalVar builtin(std::string_view name) noexcept
  {
    return CanonicalVar{VarHome::BuiltIn, {}, name};
  }

  [[nodiscard]] static constexpr CanonicalVar from_module(
    std::string_view module, std::string_view name) noexcept
  {
    return CanonicalVar{VarHome::Module, module, name};
  }

  [[nodiscard]] static constexpr CanonicalVar local(std::string_view name) noexcept
  {
    return CanonicalVar{VarHome::Local, {}, name};
  }

  [[nodiscard]] constexpr bool operator==(const CanonicalVar & other) const noexcept
  {
    return home == other.home && module == other.module && name == other.name;
  }
  [[nodiscard]] constexpr bool operator!=(const CanonicalVar & other) const noexcept
  {
    return !(*this == other);
  }

  /// Qualified spelling used in diagnostics: "Json.Encode.Value", "Int", "Point".
  [[nodiscard]] std::string qualified_name() const
  {
    if (home == VarHome::Module && !module.empty()) {
      std::string out(module);
      out += '.';
      out += name;
      return out;
    }
    return std::string(name);
  }
};

[[nodiscard]] std::string_view to_string(VarHome home) noexcept;

}  // namespace wire_check
