// wire_check/types/type_context.hpp - Arena owning canonical types
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation of type
// nodes, their child arrays and interned strings.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include "wire_check/types/builtins.hpp"
#include "wire_check/types/type.hpp"

namespace wire_check
{

/**
 * Owns all canonical type nodes and interned strings.
 *
 * Nodes created through the context stay valid until it is destroyed.
 * Construction is not thread-safe; reading finished types is.
 *
 * @code
 *   TypeContext types;
 *   const auto * t = types.maybe(types.list(types.int_type()));
 *   const auto * fn = types.lambda_chain({types.int_type(), types.int_type(), types.bool_type()});
 * @endcode
 */
class TypeContext
{
public:
  /// Default initial buffer size (16KB)
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit TypeContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  ~TypeContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;
  TypeContext(TypeContext &&) = delete;
  TypeContext & operator=(TypeContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  template <typename T, typename... Args>
  const T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<CanonicalType, T>, "T must derive from CanonicalType");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Type nodes must be trivially destructible to be managed by the arena");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Intern a string and return a view that lives as long as the context.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);
    return stored_view;
  }

  /// Copy the module path and name of `v` into the context.
  [[nodiscard]] CanonicalVar intern_var(const CanonicalVar & v)
  {
    return CanonicalVar{v.home, v.module.empty() ? v.module : intern(v.module), intern(v.name)};
  }

  template <typename T>
  [[nodiscard]] gsl::span<const T> copy_to_arena(const std::vector<T> & vec)
  {
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * vec.size(), alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<const T>(ptr, vec.size());
  }

  // ===========================================================================
  // General Factories
  // ===========================================================================

  const NamedType * named(const CanonicalVar & v) { return create<NamedType>(intern_var(v)); }

  const AppliedType * app(const CanonicalType * head, const std::vector<const CanonicalType *> & args)
  {
    return create<AppliedType>(head, copy_to_arena(args));
  }

  const AppliedType * app(const CanonicalVar & ctor, const std::vector<const CanonicalType *> & args)
  {
    return app(named(ctor), args);
  }

  const VariableType * var(std::string_view name) { return create<VariableType>(intern(name)); }

  const FunctionType * lambda(const CanonicalType * arg, const CanonicalType * result)
  {
    return create<FunctionType>(arg, result);
  }

  /**
   * Curried function from argument types followed by the result type.
   *
   * lambda_chain({a, b, r}) is a -> (b -> r). A single element is returned as is.
   */
  const CanonicalType * lambda_chain(const std::vector<const CanonicalType *> & parts);

  const RecordType * record(
    const std::vector<RecordField> & fields, std::optional<std::string_view> extension = std::nullopt);

  const AliasedType * aliased(
    const CanonicalVar & alias, const std::vector<AliasArg> & args, const CanonicalType * body);

  // ===========================================================================
  // Well-known Types
  // ===========================================================================

  const NamedType * int_type() { return named(builtins::k_int); }
  const NamedType * float_type() { return named(builtins::k_float); }
  const NamedType * bool_type() { return named(builtins::k_bool); }
  const NamedType * string_type() { return named(builtins::k_string); }
  const NamedType * char_type() { return named(builtins::k_char); }
  const NamedType * json_value() { return named(builtins::k_json_value); }

  /// Identity of the tuple constructor with `arity` components.
  [[nodiscard]] CanonicalVar tuple_var(size_t arity);

  /// `()`
  const NamedType * unit() { return named(tuple_var(0)); }

  /// `(a, b, ...)`
  const AppliedType * tuple(const std::vector<const CanonicalType *> & components)
  {
    return app(tuple_var(components.size()), components);
  }

  const AppliedType * maybe(const CanonicalType * t) { return app(builtins::k_maybe, {t}); }
  const AppliedType * list(const CanonicalType * t) { return app(builtins::k_list, {t}); }
  const AppliedType * array(const CanonicalType * t) { return app(builtins::k_array, {t}); }
  const AppliedType * stream(const CanonicalType * t) { return app(builtins::k_stream, {t}); }
  const AppliedType * varying(const CanonicalType * t) { return app(builtins::k_varying, {t}); }
  const AppliedType * mailbox(const CanonicalType * t) { return app(builtins::k_mailbox, {t}); }

  const AppliedType * result(const CanonicalType * failure, const CanonicalType * success)
  {
    return app(builtins::k_result, {failure, success});
  }

  const AppliedType * promise(const CanonicalType * failure, const CanonicalType * success)
  {
    return app(builtins::k_promise, {failure, success});
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> stringPool_;
};

}  // namespace wire_check
