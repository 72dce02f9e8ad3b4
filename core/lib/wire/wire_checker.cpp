// wire_check/wire/wire_checker.cpp - Port type validation
//
#include "wire_check/wire/wire_checker.hpp"

#include <string>
#include <utility>

#include "wire_check/basic/casting.hpp"
#include "wire_check/types/alias_resolver.hpp"
#include "wire_check/types/builtins.hpp"
#include "wire_check/types/type_utils.hpp"

namespace wire_check
{

namespace
{

/// Signal wrapping `t` at the top, if `t` is `Stream a` or `Varying a`.
[[nodiscard]] std::optional<SignalKind> signal_of(const CanonicalType * t) noexcept
{
  const auto * a = dyn_cast<AppliedType>(t);
  if (a == nullptr || a->args.size() != 1) return std::nullopt;

  const auto * head = dyn_cast<NamedType>(a->head);
  if (head == nullptr) return std::nullopt;

  if (is_stream(head->var)) return SignalKind::Stream;
  if (is_varying(head->var)) return SignalKind::Varying;
  return std::nullopt;
}

[[nodiscard]] bool is_valid_wire_name(const CanonicalVar & v) noexcept
{
  return is_json(v) || is_primitive(v) || is_tuple(v);
}

}  // namespace

WireChecker::WireChecker(TypeContext & types, CheckerOptions options)
: types_(types), options_(options)
{
}

WireCheckResult WireChecker::check_input(std::string_view name, const CanonicalType * type)
{
  return check(WireDirection::In, name, type);
}

WireCheckResult WireChecker::check_output(std::string_view name, const CanonicalType * type)
{
  return check(WireDirection::Out, name, type);
}

WireCheckResult WireChecker::check(
  WireDirection direction, std::string_view name, const CanonicalType * type)
{
  const Root root{direction, name, type};

  // Strip top-level aliases to find a possible signal wrapper.
  const CanonicalType * current = type;
  size_t alias_depth = 0;
  while (const auto * alias = dyn_cast<AliasedType>(current)) {
    if (++alias_depth > options_.max_alias_depth) {
      return WireCheckResult::fail(make_error(root, current, WireErrorReason::AliasDepthExceeded));
    }
    current = dealias(types_, alias);
  }

  std::optional<WireTypeError> error;
  if (const auto signal = signal_of(current)) {
    const auto * wrapped = cast<AppliedType>(current)->args[0];
    error = validate(root, false, signal, wrapped, alias_depth);
  } else {
    error = validate(root, false, std::nullopt, current, alias_depth);
  }

  if (error) {
    return WireCheckResult::fail(std::move(*error));
  }
  return WireCheckResult::ok();
}

std::optional<WireTypeError> WireChecker::validate(
  const Root & root, bool seen_func, std::optional<SignalKind> seen_signal,
  const CanonicalType * type, size_t alias_depth)
{
  const auto valid = [&](const CanonicalType * local) {
    return validate(root, seen_func, seen_signal, local, alias_depth);
  };
  const auto err = [&](WireErrorReason reason) -> std::optional<WireTypeError> {
    return make_error(root, type, reason);
  };

  switch (type->get_kind()) {
    case TypeKind::Aliased: {
      if (alias_depth + 1 > options_.max_alias_depth) {
        return err(WireErrorReason::AliasDepthExceeded);
      }
      const CanonicalType * expanded = dealias(types_, cast<AliasedType>(type));
      return validate(root, seen_func, seen_signal, expanded, alias_depth + 1);
    }

    case TypeKind::Named:
      if (is_valid_wire_name(cast<NamedType>(type)->var)) return std::nullopt;
      return err(WireErrorReason::UnsupportedType);

    case TypeKind::Applied: {
      const auto * a = cast<AppliedType>(type);
      if (a->args.empty()) {
        return valid(a->head);
      }

      const auto * head = dyn_cast<NamedType>(a->head);
      if (head == nullptr) {
        return err(WireErrorReason::UnsupportedType);
      }
      if (a->args.size() == 1 &&
          (is_maybe(head->var) || is_array(head->var) || is_list(head->var))) {
        return valid(a->args[0]);
      }
      if (is_tuple(head->var)) {
        for (const auto * component : a->args) {
          if (auto e = valid(component)) return e;
        }
        return std::nullopt;
      }
      return err(WireErrorReason::UnsupportedType);
    }

    case TypeKind::Variable:
      return err(WireErrorReason::FreeTypeVariable);

    case TypeKind::Function:
      return validate_function(root, seen_func, seen_signal, cast<FunctionType>(type), alias_depth);

    case TypeKind::Record: {
      const auto * rec = cast<RecordType>(type);
      if (rec->is_extended()) {
        return err(WireErrorReason::ExtendedRecord);
      }
      for (const auto & field : rec->fields) {
        if (auto e = valid(field.type)) return e;
      }
      return std::nullopt;
    }
  }
  return err(WireErrorReason::UnsupportedType);
}

std::optional<WireTypeError> WireChecker::validate_function(
  const Root & root, bool seen_func, std::optional<SignalKind> seen_signal,
  const FunctionType * fn, size_t alias_depth)
{
  switch (root.direction) {
    case WireDirection::In:
      return make_error(root, fn, WireErrorReason::ContainsFunctions);

    case WireDirection::Out:
      if (seen_func) {
        return make_error(root, fn, WireErrorReason::HigherOrderFunctions);
      }
      if (seen_signal) {
        switch (*seen_signal) {
          case SignalKind::Stream:
            return make_error(root, fn, WireErrorReason::StreamContainsFunction);
          case SignalKind::Varying:
            return make_error(root, fn, WireErrorReason::VaryingContainsFunction);
        }
      }
      for (const auto * part : collect_lambdas(fn)) {
        if (auto e = validate(root, true, seen_signal, part, alias_depth)) return e;
      }
      return std::nullopt;
  }
  return make_error(root, fn, WireErrorReason::ContainsFunctions);
}

WireTypeError WireChecker::make_error(
  const Root & root, const CanonicalType * local, WireErrorReason reason) const
{
  WireTypeError e;
  e.name = std::string(root.name);
  e.direction = root.direction;
  e.root_type = root.type;
  e.local_type = local;
  e.reason = reason;
  if (reason == WireErrorReason::AliasDepthExceeded) {
    e.alias_limit = options_.max_alias_depth;
  }
  return e;
}

WireCheckResult check_input(TypeContext & types, std::string_view name, const CanonicalType * type)
{
  WireChecker checker(types);
  return checker.check_input(name, type);
}

WireCheckResult check_output(
  TypeContext & types, std::string_view name, const CanonicalType * type)
{
  WireChecker checker(types);
  return checker.check_output(name, type);
}

}  // namespace wire_check
