// wire_check/types/builtins.cpp - Well-known identity predicates
//
#include "wire_check/types/builtins.hpp"

#include <cctype>
#include <limits>

namespace wire_check
{

std::string_view to_string(VarHome home) noexcept
{
  switch (home) {
    case VarHome::BuiltIn:
      return "builtin";
    case VarHome::Module:
      return "module";
    case VarHome::Local:
      return "local";
  }
  return "local";
}

bool is_primitive(const CanonicalVar & v) noexcept
{
  return v == builtins::k_int || v == builtins::k_float || v == builtins::k_bool ||
         v == builtins::k_string || v == builtins::k_char;
}

bool is_json(const CanonicalVar & v) noexcept { return v == builtins::k_json_value; }

bool is_tuple(const CanonicalVar & v) noexcept { return tuple_arity(v).has_value(); }

std::optional<size_t> tuple_arity(const CanonicalVar & v) noexcept
{
  if (v.home != VarHome::BuiltIn) return std::nullopt;

  const std::string_view prefix = builtins::k_tuple_prefix;
  if (v.name.size() <= prefix.size() || v.name.substr(0, prefix.size()) != prefix) {
    return std::nullopt;
  }

  size_t arity = 0;
  for (const char c : v.name.substr(prefix.size())) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) return std::nullopt;
    const auto digit = static_cast<size_t>(c - '0');
    if (arity > (std::numeric_limits<size_t>::max() - digit) / 10) return std::nullopt;
    arity = arity * 10 + digit;
  }
  return arity;
}

std::optional<CanonicalVar> lookup_well_known(std::string_view name) noexcept
{
  if (name == "Int") return builtins::k_int;
  if (name == "Float") return builtins::k_float;
  if (name == "Bool") return builtins::k_bool;
  if (name == "String") return builtins::k_string;
  if (name == "Char") return builtins::k_char;

  if (name == "List") return builtins::k_list;
  if (name == "Maybe") return builtins::k_maybe;
  if (name == "Array") return builtins::k_array;

  if (name == "Json.Value" || name == "Json.Encode.Value") return builtins::k_json_value;

  if (name == "Stream") return builtins::k_stream;
  if (name == "Varying") return builtins::k_varying;
  if (name == "Mailbox") return builtins::k_mailbox;
  if (name == "Result") return builtins::k_result;
  if (name == "Promise") return builtins::k_promise;

  return std::nullopt;
}

}  // namespace wire_check
