// wire_check/types/type_utils.cpp - Type printing and comparison
//
#include "wire_check/types/type_utils.hpp"

#include <optional>

#include "wire_check/basic/casting.hpp"
#include "wire_check/types/builtins.hpp"

namespace wire_check
{

namespace
{

enum class Context {
  None,      ///< Top level, record field, tuple component
  FuncArg,   ///< Left of an arrow
  AppArg,    ///< Argument of a type application
};

[[nodiscard]] bool is_tuple_application(const AppliedType * a) noexcept
{
  const auto * head = dyn_cast<NamedType>(a->head);
  return head != nullptr && is_tuple(head->var) && !a->args.empty();
}

void print(std::string & out, const CanonicalType * t, Context ctx);

void print_var(std::string & out, const CanonicalVar & v)
{
  if (const auto arity = tuple_arity(v)) {
    if (*arity == 0) {
      out += "()";
    } else {
      out += '(';
      out.append(*arity - 1, ',');
      out += ')';
    }
    return;
  }

  // Well-known constructors print unqualified, except the Json value.
  if (!is_json(v) && lookup_well_known(v.name) == std::optional<CanonicalVar>{v}) {
    out += v.name;
    return;
  }
  out += v.qualified_name();
}

void print(std::string & out, const CanonicalType * t, Context ctx)
{
  if (t == nullptr) {
    out += "<missing>";
    return;
  }

  switch (t->get_kind()) {
    case TypeKind::Named:
      print_var(out, cast<NamedType>(t)->var);
      return;

    case TypeKind::Variable:
      out += cast<VariableType>(t)->name;
      return;

    case TypeKind::Applied: {
      const auto * a = cast<AppliedType>(t);
      if (is_tuple_application(a)) {
        out += '(';
        for (size_t i = 0; i < a->args.size(); ++i) {
          if (i != 0) out += ", ";
          print(out, a->args[i], Context::None);
        }
        out += ')';
        return;
      }
      if (a->args.empty()) {
        print(out, a->head, ctx);
        return;
      }

      const bool parens = ctx == Context::AppArg;
      if (parens) out += '(';
      print(out, a->head, Context::FuncArg);
      for (const auto * arg : a->args) {
        out += ' ';
        print(out, arg, Context::AppArg);
      }
      if (parens) out += ')';
      return;
    }

    case TypeKind::Function: {
      const auto * fn = cast<FunctionType>(t);
      const bool parens = ctx != Context::None;
      if (parens) out += '(';
      print(out, fn->arg, Context::FuncArg);
      out += " -> ";
      print(out, fn->result, Context::None);
      if (parens) out += ')';
      return;
    }

    case TypeKind::Record: {
      const auto * rec = cast<RecordType>(t);
      if (rec->fields.empty() && !rec->is_extended()) {
        out += "{}";
        return;
      }
      out += "{ ";
      if (rec->is_extended()) {
        out += rec->extension->name;
        out += " | ";
      }
      bool first = true;
      for (const auto & f : rec->fields) {
        if (!first) out += ", ";
        first = false;
        out += f.name;
        out += " : ";
        print(out, f.type, Context::None);
      }
      out += " }";
      return;
    }

    case TypeKind::Aliased: {
      const auto * al = cast<AliasedType>(t);
      const bool parens = ctx == Context::AppArg && !al->args.empty();
      if (parens) out += '(';
      print_var(out, al->alias);
      for (const auto & binding : al->args) {
        out += ' ';
        print(out, binding.type, Context::AppArg);
      }
      if (parens) out += ')';
      return;
    }
  }
}

}  // namespace

std::string to_string(const CanonicalType * type)
{
  std::string out;
  print(out, type, Context::None);
  return out;
}

bool structurally_equal(const CanonicalType * lhs, const CanonicalType * rhs)
{
  if (lhs == rhs) return true;
  if (lhs == nullptr || rhs == nullptr) return false;
  if (lhs->get_kind() != rhs->get_kind()) return false;

  switch (lhs->get_kind()) {
    case TypeKind::Named:
      return cast<NamedType>(lhs)->var == cast<NamedType>(rhs)->var;

    case TypeKind::Variable:
      return cast<VariableType>(lhs)->name == cast<VariableType>(rhs)->name;

    case TypeKind::Applied: {
      const auto * a = cast<AppliedType>(lhs);
      const auto * b = cast<AppliedType>(rhs);
      if (a->args.size() != b->args.size()) return false;
      if (!structurally_equal(a->head, b->head)) return false;
      for (size_t i = 0; i < a->args.size(); ++i) {
        if (!structurally_equal(a->args[i], b->args[i])) return false;
      }
      return true;
    }

    case TypeKind::Function: {
      const auto * a = cast<FunctionType>(lhs);
      const auto * b = cast<FunctionType>(rhs);
      return structurally_equal(a->arg, b->arg) && structurally_equal(a->result, b->result);
    }

    case TypeKind::Record: {
      const auto * a = cast<RecordType>(lhs);
      const auto * b = cast<RecordType>(rhs);
      if (a->fields.size() != b->fields.size()) return false;
      if (a->is_extended() != b->is_extended()) return false;
      if (a->is_extended() && a->extension->name != b->extension->name) return false;
      for (size_t i = 0; i < a->fields.size(); ++i) {
        if (a->fields[i].name != b->fields[i].name) return false;
        if (!structurally_equal(a->fields[i].type, b->fields[i].type)) return false;
      }
      return true;
    }

    case TypeKind::Aliased: {
      const auto * a = cast<AliasedType>(lhs);
      const auto * b = cast<AliasedType>(rhs);
      if (a->alias != b->alias || a->args.size() != b->args.size()) return false;
      for (size_t i = 0; i < a->args.size(); ++i) {
        if (a->args[i].name != b->args[i].name) return false;
        if (!structurally_equal(a->args[i].type, b->args[i].type)) return false;
      }
      return true;
    }
  }
  return false;
}

std::vector<const CanonicalType *> collect_lambdas(const CanonicalType * type)
{
  std::vector<const CanonicalType *> parts;
  const CanonicalType * current = type;
  while (const auto * fn = dyn_cast<FunctionType>(current)) {
    parts.push_back(fn->arg);
    current = fn->result;
  }
  parts.push_back(current);
  return parts;
}

}  // namespace wire_check
