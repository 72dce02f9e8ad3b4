// wire_check/types/alias_resolver.cpp - Type alias expansion
//
#include "wire_check/types/alias_resolver.hpp"

#include <limits>
#include <vector>

#include "wire_check/basic/casting.hpp"

namespace wire_check
{

namespace
{

const CanonicalType * lookup_binding(gsl::span<const AliasArg> args, std::string_view name)
{
  for (const auto & a : args) {
    if (a.name == name) return a.type;
  }
  return nullptr;
}

class Substituter
{
public:
  Substituter(TypeContext & types, gsl::span<const AliasArg> args) : types_(types), args_(args) {}

  const CanonicalType * apply(const CanonicalType * t)
  {
    switch (t->get_kind()) {
      case TypeKind::Named:
        return t;

      case TypeKind::Variable: {
        const CanonicalType * bound = lookup_binding(args_, cast<VariableType>(t)->name);
        return bound != nullptr ? bound : t;
      }

      case TypeKind::Applied: {
        const auto * a = cast<AppliedType>(t);
        bool changed = false;
        const CanonicalType * head = apply(a->head);
        changed |= head != a->head;

        std::vector<const CanonicalType *> args;
        args.reserve(a->args.size());
        for (const auto * arg : a->args) {
          args.push_back(apply(arg));
          changed |= args.back() != arg;
        }
        return changed ? types_.app(head, args) : t;
      }

      case TypeKind::Function: {
        const auto * fn = cast<FunctionType>(t);
        const CanonicalType * arg = apply(fn->arg);
        const CanonicalType * result = apply(fn->result);
        if (arg == fn->arg && result == fn->result) return t;
        return types_.lambda(arg, result);
      }

      case TypeKind::Record:
        return apply_record(cast<RecordType>(t));

      case TypeKind::Aliased: {
        const auto * al = cast<AliasedType>(t);
        bool changed = false;
        std::vector<AliasArg> args;
        args.reserve(al->args.size());
        for (const auto & binding : al->args) {
          args.push_back(AliasArg{binding.name, apply(binding.type)});
          changed |= args.back().type != binding.type;
        }
        return changed ? types_.aliased(al->alias, args, al->body) : t;
      }
    }
    return t;
  }

private:
  const CanonicalType * apply_record(const RecordType * rec)
  {
    bool changed = false;
    std::vector<RecordField> fields;
    fields.reserve(rec->fields.size());
    for (const auto & f : rec->fields) {
      fields.push_back(RecordField{f.name, apply(f.type)});
      changed |= fields.back().type != f.type;
    }

    if (!rec->is_extended()) {
      return changed ? types_.record(fields) : rec;
    }

    const CanonicalType * ext = lookup_binding(args_, rec->extension->name);
    if (ext == nullptr) {
      return changed ? types_.record(fields, rec->extension->name) : rec;
    }

    // { r | x : T } with r bound: rename the row variable or splice in the bound record.
    if (const auto * row = dyn_cast<VariableType>(ext)) {
      return types_.record(fields, row->name);
    }
    if (const auto * base = dyn_cast<RecordType>(ext)) {
      for (const auto & f : base->fields) {
        fields.push_back(f);
      }
      if (base->is_extended()) {
        return types_.record(fields, base->extension->name);
      }
      return types_.record(fields);
    }
    return changed ? types_.record(fields, rec->extension->name) : rec;
  }

  TypeContext & types_;
  gsl::span<const AliasArg> args_;
};

/// Full expansion; nullptr once `depth` would pass `max_depth_`.
class DeepExpander
{
public:
  DeepExpander(TypeContext & types, size_t max_depth) : types_(types), max_depth_(max_depth) {}

  const CanonicalType * expand(const CanonicalType * type, size_t depth)
  {
    switch (type->get_kind()) {
      case TypeKind::Named:
      case TypeKind::Variable:
        return type;

      case TypeKind::Aliased:
        if (depth >= max_depth_) return nullptr;
        return expand(dealias(types_, cast<AliasedType>(type)), depth + 1);

      case TypeKind::Applied: {
        const auto * a = cast<AppliedType>(type);
        const CanonicalType * head = expand(a->head, depth);
        if (head == nullptr) return nullptr;

        std::vector<const CanonicalType *> args;
        args.reserve(a->args.size());
        for (const auto * arg : a->args) {
          args.push_back(expand(arg, depth));
          if (args.back() == nullptr) return nullptr;
        }
        return types_.app(head, args);
      }

      case TypeKind::Function: {
        const auto * fn = cast<FunctionType>(type);
        const CanonicalType * arg = expand(fn->arg, depth);
        const CanonicalType * result = arg != nullptr ? expand(fn->result, depth) : nullptr;
        if (result == nullptr) return nullptr;
        return types_.lambda(arg, result);
      }

      case TypeKind::Record: {
        const auto * rec = cast<RecordType>(type);
        std::vector<RecordField> fields;
        fields.reserve(rec->fields.size());
        for (const auto & f : rec->fields) {
          fields.push_back(RecordField{f.name, expand(f.type, depth)});
          if (fields.back().type == nullptr) return nullptr;
        }
        if (rec->is_extended()) {
          return types_.record(fields, rec->extension->name);
        }
        return types_.record(fields);
      }
    }
    return type;
  }

private:
  TypeContext & types_;
  size_t max_depth_;
};

}  // namespace

const CanonicalType * dealias(
  TypeContext & types, gsl::span<const AliasArg> args, const CanonicalType * body)
{
  if (args.empty()) return body;
  Substituter sub(types, args);
  return sub.apply(body);
}

const CanonicalType * deep_dealias(TypeContext & types, const CanonicalType * type)
{
  return deep_dealias(types, type, std::numeric_limits<size_t>::max());
}

const CanonicalType * deep_dealias(
  TypeContext & types, const CanonicalType * type, size_t max_depth)
{
  DeepExpander expander(types, max_depth);
  return expander.expand(type, 0);
}

}  // namespace wire_check
