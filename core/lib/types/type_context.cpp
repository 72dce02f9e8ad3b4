// wire_check/types/type_context.cpp - TypeContext factories
//
#include "wire_check/types/type_context.hpp"

#include <string>

namespace wire_check
{

const CanonicalType * TypeContext::lambda_chain(const std::vector<const CanonicalType *> & parts)
{
  if (parts.empty()) return nullptr;

  const CanonicalType * result = parts.back();
  for (size_t i = parts.size() - 1; i > 0; --i) {
    result = lambda(parts[i - 1], result);
  }
  return result;
}

const RecordType * TypeContext::record(
  const std::vector<RecordField> & fields, std::optional<std::string_view> extension)
{
  std::vector<RecordField> stored;
  stored.reserve(fields.size());
  for (const auto & f : fields) {
    stored.push_back(RecordField{intern(f.name), f.type});
  }

  const VariableType * ext = extension ? var(*extension) : nullptr;
  return create<RecordType>(copy_to_arena(stored), ext);
}

const AliasedType * TypeContext::aliased(
  const CanonicalVar & alias, const std::vector<AliasArg> & args, const CanonicalType * body)
{
  std::vector<AliasArg> stored;
  stored.reserve(args.size());
  for (const auto & a : args) {
    stored.push_back(AliasArg{intern(a.name), a.type});
  }
  return create<AliasedType>(intern_var(alias), copy_to_arena(stored), body);
}

CanonicalVar TypeContext::tuple_var(size_t arity)
{
  const std::string name = std::string(builtins::k_tuple_prefix) + std::to_string(arity);
  return CanonicalVar::builtin(intern(name));
}

}  // namespace wire_check
