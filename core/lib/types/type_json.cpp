// wire_check/types/type_json.cpp - JSON encoding of canonical types
//
#include "wire_check/types/type_json.hpp"

#include <fmt/core.h>

#include <optional>
#include <string_view>
#include <vector>

#include "wire_check/basic/casting.hpp"
#include "wire_check/types/builtins.hpp"

namespace wire_check
{

namespace
{

using nlohmann::json;

// ============================================================================
// Decoding
// ============================================================================

class TypeDecoder
{
public:
  explicit TypeDecoder(TypeContext & types) : types_(types) {}

  /// nullptr on failure; error_ then holds the message.
  const CanonicalType * decode(const json & j, const std::string & path)
  {
    if (j.is_string()) {
      return decode_short_name(j.get<std::string>(), path);
    }
    if (!j.is_object()) {
      return fail(path, "expected a type name or a type object");
    }

    if (j.contains("named")) {
      const auto v = decode_var(j["named"], path + ".named");
      return v ? types_.named(*v) : nullptr;
    }
    if (j.contains("app")) return decode_app(j, path);
    if (j.contains("var")) {
      if (!j["var"].is_string()) return fail(path + ".var", "expected a string");
      return types_.var(j["var"].get<std::string>());
    }
    if (j.contains("lambda")) return decode_lambda(j["lambda"], path + ".lambda");
    if (j.contains("record")) return decode_record(j, path);
    if (j.contains("alias")) return decode_alias(j, path);
    if (j.contains("tuple")) {
      std::vector<const CanonicalType *> components;
      if (!decode_list(j["tuple"], path + ".tuple", components)) return nullptr;
      if (components.empty()) return types_.unit();
      return types_.tuple(components);
    }

    return fail(path, "unknown type form");
  }

  [[nodiscard]] const std::string & error() const noexcept { return error_; }

private:
  const CanonicalType * fail(const std::string & path, std::string_view msg)
  {
    error_ = fmt::format("{}: {}", path, msg);
    return nullptr;
  }

  const CanonicalType * decode_short_name(const std::string & name, const std::string & path)
  {
    if (name == "()") return types_.unit();
    const auto v = lookup_well_known(name);
    if (!v) {
      return fail(path, fmt::format("unknown type name '{}'", name));
    }
    return types_.named(*v);
  }

  std::optional<CanonicalVar> decode_var(const json & j, const std::string & path)
  {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
      fail(path, "expected an identity object with a 'name'");
      return std::nullopt;
    }

    std::string home = "local";
    if (j.contains("home")) {
      if (!j["home"].is_string()) {
        fail(path + ".home", "expected a string");
        return std::nullopt;
      }
      home = j["home"].get<std::string>();
    }

    CanonicalVar v;
    if (home == "builtin") {
      v.home = VarHome::BuiltIn;
    } else if (home == "module") {
      v.home = VarHome::Module;
    } else if (home == "local") {
      v.home = VarHome::Local;
    } else {
      fail(path + ".home", fmt::format("invalid home '{}' (builtin, module or local)", home));
      return std::nullopt;
    }

    const std::string name = j["name"].get<std::string>();
    std::string module;
    if (j.contains("module")) {
      if (!j["module"].is_string()) {
        fail(path + ".module", "expected a string");
        return std::nullopt;
      }
      module = j["module"].get<std::string>();
    }
    if (v.home == VarHome::Module && module.empty()) {
      fail(path, "module-home identity needs a 'module'");
      return std::nullopt;
    }

    v.name = types_.intern(name);
    v.module = module.empty() ? std::string_view{} : types_.intern(module);
    return v;
  }

  bool decode_list(const json & j, const std::string & path, std::vector<const CanonicalType *> & out)
  {
    if (!j.is_array()) {
      fail(path, "expected an array");
      return false;
    }
    for (size_t i = 0; i < j.size(); ++i) {
      const auto * t = decode(j[i], fmt::format("{}[{}]", path, i));
      if (t == nullptr) return false;
      out.push_back(t);
    }
    return true;
  }

  const CanonicalType * decode_app(const json & j, const std::string & path)
  {
    const auto * head = decode(j["app"], path + ".app");
    if (head == nullptr) return nullptr;

    std::vector<const CanonicalType *> args;
    if (j.contains("args") && !decode_list(j["args"], path + ".args", args)) return nullptr;
    return types_.app(head, args);
  }

  const CanonicalType * decode_lambda(const json & j, const std::string & path)
  {
    std::vector<const CanonicalType *> parts;
    if (!decode_list(j, path, parts)) return nullptr;
    if (parts.size() < 2) {
      return fail(path, "a function needs at least one argument and a result");
    }
    return types_.lambda_chain(parts);
  }

  const CanonicalType * decode_record(const json & j, const std::string & path)
  {
    const auto & fields_json = j["record"];
    if (!fields_json.is_array()) return fail(path + ".record", "expected an array of fields");

    std::vector<RecordField> fields;
    for (size_t i = 0; i < fields_json.size(); ++i) {
      const auto field_path = fmt::format("{}.record[{}]", path, i);
      const auto & f = fields_json[i];
      if (!f.is_object() || !f.contains("name") || !f["name"].is_string() || !f.contains("type")) {
        return fail(field_path, "expected {\"name\": ..., \"type\": ...}");
      }
      const auto * t = decode(f["type"], field_path + ".type");
      if (t == nullptr) return nullptr;
      fields.push_back(RecordField{types_.intern(f["name"].get<std::string>()), t});
    }

    std::optional<std::string_view> extension;
    if (j.contains("extension") && !j["extension"].is_null()) {
      if (!j["extension"].is_string()) return fail(path + ".extension", "expected a string");
      extension = types_.intern(j["extension"].get<std::string>());
    }
    return types_.record(fields, extension);
  }

  const CanonicalType * decode_alias(const json & j, const std::string & path)
  {
    const auto alias = decode_var(j["alias"], path + ".alias");
    if (!alias) return nullptr;

    std::vector<AliasArg> args;
    if (j.contains("args")) {
      const auto & args_json = j["args"];
      if (!args_json.is_array()) return fail(path + ".args", "expected an array");
      for (size_t i = 0; i < args_json.size(); ++i) {
        const auto arg_path = fmt::format("{}.args[{}]", path, i);
        const auto & a = args_json[i];
        if (!a.is_object() || !a.contains("name") || !a["name"].is_string() || !a.contains("type")) {
          return fail(arg_path, "expected {\"name\": ..., \"type\": ...}");
        }
        const auto * t = decode(a["type"], arg_path + ".type");
        if (t == nullptr) return nullptr;
        args.push_back(AliasArg{types_.intern(a["name"].get<std::string>()), t});
      }
    }

    if (!j.contains("body")) return fail(path, "alias needs a 'body'");
    const auto * body = decode(j["body"], path + ".body");
    if (body == nullptr) return nullptr;

    return types_.aliased(*alias, args, body);
  }

  TypeContext & types_;
  std::string error_;
};

// ============================================================================
// Encoding
// ============================================================================

json var_to_json(const CanonicalVar & v)
{
  json j{{"home", std::string(to_string(v.home))}, {"name", std::string(v.name)}};
  if (!v.module.empty()) {
    j["module"] = std::string(v.module);
  }
  return j;
}

/// Short spelling of a well-known identity, if it has one.
std::optional<std::string> short_name(const CanonicalVar & v)
{
  const std::string candidate = is_json(v) ? "Json.Value" : std::string(v.name);
  const auto known = lookup_well_known(candidate);
  if (known && *known == v) return candidate;
  return std::nullopt;
}

json encode(const CanonicalType * type)
{
  switch (type->get_kind()) {
    case TypeKind::Named: {
      const auto & v = cast<NamedType>(type)->var;
      if (tuple_arity(v) == std::optional<size_t>{0}) return json{{"tuple", json::array()}};
      if (auto s = short_name(v)) return *s;
      return json{{"named", var_to_json(v)}};
    }

    case TypeKind::Applied: {
      const auto * a = cast<AppliedType>(type);
      json args = json::array();
      for (const auto * arg : a->args) args.push_back(encode(arg));

      const auto * head = dyn_cast<NamedType>(a->head);
      if (head != nullptr && is_tuple(head->var)) return json{{"tuple", args}};
      return json{{"app", encode(a->head)}, {"args", args}};
    }

    case TypeKind::Variable:
      return json{{"var", std::string(cast<VariableType>(type)->name)}};

    case TypeKind::Function: {
      json parts = json::array();
      const CanonicalType * current = type;
      while (const auto * fn = dyn_cast<FunctionType>(current)) {
        parts.push_back(encode(fn->arg));
        current = fn->result;
      }
      parts.push_back(encode(current));
      return json{{"lambda", parts}};
    }

    case TypeKind::Record: {
      const auto * rec = cast<RecordType>(type);
      json fields = json::array();
      for (const auto & f : rec->fields) {
        fields.push_back(json{{"name", std::string(f.name)}, {"type", encode(f.type)}});
      }
      json j{{"record", fields}};
      if (rec->is_extended()) {
        j["extension"] = std::string(rec->extension->name);
      }
      return j;
    }

    case TypeKind::Aliased: {
      const auto * al = cast<AliasedType>(type);
      json args = json::array();
      for (const auto & a : al->args) {
        args.push_back(json{{"name", std::string(a.name)}, {"type", encode(a.type)}});
      }
      return json{{"alias", var_to_json(al->alias)}, {"args", args}, {"body", encode(al->body)}};
    }
  }
  return nullptr;
}

}  // namespace

TypeDecodeResult type_from_json(const nlohmann::json & j, TypeContext & types, const std::string & path)
{
  TypeDecoder decoder(types);
  const auto * t = decoder.decode(j, path);
  if (t == nullptr) {
    return TypeDecodeResult::fail(decoder.error());
  }
  return TypeDecodeResult::ok(t);
}

nlohmann::json type_to_json(const CanonicalType * type) { return encode(type); }

}  // namespace wire_check
