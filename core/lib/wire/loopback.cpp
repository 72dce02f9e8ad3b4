// wire_check/wire/loopback.cpp - Loopback declaration classifier
//
#include "wire_check/wire/loopback.hpp"

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

using CtorPredicate = bool (*)(const CanonicalVar &) noexcept;

/// `t` if it is `C a` for a constructor C accepted by `pred`, else nullptr.
[[nodiscard]] const AppliedType * unary_app_of(const CanonicalType * t, CtorPredicate pred)
{
  const auto * a = dyn_cast<AppliedType>(t);
  if (a == nullptr || a->args.size() != 1) return nullptr;
  const auto * head = dyn_cast<NamedType>(a->head);
  if (head == nullptr || !pred(head->var)) return nullptr;
  return a;
}

}  // namespace

LoopbackResult LoopbackClassifier::classify(
  std::string_view name, const std::optional<ImplementationExpr> & implementation,
  const CanonicalType * type)
{
  if (implementation) {
    return classify_promise(name, *implementation, type);
  }
  return classify_mailbox(name, type);
}

LoopbackResult LoopbackClassifier::classify_mailbox(std::string_view name, const CanonicalType * type)
{
  const auto mismatch = [&] { return fail(name, type, LoopbackShape::Mailbox, false); };

  const auto * expanded = deep_dealias(types_, type, max_alias_depth_);
  if (expanded == nullptr) {
    return fail(name, type, LoopbackShape::Mailbox, true);
  }

  const auto * rec = dyn_cast<RecordType>(expanded);
  if (rec == nullptr || rec->is_extended() || rec->fields.size() != 2) {
    return mismatch();
  }

  const auto * mailbox = unary_app_of(rec->find_field("mailbox"), is_mailbox);
  const auto * stream = unary_app_of(rec->find_field("stream"), is_stream);
  if (mailbox == nullptr || stream == nullptr) {
    return mismatch();
  }
  if (!structurally_equal(mailbox->args[0], stream->args[0])) {
    return mismatch();
  }

  return LoopbackResult::ok(MailboxLoopback{std::string(name), type});
}

LoopbackResult LoopbackClassifier::classify_promise(
  std::string_view name, const ImplementationExpr & implementation, const CanonicalType * type)
{
  const auto * expanded = deep_dealias(types_, type, max_alias_depth_);
  if (expanded == nullptr) {
    return fail(name, type, LoopbackShape::Promise, true);
  }

  const auto * stream = unary_app_of(expanded, is_stream);
  const auto * result = stream != nullptr ? dyn_cast<AppliedType>(stream->args[0]) : nullptr;
  const auto * result_head = result != nullptr ? dyn_cast<NamedType>(result->head) : nullptr;

  if (result_head == nullptr || !is_result(result_head->var) || result->args.size() != 2) {
    return fail(name, type, LoopbackShape::Promise, false);
  }

  const auto * promise = types_.promise(result->args[0], result->args[1]);
  const auto * promise_type = types_.app(stream->head, {promise});

  return LoopbackResult::ok(
    PromiseLoopback{std::string(name), promise_type, implementation, type});
}

LoopbackResult LoopbackClassifier::fail(
  std::string_view name, const CanonicalType * type, LoopbackShape expected,
  bool alias_limit_hit) const
{
  LoopbackShapeError error{std::string(name), type, expected};
  if (alias_limit_hit) {
    error.alias_limit = max_alias_depth_;
  }
  return LoopbackResult::fail(std::move(error));
}

LoopbackResult classify_loopback(
  TypeContext & types, std::string_view name,
  const std::optional<ImplementationExpr> & implementation, const CanonicalType * type)
{
  LoopbackClassifier classifier(types);
  return classifier.classify(name, implementation, type);
}

}  // namespace wire_check
