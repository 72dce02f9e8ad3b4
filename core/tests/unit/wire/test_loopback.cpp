// tests/wire/test_loopback.cpp - Unit tests for loopback classification
//

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>

#include "wire_check/types/type_context.hpp"
#include "wire_check/types/type_utils.hpp"
#include "wire_check/wire/loopback.hpp"

using namespace wire_check;

namespace
{

const RecordType * mailbox_record(TypeContext & types, const CanonicalType * a, const CanonicalType * b)
{
  return types.record({{"mailbox", types.mailbox(a)}, {"stream", types.stream(b)}});
}

const CanonicalType * http_error(TypeContext & types)
{
  return types.named(CanonicalVar::from_module("Http", "Error"));
}

}  // namespace

// ============================================================================
// Mailbox loopbacks
// ============================================================================

TEST(WireLoopback, MailboxShapeIsRecognized)
{
  TypeContext types;
  const auto * t = mailbox_record(types, types.int_type(), types.int_type());

  const auto r = classify_loopback(types, "m", std::nullopt, t);
  ASSERT_TRUE(r.success);
  ASSERT_TRUE(r.declaration.has_value());

  const auto * mailbox = std::get_if<MailboxLoopback>(&*r.declaration);
  ASSERT_NE(mailbox, nullptr);
  EXPECT_EQ(mailbox->name, "m");
  EXPECT_EQ(mailbox->type, t);
  EXPECT_EQ(loopback_name(*r.declaration), "m");
}

TEST(WireLoopback, MailboxFieldOrderDoesNotMatter)
{
  TypeContext types;
  const auto * t = types.record(
    {{"stream", types.stream(types.string_type())}, {"mailbox", types.mailbox(types.string_type())}});
  EXPECT_TRUE(classify_loopback(types, "m", std::nullopt, t).success);
}

TEST(WireLoopback, MailboxInnerTypesMustMatch)
{
  TypeContext types;
  const auto * t = mailbox_record(types, types.int_type(), types.string_type());

  const auto r = classify_loopback(types, "m", std::nullopt, t);
  ASSERT_FALSE(r.success);
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->expected, LoopbackShape::Mailbox);
  EXPECT_EQ(r.error->type, t);
  ASSERT_TRUE(r.diagnostic.has_value());
  EXPECT_NE(r.diagnostic->render().find("must be a WritableStream"), std::string::npos);
}

TEST(WireLoopback, MailboxInnerTypesCompareAfterAliasExpansion)
{
  TypeContext types;
  const auto * id = types.aliased(CanonicalVar::local("Id"), {}, types.int_type());
  const auto * t = mailbox_record(types, id, types.int_type());
  EXPECT_TRUE(classify_loopback(types, "m", std::nullopt, t).success);

  const auto * wrapped = types.aliased(CanonicalVar::local("Loop"), {}, t);
  const auto r = classify_loopback(types, "m", std::nullopt, wrapped);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(std::get<MailboxLoopback>(*r.declaration).type, wrapped);
}

TEST(WireLoopback, MailboxRejectsExtraMissingOrOpenFields)
{
  TypeContext types;
  const auto * i = types.int_type();

  const auto * extra = types.record(
    {{"mailbox", types.mailbox(i)}, {"stream", types.stream(i)}, {"extra", i}});
  EXPECT_FALSE(classify_loopback(types, "m", std::nullopt, extra).success);

  const auto * missing = types.record({{"mailbox", types.mailbox(i)}, {"other", types.stream(i)}});
  EXPECT_FALSE(classify_loopback(types, "m", std::nullopt, missing).success);

  const auto * open = types.record({{"mailbox", types.mailbox(i)}, {"stream", types.stream(i)}}, "r");
  EXPECT_FALSE(classify_loopback(types, "m", std::nullopt, open).success);
}

TEST(WireLoopback, MailboxFieldsMustUseWellKnownConstructors)
{
  TypeContext types;
  const auto * i = types.int_type();
  const auto * t = types.record(
    {{"mailbox", types.list(i)}, {"stream", types.stream(i)}});
  EXPECT_FALSE(classify_loopback(types, "m", std::nullopt, t).success);

  const auto * swapped = types.record(
    {{"mailbox", types.stream(i)}, {"stream", types.mailbox(i)}});
  EXPECT_FALSE(classify_loopback(types, "m", std::nullopt, swapped).success);
}

// ============================================================================
// Promise loopbacks
// ============================================================================

TEST(WireLoopback, PromiseShapeIsRewritten)
{
  TypeContext types;
  const auto * t = types.stream(types.result(http_error(types), types.string_type()));
  const ImplementationExpr expr{"Http.get decoder url"};

  const auto r = classify_loopback(types, "r", expr, t);
  ASSERT_TRUE(r.success);

  const auto * promise = std::get_if<PromiseLoopback>(&*r.declaration);
  ASSERT_NE(promise, nullptr);
  EXPECT_EQ(promise->name, "r");
  EXPECT_EQ(promise->original_type, t);
  EXPECT_EQ(promise->implementation.source, "Http.get decoder url");
  EXPECT_EQ(to_string(promise->promise_type), "Stream (Promise Http.Error String)");
  EXPECT_TRUE(structurally_equal(
    promise->promise_type, types.stream(types.promise(http_error(types), types.string_type()))));
}

TEST(WireLoopback, PromiseAcceptsAliasedResult)
{
  TypeContext types;
  const auto * response = types.aliased(
    CanonicalVar::local("Response"), {{"a", types.unit()}},
    types.result(types.var("x"), types.var("a")));
  const auto * t = types.stream(response);

  const auto r = classify_loopback(types, "r", ImplementationExpr{"send"}, t);
  ASSERT_TRUE(r.success);
  const auto & promise = std::get<PromiseLoopback>(*r.declaration);
  EXPECT_EQ(to_string(promise.promise_type), "Stream (Promise x ())");
  EXPECT_EQ(promise.original_type, t);
}

TEST(WireLoopback, PromiseRejectsOtherShapes)
{
  TypeContext types;
  const ImplementationExpr expr{"run"};

  const auto r = classify_loopback(types, "r", expr, types.int_type());
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->expected, LoopbackShape::Promise);
  const std::string text = r.diagnostic->render();
  EXPECT_NE(text.find("Stream (Result Http.Error String)"), std::string::npos);
  EXPECT_NE(text.find("Stream (Result x ())"), std::string::npos);

  EXPECT_FALSE(classify_loopback(types, "r", expr, types.stream(types.int_type())).success);
  EXPECT_FALSE(
    classify_loopback(types, "r", expr, types.varying(types.result(types.int_type(), types.int_type())))
      .success);
}

TEST(WireLoopback, ImplementationSelectsTheShape)
{
  TypeContext types;
  const auto * t = mailbox_record(types, types.int_type(), types.int_type());

  const auto r = classify_loopback(types, "m", ImplementationExpr{"run"}, t);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->expected, LoopbackShape::Promise);
}

TEST(WireLoopback, AliasLimitAppliesToBothShapes)
{
  TypeContext types;
  const CanonicalType * mailbox = mailbox_record(types, types.int_type(), types.int_type());
  const CanonicalType * results = types.stream(types.result(http_error(types), types.int_type()));
  for (int i = 0; i < 3; ++i) {
    mailbox = types.aliased(CanonicalVar::local("Box"), {}, mailbox);
    results = types.aliased(CanonicalVar::local("Results"), {}, results);
  }

  LoopbackClassifier roomy(types, 3);
  EXPECT_TRUE(roomy.classify("m", std::nullopt, mailbox).success);
  EXPECT_TRUE(roomy.classify("r", ImplementationExpr{"run"}, results).success);

  LoopbackClassifier tight(types, 2);
  const auto m = tight.classify("m", std::nullopt, mailbox);
  ASSERT_FALSE(m.success);
  EXPECT_EQ(m.error->expected, LoopbackShape::Mailbox);
  EXPECT_EQ(m.error->alias_limit, 2U);

  const auto r = tight.classify("r", ImplementationExpr{"run"}, results);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->expected, LoopbackShape::Promise);
  EXPECT_EQ(r.error->alias_limit, 2U);
}

TEST(WireLoopback, AliasNestedInsideAFieldCountsTowardTheLimit)
{
  TypeContext types;
  const CanonicalType * payload = types.int_type();
  for (int i = 0; i < 4; ++i) {
    payload = types.aliased(CanonicalVar::local("Payload"), {}, payload);
  }
  const auto * t = mailbox_record(types, payload, types.int_type());

  EXPECT_TRUE(classify_loopback(types, "m", std::nullopt, t).success);
  EXPECT_FALSE(LoopbackClassifier(types, 3).classify("m", std::nullopt, t).success);
}

TEST(WireLoopback, SourceOverload)
{
  TypeContext types;
  LoopbackClassifier classifier(types);
  const LoopbackSource source{"m", std::nullopt, mailbox_record(types, types.int_type(), types.int_type())};
  EXPECT_TRUE(classifier.classify(source).success);
}
