// tests/types/test_alias_resolver.cpp - Unit tests for alias expansion
//

#include <gtest/gtest.h>

#include "wire_check/basic/casting.hpp"
#include "wire_check/types/alias_resolver.hpp"
#include "wire_check/types/type_context.hpp"
#include "wire_check/types/type_utils.hpp"

using namespace wire_check;

TEST(TypesAliasResolver, SubstitutesParameters)
{
  TypeContext types;
  const auto * a = types.var("a");
  const auto * pair =
    types.aliased(CanonicalVar::local("Pair"), {{"a", types.int_type()}}, types.tuple({a, a}));

  const auto * expanded = dealias(types, pair);
  EXPECT_EQ(to_string(expanded), "(Int, Int)");
  EXPECT_TRUE(structurally_equal(expanded, types.tuple({types.int_type(), types.int_type()})));
}

TEST(TypesAliasResolver, NoArgumentsReturnsBody)
{
  TypeContext types;
  const auto * body = types.record({{"x", types.float_type()}});
  const auto * point = types.aliased(CanonicalVar::local("Point"), {}, body);
  EXPECT_EQ(dealias(types, point), body);
}

TEST(TypesAliasResolver, UnchangedSubtreesAreShared)
{
  TypeContext types;
  const auto * fixed = types.list(types.string_type());
  const auto * body = types.tuple({fixed, types.var("a")});
  const auto * alias = types.aliased(CanonicalVar::local("Tagged"), {{"a", types.int_type()}}, body);

  const auto * expanded = cast<AppliedType>(dealias(types, alias));
  EXPECT_EQ(expanded->args[0], fixed);
}

TEST(TypesAliasResolver, NestedAliasKeepsBodyAndSubstitutesArguments)
{
  TypeContext types;
  // Inner b = List b
  // Outer a = Maybe (Inner a)
  const auto * inner_use =
    types.aliased(CanonicalVar::local("Inner"), {{"b", types.var("a")}}, types.list(types.var("b")));
  const auto * outer =
    types.aliased(CanonicalVar::local("Outer"), {{"a", types.int_type()}}, types.maybe(inner_use));

  const auto * once = dealias(types, outer);
  EXPECT_EQ(to_string(once), "Maybe (Inner Int)");

  const auto * full = deep_dealias(types, outer);
  EXPECT_EQ(to_string(full), "Maybe (List Int)");
}

TEST(TypesAliasResolver, DeepDealiasRemovesAliasesEverywhere)
{
  TypeContext types;
  const auto * id = types.aliased(CanonicalVar::local("Id"), {}, types.int_type());
  const auto * t = types.record({{"f", types.lambda(id, types.list(id))}});

  const auto * full = deep_dealias(types, t);
  EXPECT_EQ(to_string(full), "{ f : Int -> List Int }");
}

TEST(TypesAliasResolver, ExtensionBoundToRecordIsSpliced)
{
  TypeContext types;
  // Named r = { r | name : String }
  const auto * body = types.record({{"name", types.string_type()}}, "r");
  const auto * use = types.aliased(
    CanonicalVar::local("Named"), {{"r", types.record({{"age", types.int_type()}})}}, body);

  const auto * rec = dyn_cast<RecordType>(dealias(types, use));
  ASSERT_NE(rec, nullptr);
  EXPECT_FALSE(rec->is_extended());
  ASSERT_EQ(rec->fields.size(), 2U);
  EXPECT_EQ(rec->fields[0].name, "name");
  EXPECT_EQ(rec->fields[1].name, "age");
}

TEST(TypesAliasResolver, ExtensionBoundToVariableIsRenamed)
{
  TypeContext types;
  const auto * body = types.record({{"name", types.string_type()}}, "r");
  const auto * use = types.aliased(CanonicalVar::local("Named"), {{"r", types.var("s")}}, body);

  EXPECT_EQ(to_string(dealias(types, use)), "{ s | name : String }");
}
