// tests/basic/test_doc.cpp - Unit tests for the pretty document
//

#include <gtest/gtest.h>

#include "wire_check/basic/doc.hpp"

using namespace wire_check;

TEST(BasicDoc, TextSplitsOnNewlines)
{
  const Doc d = Doc::text("a\nb");
  ASSERT_EQ(d.lines().size(), 2U);
  EXPECT_EQ(d.lines()[0].text, "a");
  EXPECT_EQ(d.lines()[1].text, "b");
}

TEST(BasicDoc, TrailingNewlineYieldsBlankLine)
{
  const Doc d = Doc::text("headline\n");
  ASSERT_EQ(d.lines().size(), 2U);
  EXPECT_EQ(d.lines()[1].text, "");
  EXPECT_EQ(d.render(), "headline\n");
}

TEST(BasicDoc, NestIndentsEveryLine)
{
  const Doc d = Doc::nest(4, Doc::text("x\ny"));
  EXPECT_EQ(d.render(), "    x\n    y");
}

TEST(BasicDoc, NestingAccumulates)
{
  const Doc d = Doc::nest(2, Doc::nest(4, Doc::text("x")));
  ASSERT_EQ(d.lines().size(), 1U);
  EXPECT_EQ(d.lines()[0].indent, 6U);
}

TEST(BasicDoc, BlankLinesCarryNoIndentation)
{
  const Doc d = Doc::nest(4, Doc::text("x\n\ny"));
  EXPECT_EQ(d.render(), "    x\n\n    y");
}

TEST(BasicDoc, VcatKeepsOrder)
{
  const Doc d = Doc::vcat({Doc::text("1"), Doc::nest(2, Doc::text("2")), Doc::text("3")});
  EXPECT_EQ(d.render(), "1\n  2\n3");
}

TEST(BasicDoc, ConcatJoinsLastAndFirstLine)
{
  const Doc d = Doc::concat(Doc::nest(4, Doc::text("Int")), Doc::text("\n"));
  ASSERT_EQ(d.lines().size(), 2U);
  EXPECT_EQ(d.lines()[0].text, "Int");
  EXPECT_EQ(d.lines()[0].indent, 4U);
  EXPECT_EQ(d.render(), "    Int\n");
}

TEST(BasicDoc, ConcatWithEmptySide)
{
  EXPECT_EQ(Doc::concat(Doc{}, Doc::text("x")).render(), "x");
  EXPECT_EQ(Doc::concat(Doc::text("x"), Doc{}).render(), "x");
  EXPECT_TRUE(Doc{}.empty());
}
