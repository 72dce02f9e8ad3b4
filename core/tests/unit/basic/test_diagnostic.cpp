// tests/basic/test_diagnostic.cpp - Unit tests for diagnostics and their output
//

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "wire_check/basic/diagnostic.hpp"
#include "wire_check/basic/diagnostic_json.hpp"
#include "wire_check/basic/diagnostic_printer.hpp"

using namespace wire_check;

namespace
{

Diagnostic make_sample()
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = "E0303";
  d.message = "Input Error";
  d.declaration = "clicks";
  d.blocks.push_back(Doc::text("The input named 'clicks' has an invalid type.\n"));
  d.blocks.push_back(Doc::nest(4, Doc::text("Int -> Int")));
  return d;
}

}  // namespace

// ============================================================================
// Diagnostic / DiagnosticBag
// ============================================================================

TEST(BasicDiagnostic, DocumentNestsBlocksUnderHeadline)
{
  const Diagnostic d = make_sample();
  EXPECT_EQ(
    d.render(),
    "Input Error:\n"
    "    The input named 'clicks' has an invalid type.\n"
    "\n"
    "        Int -> Int");
}

TEST(BasicDiagnostic, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error("Manifest Error");
    builder.with_code("E0001").with_declaration("m").with_help("fix it");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);
  const auto & d = bag.all()[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E0001");
  EXPECT_EQ(d.declaration, "m");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "fix it");
}

TEST(BasicDiagnostic, BagCountsBySeverity)
{
  DiagnosticBag bag;
  bag.report_error("a");
  bag.report_warning("b");

  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_EQ(bag.errors().size(), 1U);
  EXPECT_EQ(bag.warnings().size(), 1U);
  EXPECT_EQ(bag.size(), 2U);
}

TEST(BasicDiagnostic, MergeAppendsInOrder)
{
  DiagnosticBag first;
  first.report_error("one");
  DiagnosticBag second;
  second.report_error("two");

  first.merge(second);
  ASSERT_EQ(first.size(), 2U);
  EXPECT_EQ(first.all()[0].message, "one");
  EXPECT_EQ(first.all()[1].message, "two");
}

// ============================================================================
// Printer
// ============================================================================

TEST(BasicDiagnosticPrinter, PrintsHeaderLocationAndBody)
{
  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(make_sample(), "ports.json");

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E0303]: Input Error\n"), std::string::npos);
  EXPECT_NE(text.find("  --> ports.json: declaration 'clicks'\n"), std::string::npos);
  EXPECT_NE(
    text.find("      | The input named 'clicks' has an invalid type.\n      |\n"),
    std::string::npos);
  EXPECT_NE(text.find("      |     Int -> Int\n"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, PrintsHelpAndUnknownOrigin)
{
  Diagnostic d = make_sample();
  d.declaration.clear();
  d.help_message = "use a concrete record";

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(d, "");

  const std::string text = out.str();
  EXPECT_NE(text.find("  --> <unknown>\n"), std::string::npos);
  EXPECT_NE(text.find("   = help: use a concrete record\n"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, ColorFollowsTheFlag)
{
  std::ostringstream colored;
  DiagnosticPrinter(colored, true).print(make_sample(), "ports.json");
  const std::string with_color = colored.str();
  EXPECT_NE(with_color.find("\033["), std::string::npos);
  EXPECT_NE(with_color.find("  -->"), std::string::npos);

  std::ostringstream plain;
  DiagnosticPrinter(plain, false).print(make_sample(), "ports.json");
  EXPECT_EQ(plain.str().find("\033["), std::string::npos);
}

// ============================================================================
// JSON
// ============================================================================

TEST(BasicDiagnosticJson, SerializesFields)
{
  const auto j = to_json(make_sample());
  EXPECT_EQ(j["severity"], "error");
  EXPECT_EQ(j["code"], "E0303");
  EXPECT_EQ(j["message"], "Input Error");
  EXPECT_EQ(j["declaration"], "clicks");
  EXPECT_EQ(j["text"], make_sample().render());
  ASSERT_TRUE(j["lines"].is_array());
  EXPECT_EQ(j["lines"][0]["text"], "Input Error:");
  EXPECT_EQ(j["lines"][1]["indent"], 4);
  EXPECT_FALSE(j.contains("help"));
}

TEST(BasicDiagnosticJson, BagCountsErrors)
{
  DiagnosticBag bag;
  bag.add(make_sample());
  bag.report_warning("careful");

  const auto j = to_json(bag);
  EXPECT_EQ(j["items"].size(), 2U);
  EXPECT_EQ(j["errorCount"], 1);
}
