// wire_check/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "wire_check/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace wire_check
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  // use_color is final, even for a redirected stream.
  rang::setControlMode(use_color_ ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag, std::string_view origin)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> origin: declaration 'name' ===
  print_location(diag, origin);

  print_gutter_pipe();
  os_ << "\n";

  print_body(diag);

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, std::string_view origin)
{
  for (const auto & d : diags) {
    print(d, origin);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << to_string(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", to_string(diag.severity), diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", to_string(diag.severity), diag.message);
  }
}

void DiagnosticPrinter::print_location(const Diagnostic & diag, std::string_view origin)
{
  const std::string_view where = origin.empty() ? std::string_view("<unknown>") : origin;
  print_gutter_arrow();
  if (diag.declaration.empty()) {
    fmt::print(os_, " {}\n", where);
  } else {
    fmt::print(os_, " {}: declaration '{}'\n", where, diag.declaration);
  }
}

void DiagnosticPrinter::print_body(const Diagnostic & diag)
{
  // Blocks are already nested relative to the headline; the gutter replaces that indent.
  for (const auto & block : diag.blocks) {
    for (const auto & line : block.lines()) {
      print_gutter_pipe();
      if (line.text.empty()) {
        os_ << "\n";
        continue;
      }
      fmt::print(os_, " {}{}\n", std::string(line.indent, ' '), line.text);
    }
  }
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  print_gutter_pipe();
  os_ << "\n";

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

void DiagnosticPrinter::print_gutter_arrow()
{
  os_ << rang::style::bold << rang::fg::cyan << "  -->" << rang::fg::reset << rang::style::reset;
}

void DiagnosticPrinter::print_gutter_pipe()
{
  os_ << rang::style::bold << rang::fg::cyan << "      |" << rang::fg::reset << rang::style::reset;
}

}  // namespace wire_check
