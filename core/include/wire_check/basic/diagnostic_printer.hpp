// wire_check/basic/diagnostic_printer.hpp
//
// Prints diagnostics with a Rust-style header and the diagnostic body
// laid out under a gutter.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "wire_check/basic/diagnostic.hpp"

namespace wire_check
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0303]: Input Error
 *     --> ports.json: declaration 'clicks'
 *      |
 *      | The input named 'clicks' has an invalid type.
 *      |
 *      |     Int -> Int
 *      ...
 *      = help: ...
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * @param origin File or module the declaration came from ("<unknown>" if empty)
   */
  void print(const Diagnostic & diag, std::string_view origin);

  /// Print all diagnostics in report order.
  void print_all(const DiagnosticBag & diags, std::string_view origin);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_location(const Diagnostic & diag, std::string_view origin);
  void print_body(const Diagnostic & diag);
  void print_help(std::string_view message);

  void print_gutter_arrow();
  void print_gutter_pipe();

  std::ostream & os_;
  bool use_color_;
};

}  // namespace wire_check
