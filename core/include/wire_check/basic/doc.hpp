// wire_check/basic/doc.hpp - Line-oriented pretty document
//
// A Doc is an ordered list of indented lines. Diagnostics are built from
// Docs so that nesting is expressed structurally and only flattened to text
// when printed.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wire_check
{

/**
 * Immutable-by-convention pretty document.
 *
 * @code
 *   Doc d = Doc::vcat({
 *     Doc::text("Input Error:"),
 *     Doc::nest(4, Doc::text("The input named 'p' has an invalid type.")),
 *   });
 *   d.render();
 *   // "Input Error:\n    The input named 'p' has an invalid type."
 * @endcode
 */
class Doc
{
public:
  struct Line
  {
    uint32_t indent = 0;
    std::string text;
  };

  Doc() = default;

  /// Text split on '\n'. A trailing '\n' yields a trailing blank line.
  [[nodiscard]] static Doc text(std::string_view s);

  /// Indent every line of `inner` by `indent` columns.
  [[nodiscard]] static Doc nest(uint32_t indent, Doc inner);

  /// Vertical composition: lines of each doc, in order.
  [[nodiscard]] static Doc vcat(std::vector<Doc> docs);

  /// Horizontal composition: the first line of `rhs` continues the last line of `lhs`.
  [[nodiscard]] static Doc concat(Doc lhs, const Doc & rhs);

  [[nodiscard]] bool empty() const noexcept { return lines_.empty(); }
  [[nodiscard]] const std::vector<Line> & lines() const noexcept { return lines_; }

  /// Flatten to text. Lines are joined with '\n', blank lines carry no indentation.
  [[nodiscard]] std::string render() const;

private:
  std::vector<Line> lines_;
};

}  // namespace wire_check
