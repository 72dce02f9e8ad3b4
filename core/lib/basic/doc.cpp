// wire_check/basic/doc.cpp - Pretty document implementation
//
#include "wire_check/basic/doc.hpp"

#include <utility>

namespace wire_check
{

Doc Doc::text(std::string_view s)
{
  Doc d;
  size_t start = 0;
  while (true) {
    const size_t nl = s.find('\n', start);
    if (nl == std::string_view::npos) {
      d.lines_.push_back(Line{0, std::string(s.substr(start))});
      break;
    }
    d.lines_.push_back(Line{0, std::string(s.substr(start, nl - start))});
    start = nl + 1;
  }
  return d;
}

Doc Doc::nest(uint32_t indent, Doc inner)
{
  for (auto & line : inner.lines_) {
    line.indent += indent;
  }
  return inner;
}

Doc Doc::vcat(std::vector<Doc> docs)
{
  Doc out;
  for (auto & d : docs) {
    for (auto & line : d.lines_) {
      out.lines_.push_back(std::move(line));
    }
  }
  return out;
}

Doc Doc::concat(Doc lhs, const Doc & rhs)
{
  if (lhs.lines_.empty()) return rhs;
  if (rhs.lines_.empty()) return lhs;

  const uint32_t base = lhs.lines_.back().indent;
  lhs.lines_.back().text += rhs.lines_.front().text;
  for (size_t i = 1; i < rhs.lines_.size(); ++i) {
    Line line = rhs.lines_[i];
    line.indent += base;
    lhs.lines_.push_back(std::move(line));
  }
  return lhs;
}

std::string Doc::render() const
{
  std::string out;
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (i != 0) out += '\n';
    const Line & line = lines_[i];
    if (line.text.empty()) continue;
    out.append(line.indent, ' ');
    out += line.text;
  }
  return out;
}

}  // namespace wire_check
