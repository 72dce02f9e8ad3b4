// wire_check/basic/diagnostic_json.cpp - JSON serialization of diagnostics
//
#include "wire_check/basic/diagnostic_json.hpp"

#include <string>

namespace wire_check
{

using nlohmann::json;

json to_json(const Diagnostic & diag)
{
  json item;
  item["severity"] = std::string(to_string(diag.severity));
  item["message"] = diag.message;
  if (!diag.code.empty()) {
    item["code"] = diag.code;
  }
  if (!diag.declaration.empty()) {
    item["declaration"] = diag.declaration;
  }

  const Doc doc = diag.document();
  item["text"] = doc.render();
  item["lines"] = json::array();
  for (const auto & line : doc.lines()) {
    item["lines"].push_back(json{{"indent", line.indent}, {"text", line.text}});
  }

  if (diag.help_message) {
    item["help"] = *diag.help_message;
  }
  return item;
}

json to_json(const DiagnosticBag & diags)
{
  json out;
  out["items"] = json::array();
  size_t error_count = 0;
  for (const auto & d : diags) {
    if (d.severity == Severity::Error) ++error_count;
    out["items"].push_back(to_json(d));
  }
  out["errorCount"] = error_count;
  return out;
}

}  // namespace wire_check
