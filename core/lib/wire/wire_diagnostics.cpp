// wire_check/wire/wire_diagnostics.cpp - Diagnostic formatting for wire checks
//
#include "wire_check/wire/wire_diagnostics.hpp"

#include <fmt/core.h>

#include <utility>

#include "wire_check/types/type_utils.hpp"

namespace wire_check
{

std::string_view reason_message(WireErrorReason reason) noexcept
{
  switch (reason) {
    case WireErrorReason::UnsupportedType:
      return "It contains an unsupported type";
    case WireErrorReason::FreeTypeVariable:
      return "It contains a free type variable";
    case WireErrorReason::ContainsFunctions:
      return "It contains functions";
    case WireErrorReason::HigherOrderFunctions:
      return "It contains higher-order functions";
    case WireErrorReason::StreamContainsFunction:
      return "It is a stream that contains a function";
    case WireErrorReason::VaryingContainsFunction:
      return "It is a varying value that contains a function";
    case WireErrorReason::ExtendedRecord:
      return "It contains extended records with free type variables";
    case WireErrorReason::AliasDepthExceeded:
      return "It exceeds the alias expansion limit";
  }
  return "It contains an unsupported type";
}

std::string_view reason_code(WireErrorReason reason) noexcept
{
  switch (reason) {
    case WireErrorReason::UnsupportedType:
      return "E0301";
    case WireErrorReason::FreeTypeVariable:
      return "E0302";
    case WireErrorReason::ContainsFunctions:
      return "E0303";
    case WireErrorReason::HigherOrderFunctions:
      return "E0304";
    case WireErrorReason::StreamContainsFunction:
      return "E0305";
    case WireErrorReason::VaryingContainsFunction:
      return "E0306";
    case WireErrorReason::ExtendedRecord:
      return "E0307";
    case WireErrorReason::AliasDepthExceeded:
      return "E0308";
  }
  return "E0301";
}

std::vector<std::string> loopback_explanation(LoopbackShape shape)
{
  switch (shape) {
    case LoopbackShape::Mailbox:
      return {"A loopback like this must be a WritableStream."};
    case LoopbackShape::Promise:
      return {
        "A loopback that runs promises must be a stream of results.",
        "Something like the following:\n",
        "    Stream (Result Http.Error String)",
        "    Stream (Result x ())",
      };
  }
  return {};
}

std::string_view loopback_code(LoopbackShape shape) noexcept
{
  switch (shape) {
    case LoopbackShape::Mailbox:
      return "E0311";
    case LoopbackShape::Promise:
      return "E0312";
  }
  return "E0311";
}

namespace
{

/// Type on its own line, indented, followed by a blank line.
Doc type_block(const CanonicalType * type)
{
  return Doc::concat(Doc::nest(4, Doc::text(to_string(type))), Doc::text("\n"));
}

}  // namespace

Diagnostic make_wire_diagnostic(const WireTypeError & error)
{
  const bool is_input = error.direction == WireDirection::In;
  const std::string_view wire = to_string(error.direction);

  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::string(reason_code(error.reason));
  d.message = is_input ? "Input Error" : "Output Error";
  d.declaration = error.name;

  d.blocks.push_back(
    Doc::text(fmt::format("The {} named '{}' has an invalid type.\n", wire, error.name)));
  d.blocks.push_back(type_block(error.root_type));
  if (error.reason == WireErrorReason::AliasDepthExceeded) {
    d.blocks.push_back(Doc::text(
      fmt::format("{} ({}):\n", reason_message(error.reason), error.alias_limit)));
  } else {
    d.blocks.push_back(Doc::text(fmt::format("{}:\n", reason_message(error.reason))));
  }
  d.blocks.push_back(type_block(error.local_type));
  d.blocks.push_back(Doc::text(fmt::format("Acceptable values for {}s include:", wire)));
  d.blocks.push_back(
    Doc::text("  Ints, Floats, Bools, Strings, Maybes, Lists, Arrays, Tuples, unit values,"));
  d.blocks.push_back(Doc::text(fmt::format(
    "  Json.Values, {}and concrete records.",
    is_input ? "" : "first-order functions, promises, ")));
  return d;
}

Diagnostic make_loopback_diagnostic(const LoopbackShapeError & error)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::string(loopback_code(error.expected));
  d.message = "Loopback Error";
  d.declaration = error.name;

  d.blocks.push_back(
    Doc::text(fmt::format("The loopback named '{}' has an invalid type.\n", error.name)));
  d.blocks.push_back(type_block(error.type));
  if (error.alias_limit != 0) {
    d.code = std::string(k_loopback_alias_limit_code);
    d.blocks.push_back(
      Doc::text(fmt::format("It exceeds the alias expansion limit ({}).", error.alias_limit)));
    return d;
  }
  for (const auto & line : loopback_explanation(error.expected)) {
    d.blocks.push_back(Doc::text(line));
  }
  return d;
}

}  // namespace wire_check
