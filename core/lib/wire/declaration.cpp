// wire_check/wire/declaration.cpp
//
#include "wire_check/wire/declaration.hpp"

namespace wire_check
{

std::string_view to_string(WireDirection direction) noexcept
{
  switch (direction) {
    case WireDirection::In:
      return "input";
    case WireDirection::Out:
      return "output";
  }
  return "input";
}

const std::string & loopback_name(const LoopbackDecl & decl) noexcept
{
  if (const auto * mailbox = std::get_if<MailboxLoopback>(&decl)) {
    return mailbox->name;
  }
  return std::get<PromiseLoopback>(decl).name;
}

}  // namespace wire_check
