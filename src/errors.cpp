/**
 * @file errors.cpp
 * @brief Error and state message strings
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mk312link/protocol.hpp"

namespace mk312
{
namespace link
{

const char* strerror(Error err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case Error::name:         \
    return msg;
#include "mk312link/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

const char* to_string(LinkState state)
{
  switch (state)
  {
    case LinkState::DISCONNECTED:
      return "disconnected";
    case LinkState::HANDSHAKING:
      return "handshaking";
    case LinkState::ACTIVE:
      return "active";
    case LinkState::RESETTING:
      return "resetting";
    default:
      return "unknown";
  }
}

}  // namespace link
}  // namespace mk312
