/**
 * @file cli.cpp
 * @brief mk312ctl option parsing and interrupt handling
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "cli.hpp"

#include <signal.h>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>

namespace mk312
{
namespace link
{
namespace cli
{

namespace
{

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int)
{
  g_interrupted = 1;
}

}  // namespace

bool parse_number(const char* text, unsigned long min, unsigned long max, unsigned long& out)
{
  if (text == nullptr || *text == '\0' || *text == '-')
  {
    return false;
  }

  char* end = nullptr;
  const unsigned long value = std::strtoul(text, &end, 0);
  if (*end != '\0' || value < min || value > max)
  {
    return false;
  }
  out = value;
  return true;
}

Error parse_options(int argc, char** argv, Options& options)
{
  options.session.log_level = LogLevel::WARNING;

  int i = 1;
  for (; i < argc && argv[i][0] == '-'; ++i)
  {
    const std::string opt = argv[i];
    const char* arg = i + 1 < argc ? argv[i + 1] : nullptr;
    unsigned long value = 0;

    if (opt == "-v")
    {
      options.session.log_level = LogLevel::DEBUG;
      continue;
    }

    if (opt == "-d" && arg != nullptr && *arg != '\0')
    {
      options.serial.device = arg;
    }
    else if (opt == "-t" && parse_number(arg, 1, 60000, value))
    {
      options.session.timeout_ms = static_cast<uint32_t>(value);
    }
    else if (opt == "-k" && parse_number(arg, 0, 0xFF, value))
    {
      options.session.host_key = static_cast<uint8_t>(value);
    }
    else if (opt == "-K" && parse_number(arg, 0, 0xFF, value))
    {
      options.session.bootstrap_key = static_cast<uint8_t>(value);
    }
    else
    {
      return Error::INVALID_CONFIG;
    }
    ++i;
  }

  if (i >= argc)
  {
    return Error::INVALID_CONFIG;
  }
  options.command = i;
  return Error::OK;
}

Error install_interrupt_handlers()
{
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = on_interrupt;
  sigemptyset(&action.sa_mask);

  if (::sigaction(SIGINT, &action, nullptr) != 0 || ::sigaction(SIGTERM, &action, nullptr) != 0)
  {
    return Error::INVALID_CONFIG;
  }
  return Error::OK;
}

bool interrupted()
{
  return g_interrupted != 0;
}

}  // namespace cli
}  // namespace link
}  // namespace mk312
