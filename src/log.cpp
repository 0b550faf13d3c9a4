/**
 * @file log.cpp
 * @brief Protocol event sinks
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mk312link/log.hpp"

#include <cstdio>

namespace mk312
{
namespace link
{

const char* to_string(LogLevel level)
{
  switch (level)
  {
    case LogLevel::DEBUG:
      return "debug";
    case LogLevel::INFO:
      return "info";
    case LogLevel::WARNING:
      return "warning";
    case LogLevel::ERROR:
      return "error";
    default:
      return "off";
  }
}

const char* to_string(LogEvent event)
{
  switch (event)
  {
    case LogEvent::STATE_CHANGE:
      return "state";
    case LogEvent::FRAME_SENT:
      return "tx";
    case LogEvent::FRAME_RECEIVED:
      return "rx";
    case LogEvent::HANDSHAKE_DONE:
      return "handshake";
    case LogEvent::REQUEST_FAILED:
      return "failed";
    case LogEvent::RESET_DEGRADED:
      return "reset";
    default:
      return "event";
  }
}

LogSink make_stderr_sink()
{
  return [](const LogRecord& rec)
  {
    std::fprintf(stderr, "mk312link [%s] %s:", to_string(rec.level), to_string(rec.event));

    switch (rec.event)
    {
      case LogEvent::STATE_CHANGE:
        std::fprintf(stderr, " %s", to_string(rec.state));
        break;

      case LogEvent::FRAME_SENT:
      case LogEvent::FRAME_RECEIVED:
        for (size_t i = 0; i < rec.len; ++i)
        {
          std::fprintf(stderr, " %02X", rec.bytes[i]);
        }
        break;

      case LogEvent::HANDSHAKE_DONE:
        std::fprintf(stderr, " key 0x%02X", rec.value);
        break;

      case LogEvent::REQUEST_FAILED:
      case LogEvent::RESET_DEGRADED:
        std::fprintf(stderr, " address 0x%04X: %s", rec.address, strerror(rec.error));
        break;
    }

    std::fputc('\n', stderr);
  };
}

}  // namespace link
}  // namespace mk312
