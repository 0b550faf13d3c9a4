/**
 * @file log.hpp
 * @brief Protocol event records and sinks
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "mk312link/protocol.hpp"

namespace mk312
{
namespace link
{

enum class LogLevel : uint8_t
{
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  OFF = 4,
};

/**
 * @brief Kind of protocol event
 */
enum class LogEvent : uint8_t
{
  STATE_CHANGE,    ///< Link state changed (state = new state)
  FRAME_SENT,      ///< Frame written to the transport (bytes = wire frame)
  FRAME_RECEIVED,  ///< Frame read from the transport (bytes = wire frame)
  HANDSHAKE_DONE,  ///< Session key established (value = key)
  REQUEST_FAILED,  ///< An operation failed (error, address)
  RESET_DEGRADED,  ///< Key reset was not acknowledged cleanly (error)
};

/**
 * @brief One structured protocol event
 *
 * bytes points into a buffer owned by the emitter and is only valid during
 * the sink call.
 */
struct LogRecord
{
  LogLevel level;
  LogEvent event;
  LinkState state;
  Error error;
  uint16_t address;
  uint8_t value;
  const uint8_t* bytes;
  size_t len;
};

/**
 * @brief Event sink injected through SessionConfig
 */
using LogSink = std::function<void(const LogRecord&)>;

const char* to_string(LogLevel level);
const char* to_string(LogEvent event);

/**
 * @brief Sink printing one line per record to stderr
 *
 * Frames are shown as hex dumps.
 */
LogSink make_stderr_sink();

}  // namespace link
}  // namespace mk312
