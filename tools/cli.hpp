/**
 * @file cli.hpp
 * @brief mk312ctl option parsing and interrupt handling
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include "mk312link/protocol.hpp"
#include "mk312link/serial_transport.hpp"
#include "mk312link/session.hpp"

namespace mk312
{
namespace link
{
namespace cli
{

/**
 * @brief Settings collected from the command line
 */
struct Options
{
  SerialConfig serial;    ///< -d
  SessionConfig session;  ///< -t, -k, -K, -v
  int command = 0;        ///< argv index of the command word
};

/**
 * @brief Parse an unsigned number (decimal, 0x hex or 0 octal)
 *
 * @return false unless the whole text is a number in [min, max]
 */
bool parse_number(const char* text, unsigned long min, unsigned long max, unsigned long& out);

/**
 * @brief Parse the leading options
 *
 * -d device, -t timeout_ms (1..60000), -k host_key, -K bootstrap_key
 * (0..255), -v for debug logging.
 *
 * @return Error::OK with options.command set, or Error::INVALID_CONFIG on
 *         an unknown flag, a bad value or a missing command
 */
Error parse_options(int argc, char** argv, Options& options);

/**
 * @brief Turn SIGINT and SIGTERM into a flag instead of terminating
 *
 * The running exchange completes, the caller sees interrupted() and leaves
 * normally, so the device key is still reset.
 */
Error install_interrupt_handlers();

bool interrupted();

}  // namespace cli
}  // namespace link
}  // namespace mk312
