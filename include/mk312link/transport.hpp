/**
 * @file transport.hpp
 * @brief Byte transport consumed by the session
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "mk312link/protocol.hpp"

namespace mk312
{
namespace link
{

/**
 * @brief Duplex byte channel with a bounded read timeout
 *
 * Implemented by SerialTransport for real hardware and by simulated
 * devices in tests. A Session is the only user of its Transport.
 */
class Transport
{
 public:
  virtual ~Transport() = default;

  /**
   * @brief Write all bytes
   *
   * @return Error::OK, or Error::TRANSPORT_FATAL if the channel failed or
   *         is closed
   */
  virtual Error write(const uint8_t* data, size_t len) = 0;

  /**
   * @brief Read up to max bytes, waiting at most timeout_ms for the first
   *
   * @param buf        Destination buffer
   * @param max        Maximum bytes to read
   * @param timeout_ms Time to wait for data
   * @param received   Number of bytes stored in buf
   * @return Error::OK with received >= 1, Error::TIMEOUT if nothing arrived,
   *         Error::TRANSPORT_FATAL if the channel failed or is closed
   */
  virtual Error read(uint8_t* buf, size_t max, uint32_t timeout_ms, size_t& received) = 0;

  /**
   * @brief Drop any bytes already received but not yet read
   */
  virtual void discard_input() = 0;

  /**
   * @brief Close the channel
   *
   * Any later write() or read() fails with Error::TRANSPORT_FATAL.
   */
  virtual void close() = 0;
};

}  // namespace link
}  // namespace mk312
