/**
 * @file serial_transport.hpp
 * @brief POSIX serial port transport
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#include "mk312link/protocol.hpp"
#include "mk312link/transport.hpp"

namespace mk312
{
namespace link
{

enum class Parity : uint8_t
{
  NONE,
  EVEN,
  ODD,
};

/**
 * @brief Serial line settings
 *
 * The device only speaks 19200 8N1; any other combination is rejected by
 * validate().
 */
struct SerialConfig
{
  std::string device = "/dev/ttyUSB0";
  uint32_t baud_rate = BAUD_RATE;
  uint8_t data_bits = 8;
  Parity parity = Parity::NONE;
  uint8_t stop_bits = 1;

  /**
   * @return Error::OK for 19200/8/N/1, Error::INVALID_CONFIG otherwise
   */
  Error validate() const;
};

/**
 * @brief Serial port transport
 *
 * close() may be called from another thread to abandon an exchange: a
 * read() blocked waiting for data wakes up and fails with
 * Error::TRANSPORT_FATAL. A write() in progress finishes first.
 */
class SerialTransport : public Transport
{
 public:
  SerialTransport() = default;
  ~SerialTransport() override;

  SerialTransport(const SerialTransport&) = delete;
  SerialTransport& operator=(const SerialTransport&) = delete;

  /**
   * @brief Open and configure the port (raw mode, no flow control)
   *
   * @return Error::OK, Error::INVALID_CONFIG, or Error::TRANSPORT_FATAL if
   *         the device cannot be opened or configured
   */
  Error open(const SerialConfig& config);

  bool is_open() const
  {
    return !closed_;
  }

  Error write(const uint8_t* data, size_t len) override;
  Error read(uint8_t* buf, size_t max, uint32_t timeout_ms, size_t& received) override;
  void discard_input() override;
  void close() override;

 private:
  std::mutex io_mutex_;            ///< Guards fd_ against a concurrent close()
  int fd_ = -1;                    ///< Port descriptor
  int wake_[2] = {-1, -1};         ///< Self-pipe interrupting a blocked read
  std::atomic<bool> closed_{true};
};

}  // namespace link
}  // namespace mk312
