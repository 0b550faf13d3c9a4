/**
 * @file session.hpp
 * @brief MK312-link session manager
 *
 * Owns the link state and the session key, drives the handshake and
 * exposes the register read/write API.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "mk312link/log.hpp"
#include "mk312link/protocol.hpp"
#include "mk312link/transport.hpp"

namespace mk312
{
namespace link
{

/**
 * @brief Session key derivation rule
 *
 * @param host_key  Key offered by the host in KEY_EXCHANGE
 * @param challenge Challenge byte returned by the device
 * @return Session key
 */
using KeyDeriveFn = uint8_t (*)(uint8_t host_key, uint8_t challenge);

/**
 * @brief Default MK-312 rule: KEY_SALT ^ host_key ^ challenge
 */
uint8_t derive_key(uint8_t host_key, uint8_t challenge);

/**
 * @brief Session configuration
 */
struct SessionConfig
{
  uint32_t timeout_ms = 2000;             ///< Response window per request
  uint8_t sync_attempts = 4;              ///< SYNC probes before giving up
  uint8_t host_key = 0x00;                ///< Key offered in KEY_EXCHANGE
  uint8_t bootstrap_key = NEUTRAL_KEY;    ///< Key used during the handshake
  KeyDeriveFn derive = derive_key;        ///< Session key derivation rule
  LogSink log;                            ///< Event sink (may be empty)
  LogLevel log_level = LogLevel::INFO;    ///< Records below are dropped
};

/**
 * @brief Host side of one device session
 *
 * Strictly request/response: every call blocks until the response is read
 * or the timeout elapses. Not thread-safe; callers sharing a session across
 * threads must serialise access themselves.
 *
 * Example usage:
 * @code
 * SerialTransport port;
 * port.open(SerialConfig{"/dev/ttyUSB0"});
 *
 * Session session(port);
 * {
 *   ScopedSession scoped(session);
 *   if (scoped.ok()) {
 *     uint8_t mode = 0;
 *     session.read_register(0x407B, mode);
 *   }
 * }  // key reset here
 * @endcode
 */
class Session
{
 public:
  /**
   * @brief Construct a disconnected session
   *
   * @param transport Byte channel to the device, must outlive the session
   * @param config    Session configuration
   */
  explicit Session(Transport& transport, SessionConfig config = SessionConfig());

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /**
   * @brief Establish the session key
   *
   * Valid only while DISCONNECTED. Sends SYNC until the device answers
   * (at most sync_attempts times), then offers the host key and derives the
   * session key from the device challenge.
   *
   * @param key_out Receives the session key on success (can be nullptr)
   * @return Error::OK and state ACTIVE on success; Error::HANDSHAKE_FAILED
   *         or Error::TRANSPORT_FATAL with state DISCONNECTED on failure;
   *         Error::INVALID_STATE if not DISCONNECTED
   */
  Error handshake(uint8_t* key_out = nullptr);

  /**
   * @brief Read one register byte
   */
  Error read_register(uint16_t address, uint8_t& value);

  /**
   * @brief Read count consecutive register bytes
   *
   * Valid only while ACTIVE. TIMEOUT, MALFORMED_FRAME, CHECKSUM_MISMATCH
   * and UNEXPECTED_RESPONSE leave the session ACTIVE; TRANSPORT_FATAL
   * forces DISCONNECTED.
   *
   * @param address First register address
   * @param out     Destination for count bytes
   * @param count   Number of bytes, 1 <= count <= MAX_DATA_SIZE
   */
  Error read_registers(uint16_t address, uint8_t* out, size_t count);

  /**
   * @brief Write one register byte
   */
  Error write_register(uint16_t address, uint8_t value);

  /**
   * @brief Write count consecutive register bytes
   *
   * Same state rules as read_registers().
   */
  Error write_registers(uint16_t address, const uint8_t* data, size_t count);

  /**
   * @brief Return the device to the unkeyed state
   *
   * Best effort: writes NEUTRAL_KEY to KEY_ADDRESS, then forces state
   * DISCONNECTED whether or not the device acknowledged. A failed
   * acknowledgment is reported as a RESET_DEGRADED warning, emitted
   * after the state is already DISCONNECTED. The state and key are forced
   * even if the log sink throws; a sink used through ScopedSession must not
   * throw. No-op while DISCONNECTED.
   */
  void reset_key();

  LinkState state() const
  {
    return state_;
  }

  uint8_t key() const
  {
    return key_;
  }

  bool active() const
  {
    return state_ == LinkState::ACTIVE;
  }

  const SessionConfig& config() const
  {
    return config_;
  }

 private:
  /**
   * @brief Perform one request/response exchange
   *
   * Obscures and frames the request payload with key, writes it, then reads
   * and reveals the response payload.
   */
  Error exchange(const std::vector<uint8_t>& request, uint8_t key,
                 std::vector<uint8_t>& response);

  /**
   * @brief Receive and decode one device frame
   */
  Error receive_frame(std::vector<uint8_t>& frame);

  /**
   * @brief Read exactly len bytes before the deadline
   */
  Error read_exact(uint8_t* buf, size_t len, uint32_t budget_ms);

  /**
   * @brief Register command round trip with opcode/address echo check
   */
  Error command(Opcode op, uint16_t address, const uint8_t* data, size_t len,
                Opcode reply_op, std::vector<uint8_t>& reply);

  Error sync();
  Error exchange_key(uint8_t& key);

  /**
   * @brief Record a failed request and apply its state consequences
   */
  Error fail(Error err, uint16_t address);

  void set_state(LinkState state);
  void emit(LogLevel level, LogEvent event, Error err = Error::OK, uint16_t address = 0,
            uint8_t value = 0, const uint8_t* bytes = nullptr, size_t len = 0) const;

  Transport& transport_;  ///< Byte channel to the device
  SessionConfig config_;  ///< Session configuration
  LinkState state_;       ///< State machine state
  uint8_t key_;           ///< Current session key
};

/**
 * @brief Scoped session acquisition
 *
 * Handshakes on construction and resets the key on destruction whenever
 * the session is still ACTIVE, so every exit path leaves the device
 * unkeyed.
 */
class ScopedSession
{
 public:
  explicit ScopedSession(Session& session);
  ~ScopedSession();

  ScopedSession(const ScopedSession&) = delete;
  ScopedSession& operator=(const ScopedSession&) = delete;

  /**
   * @brief Handshake result
   */
  Error error() const
  {
    return error_;
  }

  bool ok() const
  {
    return error_ == Error::OK;
  }

  Session& session()
  {
    return session_;
  }

 private:
  Session& session_;
  Error error_;
};

}  // namespace link
}  // namespace mk312
