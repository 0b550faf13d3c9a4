/**
 * @file protocol.hpp
 * @brief MK312-link protocol definitions
 *
 * Register access protocol for MK-312 class stimulation controllers.
 * Serial link: 19200 baud, 8 data bits, no parity, 1 stop bit.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace mk312
{
namespace link
{

/* ========================================================================= */
/* Frame format constants                                                    */
/* ========================================================================= */

/**
 * @brief Start of frame marker for host -> device frames
 */
constexpr uint8_t HOST_MARKER = 0xA5;

/**
 * @brief Start of frame marker for device -> host frames
 */
constexpr uint8_t DEVICE_MARKER = 0x5A;

/**
 * @brief Maximum payload size in bytes
 *
 * The device buffers at most this many payload bytes per frame.
 */
constexpr size_t MAX_PAYLOAD_SIZE = 16;

/**
 * @brief Bytes of a register command payload before the data
 *
 * [OPCODE][ADDR_H][ADDR_L]
 */
constexpr size_t COMMAND_HEADER_SIZE = 3;

/**
 * @brief Maximum register data bytes in one read or write
 */
constexpr size_t MAX_DATA_SIZE = MAX_PAYLOAD_SIZE - COMMAND_HEADER_SIZE;

/**
 * @brief Frame overhead: MARKER + LEN + CHECKSUM
 */
constexpr size_t FRAME_OVERHEAD = 3;

/* ========================================================================= */
/* Frame structure                                                           */
/* ========================================================================= */

/**
 * Frame format:
 *
 * [MARKER][LEN][PAYLOAD...][CHECKSUM]
 *
 * - MARKER:   1 byte  (HOST_MARKER or DEVICE_MARKER)
 * - LEN:      1 byte  (payload length, 0 <= LEN <= MAX_PAYLOAD_SIZE)
 * - PAYLOAD:  LEN bytes, obscured with the session key
 * - CHECKSUM: 1 byte  (sum of MARKER, LEN and PAYLOAD as sent, mod 256)
 *
 * Register command payload (before ciphering):
 *
 * [OPCODE][ADDR_H][ADDR_L][DATA...]
 *
 * Minimum frame size: 3 bytes
 * Maximum frame size: 19 bytes (3 + 16)
 */

/* ========================================================================= */
/* Opcodes                                                                   */
/* ========================================================================= */

/**
 * @brief Opcodes carried in the first payload byte
 */
enum class Opcode : uint8_t
{
  /**
   * @brief Synchronisation probe
   *
   * Request: [SYNC]
   * Response: [SYNC_REPLY]
   */
  SYNC = 0x00,

  /**
   * @brief Acknowledgment of a register write
   *
   * Response: [WRITE_ACK][ADDR_H][ADDR_L]
   */
  WRITE_ACK = 0x06,

  /**
   * @brief Answer to SYNC
   */
  SYNC_REPLY = 0x07,

  /**
   * @brief Device challenge answering KEY_EXCHANGE
   *
   * Response: [KEY_REPLY][CHALLENGE]
   */
  KEY_REPLY = 0x21,

  /**
   * @brief Register data answering READ
   *
   * Response: [READ_REPLY][ADDR_H][ADDR_L][DATA x COUNT]
   */
  READ_REPLY = 0x22,

  /**
   * @brief Host key offer, opens the keyed session
   *
   * Request: [KEY_EXCHANGE][HOST_KEY]
   */
  KEY_EXCHANGE = 0x2F,

  /**
   * @brief Read COUNT bytes starting at ADDR
   *
   * Request: [READ][ADDR_H][ADDR_L][COUNT]
   */
  READ = 0x3C,

  /**
   * @brief Write DATA starting at ADDR
   *
   * Request: [WRITE][ADDR_H][ADDR_L][DATA...]
   */
  WRITE = 0x4D,
};

/* ========================================================================= */
/* Session constants                                                         */
/* ========================================================================= */

/**
 * @brief Salt of the default key derivation rule
 *
 * key = KEY_SALT ^ host_key ^ challenge
 */
constexpr uint8_t KEY_SALT = 0x55;

/**
 * @brief Neutral key (no obfuscation)
 */
constexpr uint8_t NEUTRAL_KEY = 0x00;

/**
 * @brief Register holding the device's session key
 *
 * Writing NEUTRAL_KEY here returns the device to the unkeyed state.
 */
constexpr uint16_t KEY_ADDRESS = 0x4213;

/**
 * @brief The only serial speed the device supports
 */
constexpr uint32_t BAUD_RATE = 19200;

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Result codes of every protocol operation
 *
 * Defined via errors.def for consistency with the C API.
 */
enum class Error : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "mk312link/errors.def"
#undef ERR
};

/**
 * @brief Get a static message string for an error code
 */
const char* strerror(Error err);

/* ========================================================================= */
/* Link state                                                                */
/* ========================================================================= */

/**
 * @brief Session state machine
 *
 * DISCONNECTED -> HANDSHAKING -> ACTIVE -> RESETTING -> DISCONNECTED
 */
enum class LinkState : uint8_t
{
  DISCONNECTED = 0,
  HANDSHAKING = 1,
  ACTIVE = 2,
  RESETTING = 3,
};

const char* to_string(LinkState state);

}  // namespace link
}  // namespace mk312
