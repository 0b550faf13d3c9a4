/**
 * @file frame.hpp
 * @brief Frame encoding/decoding utilities (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "mk312link/protocol.hpp"

namespace mk312
{
namespace link
{
namespace internal
{

/**
 * @brief Build a register command payload
 *
 * Generates [OPCODE][ADDR_H][ADDR_L][DATA...]. The result is plain and
 * still has to be obscured and framed.
 *
 * @param op       Opcode
 * @param address  Register address
 * @param data     Data bytes (can be nullptr if len == 0)
 * @param len      Data length in bytes
 * @param out      Output buffer for the payload
 * @return Error::OK, or Error::FRAME_TOO_LARGE if the payload would exceed
 *         MAX_PAYLOAD_SIZE
 */
Error build_command(Opcode op, uint16_t address, const uint8_t* data, size_t len,
                    std::vector<uint8_t>& out);

/**
 * @brief Encode a frame around a payload
 *
 * Generates a complete frame: [MARKER][LEN][PAYLOAD...][CHECKSUM]
 *
 * @param marker   Start of frame marker
 * @param payload  Payload bytes (can be nullptr if len == 0)
 * @param len      Payload length in bytes
 * @param out      Output buffer for encoded frame
 * @return Error::OK, or Error::FRAME_TOO_LARGE if len exceeds
 *         MAX_PAYLOAD_SIZE
 */
Error encode_frame(uint8_t marker, const uint8_t* payload, size_t len,
                   std::vector<uint8_t>& out);

/**
 * @brief Validate a frame and extract its payload
 *
 * @param frame    Complete frame buffer
 * @param len      Total frame length (including MARKER, LEN and CHECKSUM)
 * @param marker   Expected start of frame marker
 * @param payload  Output buffer for the payload (untouched on failure)
 * @return Error::OK, Error::MALFORMED_FRAME when the marker or length is
 *         wrong, Error::CHECKSUM_MISMATCH when the trailing checksum is wrong
 */
Error decode_frame(const uint8_t* frame, size_t len, uint8_t marker,
                   std::vector<uint8_t>& payload);

}  // namespace internal
}  // namespace link
}  // namespace mk312
