/**
 * @file frame.cpp
 * @brief Frame encoding/decoding implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "frame.hpp"

#include "checksum.hpp"

namespace mk312
{
namespace link
{
namespace internal
{

Error build_command(Opcode op, uint16_t address, const uint8_t* data, size_t len,
                    std::vector<uint8_t>& out)
{
  if (len > MAX_DATA_SIZE)
  {
    return Error::FRAME_TOO_LARGE;
  }

  out.clear();
  out.reserve(COMMAND_HEADER_SIZE + len);

  out.push_back(static_cast<uint8_t>(op));
  out.push_back(static_cast<uint8_t>((address >> 8) & 0xFF));  // ADDR_H
  out.push_back(static_cast<uint8_t>(address & 0xFF));         // ADDR_L

  if (len > 0 && data != nullptr)
  {
    out.insert(out.end(), data, data + len);
  }

  return Error::OK;
}

Error encode_frame(uint8_t marker, const uint8_t* payload, size_t len,
                   std::vector<uint8_t>& out)
{
  // Check payload size limit
  if (len > MAX_PAYLOAD_SIZE)
  {
    return Error::FRAME_TOO_LARGE;
  }

  out.clear();
  out.reserve(FRAME_OVERHEAD + len);

  // Frame header
  out.push_back(marker);
  out.push_back(static_cast<uint8_t>(len));

  // Payload
  if (len > 0 && payload != nullptr)
  {
    out.insert(out.end(), payload, payload + len);
  }

  // Checksum over [MARKER][LEN][PAYLOAD...]
  const uint8_t sum = calc_checksum(out.data(), out.size());
  out.push_back(sum);

  return Error::OK;
}

Error decode_frame(const uint8_t* frame, size_t len, uint8_t marker,
                   std::vector<uint8_t>& payload)
{
  // Minimum frame: MARKER + LEN + CHECKSUM = 3 bytes
  if (frame == nullptr || len < FRAME_OVERHEAD)
  {
    return Error::MALFORMED_FRAME;
  }

  if (frame[0] != marker)
  {
    return Error::MALFORMED_FRAME;
  }

  const size_t payload_len = frame[1];
  if (payload_len > MAX_PAYLOAD_SIZE || payload_len + FRAME_OVERHEAD != len)
  {
    return Error::MALFORMED_FRAME;
  }

  // Checksum covers everything except the checksum byte itself
  const uint8_t expected = frame[len - 1];
  const uint8_t calculated = calc_checksum(frame, len - 1);
  if (expected != calculated)
  {
    return Error::CHECKSUM_MISMATCH;
  }

  payload.assign(frame + 2, frame + 2 + payload_len);
  return Error::OK;
}

}  // namespace internal
}  // namespace link
}  // namespace mk312
