/**
 * @file test_frame.cpp
 * @brief Frame codec, checksum and key cipher tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstring>
#include <vector>

#include "checksum.hpp"
#include "cipher.hpp"
#include "frame.hpp"
#include "mk312link/protocol.hpp"

using namespace mk312::link;

/* ========================================================================= */
/* Checksum Tests                                                            */
/* ========================================================================= */

TEST_CASE("Checksum calculation")
{
  SUBCASE("Empty data")
  {
    const uint8_t data[] = {0x00};
    CHECK(internal::calc_checksum(data, 0) == 0x00);
  }

  SUBCASE("Sum without overflow")
  {
    const uint8_t data[] = {0x3C, 0x40, 0x7B};
    CHECK(internal::calc_checksum(data, 3) == 0xF7);
  }

  SUBCASE("Sum wraps modulo 256")
  {
    const uint8_t data[] = {0xA5, 0x02, 0x2F, 0x3A};
    CHECK(internal::calc_checksum(data, 4) == 0x10);
  }
}

/* ========================================================================= */
/* Frame Encoding Tests                                                      */
/* ========================================================================= */

TEST_CASE("Command payload")
{
  SUBCASE("Read command")
  {
    const uint8_t count = 1;
    std::vector<uint8_t> payload;
    REQUIRE(internal::build_command(Opcode::READ, 0x407B, &count, 1, payload) == Error::OK);

    REQUIRE(payload.size() == 4);
    CHECK(payload[0] == 0x3C);
    CHECK(payload[1] == 0x40);  // ADDR_H
    CHECK(payload[2] == 0x7B);  // ADDR_L
    CHECK(payload[3] == 0x01);
  }

  SUBCASE("Largest write")
  {
    std::vector<uint8_t> data(MAX_DATA_SIZE, 0x11);
    std::vector<uint8_t> payload;
    REQUIRE(internal::build_command(Opcode::WRITE, 0x4064, data.data(), data.size(), payload) ==
            Error::OK);
    CHECK(payload.size() == MAX_PAYLOAD_SIZE);
  }

  SUBCASE("Data too large")
  {
    std::vector<uint8_t> data(MAX_DATA_SIZE + 1, 0x11);
    std::vector<uint8_t> payload;
    CHECK(internal::build_command(Opcode::WRITE, 0x4064, data.data(), data.size(), payload) ==
          Error::FRAME_TOO_LARGE);
  }
}

TEST_CASE("Frame encoding")
{
  SUBCASE("Empty payload")
  {
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_frame(HOST_MARKER, nullptr, 0, frame) == Error::OK);

    REQUIRE(frame.size() == 3);  // MARKER + LEN + CHECKSUM
    CHECK(frame[0] == HOST_MARKER);
    CHECK(frame[1] == 0x00);
    CHECK(frame[2] == HOST_MARKER);
  }

  SUBCASE("Sync probe")
  {
    const uint8_t payload[] = {static_cast<uint8_t>(Opcode::SYNC)};
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_frame(HOST_MARKER, payload, 1, frame) == Error::OK);

    const std::vector<uint8_t> expected = {0xA5, 0x01, 0x00, 0xA6};
    CHECK(frame == expected);
  }

  SUBCASE("Key exchange")
  {
    const uint8_t payload[] = {0x2F, 0x3A};
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_frame(HOST_MARKER, payload, 2, frame) == Error::OK);

    const std::vector<uint8_t> expected = {0xA5, 0x02, 0x2F, 0x3A, 0x10};
    CHECK(frame == expected);
  }

  SUBCASE("Payload too large")
  {
    std::vector<uint8_t> large(MAX_PAYLOAD_SIZE + 1, 0xAA);
    std::vector<uint8_t> frame;
    CHECK(internal::encode_frame(HOST_MARKER, large.data(), large.size(), frame) ==
          Error::FRAME_TOO_LARGE);
  }
}

/* ========================================================================= */
/* Frame Decoding Tests                                                      */
/* ========================================================================= */

TEST_CASE("Frame decoding")
{
  SUBCASE("Valid device frame")
  {
    const uint8_t frame[] = {0x5A, 0x04, 0x18, 0x7A, 0x41, 0x4C, 0x7D};
    std::vector<uint8_t> payload;
    REQUIRE(internal::decode_frame(frame, sizeof(frame), DEVICE_MARKER, payload) == Error::OK);

    const std::vector<uint8_t> expected = {0x18, 0x7A, 0x41, 0x4C};
    CHECK(payload == expected);
  }

  SUBCASE("Round trip")
  {
    const uint8_t data[] = {0x01, 0x02};
    std::vector<uint8_t> payload;
    REQUIRE(internal::build_command(Opcode::WRITE, 0x00FD, data, 2, payload) == Error::OK);

    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_frame(HOST_MARKER, payload.data(), payload.size(), frame) ==
            Error::OK);

    std::vector<uint8_t> decoded;
    REQUIRE(internal::decode_frame(frame.data(), frame.size(), HOST_MARKER, decoded) ==
            Error::OK);
    CHECK(decoded == payload);
  }

  SUBCASE("Wrong marker")
  {
    std::vector<uint8_t> frame;
    internal::encode_frame(HOST_MARKER, nullptr, 0, frame);

    std::vector<uint8_t> payload;
    CHECK(internal::decode_frame(frame.data(), frame.size(), DEVICE_MARKER, payload) ==
          Error::MALFORMED_FRAME);
  }

  SUBCASE("Frame too short")
  {
    const uint8_t frame[] = {DEVICE_MARKER, 0x00};
    std::vector<uint8_t> payload;
    CHECK(internal::decode_frame(frame, 2, DEVICE_MARKER, payload) == Error::MALFORMED_FRAME);
  }

  SUBCASE("Declared length exceeds available bytes")
  {
    const uint8_t frame[] = {DEVICE_MARKER, 0x05, 0x22, 0x81};
    std::vector<uint8_t> payload;
    CHECK(internal::decode_frame(frame, sizeof(frame), DEVICE_MARKER, payload) ==
          Error::MALFORMED_FRAME);
  }

  SUBCASE("Bad checksum")
  {
    const uint8_t frame[] = {0x5A, 0x01, 0x07, 0x63};
    std::vector<uint8_t> payload;
    CHECK(internal::decode_frame(frame, sizeof(frame), DEVICE_MARKER, payload) ==
          Error::CHECKSUM_MISMATCH);
    CHECK(payload.empty());
  }
}

TEST_CASE("Single byte corruption is always detected")
{
  const uint8_t data[] = {0x12, 0x34, 0x56};
  std::vector<uint8_t> payload;
  REQUIRE(internal::build_command(Opcode::WRITE, 0x4064, data, 3, payload) == Error::OK);

  std::vector<uint8_t> frame;
  REQUIRE(internal::encode_frame(DEVICE_MARKER, payload.data(), payload.size(), frame) ==
          Error::OK);

  for (size_t pos = 0; pos < frame.size(); ++pos)
  {
    for (int flip = 1; flip < 256; flip <<= 1)
    {
      std::vector<uint8_t> corrupted(frame);
      corrupted[pos] ^= static_cast<uint8_t>(flip);

      std::vector<uint8_t> decoded;
      const Error err =
          internal::decode_frame(corrupted.data(), corrupted.size(), DEVICE_MARKER, decoded);

      CAPTURE(pos);
      CAPTURE(flip);
      CHECK((err == Error::CHECKSUM_MISMATCH || err == Error::MALFORMED_FRAME));
    }
  }
}

/* ========================================================================= */
/* Key Cipher Tests                                                          */
/* ========================================================================= */

TEST_CASE("Cipher")
{
  SUBCASE("Reveal inverts obscure for every byte and key")
  {
    bool all_ok = true;
    for (int key = 0; key < 256; ++key)
    {
      for (int b = 0; b < 256; ++b)
      {
        const uint8_t k = static_cast<uint8_t>(key);
        const uint8_t v = static_cast<uint8_t>(b);
        all_ok = all_ok && internal::reveal(internal::obscure(v, k), k) == v;
      }
    }
    CHECK(all_ok);
  }

  SUBCASE("Neutral key leaves bytes untouched")
  {
    CHECK(internal::obscure(0x3C, NEUTRAL_KEY) == 0x3C);
  }

  SUBCASE("Buffer transformation")
  {
    uint8_t data[] = {0x3C, 0x40, 0x7B, 0x01};
    internal::obscure_bytes(data, sizeof(data), 0x3A);

    const uint8_t expected[] = {0x06, 0x7A, 0x41, 0x3B};
    CHECK(std::memcmp(data, expected, sizeof(data)) == 0);

    internal::reveal_bytes(data, sizeof(data), 0x3A);
    CHECK(data[0] == 0x3C);
    CHECK(data[3] == 0x01);
  }
}

TEST_CASE("Error strings")
{
  CHECK(std::strcmp(strerror(Error::OK), "ok") == 0);
  CHECK(std::strcmp(strerror(Error::HANDSHAKE_FAILED), "handshake failed") == 0);
  CHECK(std::strcmp(to_string(LinkState::ACTIVE), "active") == 0);
}
