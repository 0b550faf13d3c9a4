/**
 * @file checksum.hpp
 * @brief Additive frame checksum (internal)
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
namespace internal
{

/**
 * @brief Calculate the frame checksum
 *
 * Sum of all bytes modulo 256.
 *
 * @param data Pointer to data buffer
 * @param len  Length of data in bytes
 * @return Checksum value
 */
uint8_t calc_checksum(const uint8_t* data, size_t len);

}  // namespace internal
}  // namespace link
}  // namespace mk312
