/**
 * @file cipher.hpp
 * @brief Session key byte transformation (internal)
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
 * @brief Obscure one payload byte with the session key
 */
inline uint8_t obscure(uint8_t byte, uint8_t key)
{
  return static_cast<uint8_t>(byte ^ key);
}

/**
 * @brief Reveal one payload byte obscured with the session key
 *
 * reveal(obscure(b, k), k) == b for every b and k.
 */
inline uint8_t reveal(uint8_t byte, uint8_t key)
{
  return static_cast<uint8_t>(byte ^ key);
}

/**
 * @brief Obscure a payload buffer in place
 */
void obscure_bytes(uint8_t* data, size_t len, uint8_t key);

/**
 * @brief Reveal a payload buffer in place
 */
void reveal_bytes(uint8_t* data, size_t len, uint8_t key);

}  // namespace internal
}  // namespace link
}  // namespace mk312
