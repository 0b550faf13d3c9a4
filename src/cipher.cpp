/**
 * @file cipher.cpp
 * @brief Session key byte transformation implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "cipher.hpp"

namespace mk312
{
namespace link
{
namespace internal
{

void obscure_bytes(uint8_t* data, size_t len, uint8_t key)
{
  for (size_t i = 0; i < len; ++i)
  {
    data[i] = obscure(data[i], key);
  }
}

void reveal_bytes(uint8_t* data, size_t len, uint8_t key)
{
  for (size_t i = 0; i < len; ++i)
  {
    data[i] = reveal(data[i], key);
  }
}

}  // namespace internal
}  // namespace link
}  // namespace mk312
