/**
 * @file registers.cpp
 * @brief Named device registers and typed access
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mk312link/registers.hpp"

#include <cctype>

namespace mk312
{
namespace link
{

namespace
{

const Register* const REGISTERS[] = {
    &reg::BOX_MODEL,
    &reg::FIRMWARE_VERSION,
    &reg::R15,
    &reg::LEVEL_A,
    &reg::LEVEL_B,
    &reg::COMMAND,
    &reg::MODE,
    &reg::MA_MAX,
    &reg::MA_MIN,
    &reg::POWER_LEVEL,
    &reg::MA_LEVEL,
    &reg::KEY,
};

bool equals_ignore_case(const char* a, const char* b)
{
  while (*a != '\0' && *b != '\0')
  {
    if (std::tolower(static_cast<unsigned char>(*a)) !=
        std::tolower(static_cast<unsigned char>(*b)))
    {
      return false;
    }
    ++a;
    ++b;
  }
  return *a == *b;
}

// Values are carried in a uint16_t
bool valid_width(const Register& reg)
{
  return reg.width == 1 || reg.width == 2;
}

}  // namespace

const Register* const* all_registers(size_t& count)
{
  count = sizeof(REGISTERS) / sizeof(REGISTERS[0]);
  return REGISTERS;
}

const Register* find_register(const char* name)
{
  if (name == nullptr)
  {
    return nullptr;
  }

  for (const Register* r : REGISTERS)
  {
    if (equals_ignore_case(r->name, name))
    {
      return r;
    }
  }
  return nullptr;
}

Error RegisterAccess::read(const Register& reg, uint16_t& value)
{
  if (!reg.readable())
  {
    return Error::INVALID_ACCESS_MODE;
  }
  if (!valid_width(reg))
  {
    return Error::VALUE_OUT_OF_RANGE;
  }

  uint8_t bytes[2] = {0, 0};
  const Error err = session_.read_registers(reg.address, bytes, reg.width);
  if (err != Error::OK)
  {
    return err;
  }

  // Big-endian
  value = reg.width == 2 ? static_cast<uint16_t>((bytes[0] << 8) | bytes[1]) : bytes[0];
  return Error::OK;
}

Error RegisterAccess::write(const Register& reg, uint16_t value)
{
  if (!reg.writable())
  {
    return Error::INVALID_ACCESS_MODE;
  }
  if (!valid_width(reg))
  {
    return Error::VALUE_OUT_OF_RANGE;
  }

  if (reg.width == 1)
  {
    if (value > 0xFF)
    {
      return Error::VALUE_OUT_OF_RANGE;
    }
    return session_.write_register(reg.address, static_cast<uint8_t>(value));
  }

  const uint8_t bytes[2] = {
      static_cast<uint8_t>((value >> 8) & 0xFF),
      static_cast<uint8_t>(value & 0xFF),
  };
  return session_.write_registers(reg.address, bytes, sizeof(bytes));
}

}  // namespace link
}  // namespace mk312
