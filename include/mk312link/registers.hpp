/**
 * @file registers.hpp
 * @brief Named device registers and typed access
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "mk312link/protocol.hpp"
#include "mk312link/session.hpp"

namespace mk312
{
namespace link
{

/**
 * @brief Register access mode
 */
enum class Access : uint8_t
{
  READ_ONLY,
  WRITE_ONLY,
  READ_WRITE,
};

/**
 * @brief Static description of one device register
 *
 * Multi-byte registers are big-endian: the byte at address is the most
 * significant.
 */
struct Register
{
  const char* name;  ///< Lookup name
  uint16_t address;  ///< First byte in device memory
  uint8_t width;     ///< 1 or 2 bytes
  Access access;     ///< Permitted operations

  bool readable() const
  {
    return access != Access::WRITE_ONLY;
  }

  bool writable() const
  {
    return access != Access::READ_ONLY;
  }
};

/* ========================================================================= */
/* Register map                                                              */
/* ========================================================================= */

namespace reg
{

inline constexpr Register BOX_MODEL = {"box_model", 0x00FC, 1, Access::READ_ONLY};
inline constexpr Register FIRMWARE_VERSION = {"firmware_version", 0x00FD, 2, Access::READ_ONLY};
inline constexpr Register R15 = {"r15", 0x400F, 1, Access::READ_WRITE};
inline constexpr Register LEVEL_A = {"level_a", 0x4064, 1, Access::READ_WRITE};
inline constexpr Register LEVEL_B = {"level_b", 0x4065, 1, Access::READ_WRITE};
inline constexpr Register COMMAND = {"command", 0x4070, 1, Access::WRITE_ONLY};
inline constexpr Register MODE = {"mode", 0x407B, 1, Access::READ_WRITE};
inline constexpr Register MA_MAX = {"ma_max", 0x4086, 1, Access::READ_ONLY};
inline constexpr Register MA_MIN = {"ma_min", 0x4087, 1, Access::READ_ONLY};
inline constexpr Register POWER_LEVEL = {"power_level", 0x41F4, 1, Access::READ_WRITE};
inline constexpr Register MA_LEVEL = {"ma_level", 0x420D, 1, Access::READ_WRITE};
inline constexpr Register KEY = {"key", KEY_ADDRESS, 1, Access::WRITE_ONLY};

/**
 * @brief R15 bit disabling the front panel potentiometers
 */
constexpr uint8_t R15_ADC_DISABLE = 0;

}  // namespace reg

/**
 * @brief All registers in address order
 */
const Register* const* all_registers(size_t& count);

/**
 * @brief Look up a register by name (case-insensitive)
 *
 * @return Register, or nullptr if no register has that name
 */
const Register* find_register(const char* name);

/* ========================================================================= */
/* Typed access                                                              */
/* ========================================================================= */

/**
 * @brief Register reads and writes with local access checks
 *
 * Access mode and value range are validated before any byte reaches the
 * transport.
 */
class RegisterAccess
{
 public:
  explicit RegisterAccess(Session& session) : session_(session) {}

  /**
   * @brief Read a register
   *
   * @return Error::INVALID_ACCESS_MODE for write-only registers,
   *         Error::VALUE_OUT_OF_RANGE if the width is not 1 or 2, otherwise
   *         the session's result
   */
  Error read(const Register& reg, uint16_t& value);

  /**
   * @brief Write a register
   *
   * @return Error::INVALID_ACCESS_MODE for read-only registers,
   *         Error::VALUE_OUT_OF_RANGE if the width is not 1 or 2 or value
   *         does not fit it,
   *         otherwise the session's result
   */
  Error write(const Register& reg, uint16_t value);

  Session& session()
  {
    return session_;
  }

 private:
  Session& session_;
};

}  // namespace link
}  // namespace mk312
