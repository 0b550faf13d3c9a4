/**
 * @file controller.hpp
 * @brief High-level device operations
 *
 * Mode switching, power level, front panel ADC and output levels, built on
 * RegisterAccess. Every setter verifies by reading the value back.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>

#include "mk312link/protocol.hpp"
#include "mk312link/registers.hpp"
#include "mk312link/session.hpp"

namespace mk312
{
namespace link
{

/* ========================================================================= */
/* Modes                                                                     */
/* ========================================================================= */

constexpr uint8_t MODE_POWERON = 0x00;
constexpr uint8_t MODE_UNKNOWN = 0x01;
constexpr uint8_t MODE_WAVES = 0x76;
constexpr uint8_t MODE_STROKE = 0x77;
constexpr uint8_t MODE_CLIMB = 0x78;
constexpr uint8_t MODE_COMBO = 0x79;
constexpr uint8_t MODE_INTENSE = 0x7A;
constexpr uint8_t MODE_RHYTHM = 0x7B;
constexpr uint8_t MODE_AUDIO1 = 0x7C;
constexpr uint8_t MODE_AUDIO2 = 0x7D;
constexpr uint8_t MODE_AUDIO3 = 0x7E;
constexpr uint8_t MODE_SPLIT = 0x7F;
constexpr uint8_t MODE_RANDOM1 = 0x80;
constexpr uint8_t MODE_RANDOM2 = 0x81;
constexpr uint8_t MODE_TOGGLE = 0x82;
constexpr uint8_t MODE_ORGASM = 0x83;
constexpr uint8_t MODE_TORMENT = 0x84;
constexpr uint8_t MODE_PHASE1 = 0x85;
constexpr uint8_t MODE_PHASE2 = 0x86;
constexpr uint8_t MODE_PHASE3 = 0x87;
constexpr uint8_t MODE_USER1 = 0x88;
constexpr uint8_t MODE_USER2 = 0x89;
constexpr uint8_t MODE_USER3 = 0x8A;
constexpr uint8_t MODE_USER4 = 0x8B;
constexpr uint8_t MODE_USER5 = 0x8C;
constexpr uint8_t MODE_USER6 = 0x8D;
constexpr uint8_t MODE_USER7 = 0x8E;

/* ========================================================================= */
/* Power levels                                                              */
/* ========================================================================= */

constexpr uint8_t POWERLEVEL_LOW = 0x01;
constexpr uint8_t POWERLEVEL_NORMAL = 0x02;
constexpr uint8_t POWERLEVEL_HIGH = 0x03;

/* ========================================================================= */
/* Box commands (written to reg::COMMAND)                                    */
/* ========================================================================= */

constexpr uint8_t COMMAND_START_FAVORITE = 0x00;
constexpr uint8_t COMMAND_EXIT_MENU = 0x04;
constexpr uint8_t COMMAND_NEW_MODE = 0x12;

/**
 * @brief Controller configuration
 */
struct ControllerConfig
{
  uint32_t settle_ms = 100;  ///< Pause between dependent writes
};

class Controller
{
 public:
  /**
   * @brief Construct a controller over a session
   *
   * Operations handshake first when the session is DISCONNECTED.
   */
  explicit Controller(Session& session, ControllerConfig config = ControllerConfig());

  /**
   * @brief Switch to a program mode
   *
   * Writes the mode, leaves the menu, selects the new mode and reads the
   * mode back.
   *
   * @return Error::VERIFY_FAILED if the device reports another mode
   */
  Error load_mode(uint8_t mode);

  Error load_favorite_mode();

  /**
   * @brief Set the power level (POWERLEVEL_LOW/NORMAL/HIGH)
   */
  Error set_power_level(uint8_t level);

  Error power_level(uint8_t& level);

  /**
   * @brief Disable the front panel potentiometers
   *
   * Levels can only be set remotely while the ADC is disabled.
   */
  Error disable_adc();

  Error enable_adc();

  Error adc_enabled(bool& enabled);

  Error set_level_a(uint8_t level);
  Error set_level_b(uint8_t level);
  Error level_a(uint8_t& level);
  Error level_b(uint8_t& level);

  /**
   * @brief Multi adjust range of the current mode
   *
   * The minimum is not necessarily the smaller value.
   */
  Error ma_range(uint8_t& min, uint8_t& max);

  Error ma_level(uint8_t& level);

  /**
   * @brief Set the multi adjust level
   *
   * @return Error::VALUE_OUT_OF_RANGE if level lies outside ma_range()
   */
  Error set_ma_level(uint8_t level);

  Error mode(uint8_t& mode);

 private:
  Error ensure_session();
  Error read_byte(const Register& reg, uint8_t& value);
  Error write_verified(const Register& reg, uint8_t value);
  Error update_r15(bool disable_adc);
  void settle() const;

  RegisterAccess access_;
  ControllerConfig config_;
};

}  // namespace link
}  // namespace mk312
