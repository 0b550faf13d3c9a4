/**
 * @file controller.cpp
 * @brief High-level device operations implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mk312link/controller.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace mk312
{
namespace link
{

Controller::Controller(Session& session, ControllerConfig config)
    : access_(session), config_(config)
{
}

Error Controller::load_mode(uint8_t mode)
{
  Error err = ensure_session();
  if (err != Error::OK)
  {
    return err;
  }

  err = access_.write(reg::MODE, mode);
  if (err != Error::OK)
  {
    return err;
  }
  settle();

  // Refresh the display, then apply the mode
  err = access_.write(reg::COMMAND, COMMAND_EXIT_MENU);
  if (err != Error::OK)
  {
    return err;
  }
  settle();

  err = access_.write(reg::COMMAND, COMMAND_NEW_MODE);
  if (err != Error::OK)
  {
    return err;
  }
  settle();

  uint8_t current = 0;
  err = read_byte(reg::MODE, current);
  if (err != Error::OK)
  {
    return err;
  }
  return current == mode ? Error::OK : Error::VERIFY_FAILED;
}

Error Controller::load_favorite_mode()
{
  const Error err = ensure_session();
  if (err != Error::OK)
  {
    return err;
  }
  return access_.write(reg::COMMAND, COMMAND_START_FAVORITE);
}

Error Controller::set_power_level(uint8_t level)
{
  if (level < POWERLEVEL_LOW || level > POWERLEVEL_HIGH)
  {
    return Error::VALUE_OUT_OF_RANGE;
  }
  return write_verified(reg::POWER_LEVEL, level);
}

Error Controller::power_level(uint8_t& level)
{
  return read_byte(reg::POWER_LEVEL, level);
}

Error Controller::disable_adc()
{
  return update_r15(true);
}

Error Controller::enable_adc()
{
  return update_r15(false);
}

Error Controller::adc_enabled(bool& enabled)
{
  uint8_t r15 = 0;
  const Error err = read_byte(reg::R15, r15);
  if (err != Error::OK)
  {
    return err;
  }
  enabled = (r15 & (1u << reg::R15_ADC_DISABLE)) == 0;
  return Error::OK;
}

Error Controller::set_level_a(uint8_t level)
{
  return write_verified(reg::LEVEL_A, level);
}

Error Controller::set_level_b(uint8_t level)
{
  return write_verified(reg::LEVEL_B, level);
}

Error Controller::level_a(uint8_t& level)
{
  return read_byte(reg::LEVEL_A, level);
}

Error Controller::level_b(uint8_t& level)
{
  return read_byte(reg::LEVEL_B, level);
}

Error Controller::ma_range(uint8_t& min, uint8_t& max)
{
  Error err = read_byte(reg::MA_MIN, min);
  if (err != Error::OK)
  {
    return err;
  }
  return read_byte(reg::MA_MAX, max);
}

Error Controller::ma_level(uint8_t& level)
{
  return read_byte(reg::MA_LEVEL, level);
}

Error Controller::set_ma_level(uint8_t level)
{
  uint8_t min = 0;
  uint8_t max = 0;
  const Error err = ma_range(min, max);
  if (err != Error::OK)
  {
    return err;
  }

  if (level < std::min(min, max) || level > std::max(min, max))
  {
    return Error::VALUE_OUT_OF_RANGE;
  }
  return write_verified(reg::MA_LEVEL, level);
}

Error Controller::mode(uint8_t& mode)
{
  return read_byte(reg::MODE, mode);
}

Error Controller::ensure_session()
{
  Session& session = access_.session();
  if (session.active())
  {
    return Error::OK;
  }
  return session.handshake();
}

Error Controller::read_byte(const Register& reg, uint8_t& value)
{
  Error err = ensure_session();
  if (err != Error::OK)
  {
    return err;
  }

  uint16_t raw = 0;
  err = access_.read(reg, raw);
  if (err != Error::OK)
  {
    return err;
  }
  value = static_cast<uint8_t>(raw);
  return Error::OK;
}

Error Controller::write_verified(const Register& reg, uint8_t value)
{
  Error err = ensure_session();
  if (err != Error::OK)
  {
    return err;
  }

  err = access_.write(reg, value);
  if (err != Error::OK)
  {
    return err;
  }
  settle();

  uint8_t readback = 0;
  err = read_byte(reg, readback);
  if (err != Error::OK)
  {
    return err;
  }
  return readback == value ? Error::OK : Error::VERIFY_FAILED;
}

Error Controller::update_r15(bool disable_adc)
{
  uint8_t r15 = 0;
  const Error err = read_byte(reg::R15, r15);
  if (err != Error::OK)
  {
    return err;
  }

  const uint8_t bit = static_cast<uint8_t>(1u << reg::R15_ADC_DISABLE);
  const uint8_t updated = disable_adc ? static_cast<uint8_t>(r15 | bit)
                                      : static_cast<uint8_t>(r15 & ~bit);
  return write_verified(reg::R15, updated);
}

void Controller::settle() const
{
  if (config_.settle_ms > 0)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.settle_ms));
  }
}

}  // namespace link
}  // namespace mk312
