/**
 * @file test_registers.cpp
 * @brief Register access layer and controller tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "mk312link/controller.hpp"
#include "mk312link/registers.hpp"
#include "mk312link/session.hpp"
#include "sim_device.hpp"

using namespace mk312::link;
using test::SimDevice;

namespace
{

SessionConfig fast_config()
{
  SessionConfig config;
  config.timeout_ms = 10;
  return config;
}

ControllerConfig no_settle()
{
  ControllerConfig config;
  config.settle_ms = 0;
  return config;
}

}  // namespace

/* ========================================================================= */
/* Register Map Tests                                                        */
/* ========================================================================= */

TEST_CASE("Register lookup")
{
  SUBCASE("By name")
  {
    CHECK(find_register("mode") == &reg::MODE);
    CHECK(find_register("LEVEL_A") == &reg::LEVEL_A);
    CHECK(find_register("firmware_version") == &reg::FIRMWARE_VERSION);
  }

  SUBCASE("Unknown name")
  {
    CHECK(find_register("nope") == nullptr);
    CHECK(find_register("mod") == nullptr);
    CHECK(find_register(nullptr) == nullptr);
  }

  SUBCASE("Table is consistent")
  {
    size_t count = 0;
    const Register* const* regs = all_registers(count);
    REQUIRE(count == 12);
    for (size_t i = 0; i < count; ++i)
    {
      CAPTURE(regs[i]->name);
      CHECK((regs[i]->width == 1 || regs[i]->width == 2));
      CHECK(find_register(regs[i]->name) == regs[i]);
    }
  }

  SUBCASE("Key register")
  {
    CHECK(reg::KEY.address == KEY_ADDRESS);
    CHECK_FALSE(reg::KEY.readable());
    CHECK(reg::KEY.writable());
  }
}

/* ========================================================================= */
/* Register Access Tests                                                     */
/* ========================================================================= */

TEST_CASE("Register access")
{
  SimDevice device(0x21);
  device.memory[0x00FD] = 0x01;
  device.memory[0x00FE] = 0x06;
  device.memory[0x407B] = MODE_STROKE;

  Session session(device, fast_config());
  RegisterAccess access(session);

  REQUIRE(session.handshake() == Error::OK);
  device.clear_log();

  SUBCASE("Write to read-only register never reaches the wire")
  {
    CHECK(access.write(reg::FIRMWARE_VERSION, 0x0107) == Error::INVALID_ACCESS_MODE);
    CHECK(access.write(reg::MA_MAX, 0x10) == Error::INVALID_ACCESS_MODE);
    CHECK(device.write_calls == 0);
    CHECK(session.state() == LinkState::ACTIVE);
  }

  SUBCASE("Read of write-only register never reaches the wire")
  {
    uint16_t value = 0;
    CHECK(access.read(reg::COMMAND, value) == Error::INVALID_ACCESS_MODE);
    CHECK(access.read(reg::KEY, value) == Error::INVALID_ACCESS_MODE);
    CHECK(device.write_calls == 0);
  }

  SUBCASE("Single byte read")
  {
    uint16_t value = 0;
    REQUIRE(access.read(reg::MODE, value) == Error::OK);
    CHECK(value == MODE_STROKE);
  }

  SUBCASE("Two byte read is big-endian")
  {
    uint16_t value = 0;
    REQUIRE(access.read(reg::FIRMWARE_VERSION, value) == Error::OK);
    CHECK(value == 0x0106);
    CHECK(device.write_calls == 1);
  }

  SUBCASE("Value wider than the register")
  {
    CHECK(access.write(reg::LEVEL_A, 0x100) == Error::VALUE_OUT_OF_RANGE);
    CHECK(device.write_calls == 0);
  }

  SUBCASE("Register wider than two bytes is rejected locally")
  {
    const Register wide = {"wide", 0x4000, 3, Access::READ_WRITE};
    uint16_t value = 0xBEEF;
    CHECK(access.read(wide, value) == Error::VALUE_OUT_OF_RANGE);
    CHECK(value == 0xBEEF);
    CHECK(access.write(wide, 0x0102) == Error::VALUE_OUT_OF_RANGE);

    const Register empty = {"empty", 0x4000, 0, Access::READ_WRITE};
    CHECK(access.read(empty, value) == Error::VALUE_OUT_OF_RANGE);
    CHECK(access.write(empty, 0x01) == Error::VALUE_OUT_OF_RANGE);

    CHECK(device.write_calls == 0);
    CHECK(session.state() == LinkState::ACTIVE);
  }

  SUBCASE("Write")
  {
    REQUIRE(access.write(reg::LEVEL_B, 0x7F) == Error::OK);
    CHECK(device.memory[0x4065] == 0x7F);
  }
}

/* ========================================================================= */
/* Controller Tests                                                          */
/* ========================================================================= */

TEST_CASE("Controller")
{
  SimDevice device(0x55);
  device.memory[0x407B] = MODE_WAVES;
  device.memory[0x41F4] = POWERLEVEL_NORMAL;
  device.memory[0x400F] = 0x40;
  device.memory[0x4086] = 0xA0;
  device.memory[0x4087] = 0x20;

  Session session(device, fast_config());
  Controller controller(session, no_settle());

  SUBCASE("Handshakes on first use")
  {
    uint8_t mode = 0;
    REQUIRE(session.state() == LinkState::DISCONNECTED);
    REQUIRE(controller.mode(mode) == Error::OK);
    CHECK(mode == MODE_WAVES);
    CHECK(session.active());
  }

  SUBCASE("Load mode")
  {
    REQUIRE(controller.load_mode(MODE_CLIMB) == Error::OK);
    CHECK(device.memory[0x407B] == MODE_CLIMB);
    CHECK(device.memory[0x4070] == COMMAND_NEW_MODE);
  }

  SUBCASE("Load mode not taken by the device")
  {
    device.frozen.insert(0x407B);
    CHECK(controller.load_mode(MODE_CLIMB) == Error::VERIFY_FAILED);
    CHECK(device.memory[0x407B] == MODE_WAVES);
  }

  SUBCASE("Desynchronised reply during mode switch")
  {
    device.inject_at(0x407B, SimDevice::Fault::WRONG_ADDRESS);
    CHECK(controller.load_mode(MODE_CLIMB) == Error::UNEXPECTED_RESPONSE);
    CHECK(session.active());
  }

  SUBCASE("Favorite mode")
  {
    device.memory[0x4070] = 0xFF;
    REQUIRE(controller.load_favorite_mode() == Error::OK);
    CHECK(device.memory[0x4070] == COMMAND_START_FAVORITE);
  }

  SUBCASE("Power level")
  {
    REQUIRE(controller.set_power_level(POWERLEVEL_HIGH) == Error::OK);
    uint8_t level = 0;
    REQUIRE(controller.power_level(level) == Error::OK);
    CHECK(level == POWERLEVEL_HIGH);
  }

  SUBCASE("Invalid power level is rejected locally")
  {
    CHECK(controller.set_power_level(0x04) == Error::VALUE_OUT_OF_RANGE);
    CHECK(device.write_calls == 0);
  }

  SUBCASE("ADC toggling keeps the other R15 bits")
  {
    REQUIRE(controller.disable_adc() == Error::OK);
    CHECK(device.memory[0x400F] == 0x41);

    bool enabled = true;
    REQUIRE(controller.adc_enabled(enabled) == Error::OK);
    CHECK_FALSE(enabled);

    REQUIRE(controller.enable_adc() == Error::OK);
    CHECK(device.memory[0x400F] == 0x40);
  }

  SUBCASE("Level write ignored by the device")
  {
    device.frozen.insert(0x4064);
    CHECK(controller.set_level_a(0x30) == Error::VERIFY_FAILED);
  }

  SUBCASE("Output levels")
  {
    REQUIRE(controller.set_level_a(0x30) == Error::OK);
    REQUIRE(controller.set_level_b(0x90) == Error::OK);

    uint8_t a = 0;
    uint8_t b = 0;
    REQUIRE(controller.level_a(a) == Error::OK);
    REQUIRE(controller.level_b(b) == Error::OK);
    CHECK(a == 0x30);
    CHECK(b == 0x90);
  }

  SUBCASE("Multi adjust range")
  {
    uint8_t min = 0;
    uint8_t max = 0;
    REQUIRE(controller.ma_range(min, max) == Error::OK);
    CHECK(min == 0x20);
    CHECK(max == 0xA0);

    REQUIRE(controller.set_ma_level(0x50) == Error::OK);
    CHECK(device.memory[0x420D] == 0x50);

    CHECK(controller.set_ma_level(0xB0) == Error::VALUE_OUT_OF_RANGE);
    CHECK(device.memory[0x420D] == 0x50);
  }

  SUBCASE("Inverted multi adjust range")
  {
    device.memory[0x4086] = 0x20;
    device.memory[0x4087] = 0xA0;
    CHECK(controller.set_ma_level(0x50) == Error::OK);
  }

  SUBCASE("Handshake failure is reported")
  {
    device.inject(SimDevice::Fault::SILENT);
    CHECK(controller.set_level_a(0x10) == Error::HANDSHAKE_FAILED);
    CHECK(session.state() == LinkState::DISCONNECTED);
  }
}
