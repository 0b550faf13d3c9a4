/**
 * @file mk312ctl.cpp
 * @brief Command-line control of an MK-312 over its serial link
 *
 * Every command runs inside a ScopedSession, so the device key is reset
 * before the tool exits. SIGINT and SIGTERM let the running exchange finish
 * and then leave through the same path.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstdio>
#include <cstring>
#include <string>

#include "cli.hpp"
#include "mk312link/controller.hpp"
#include "mk312link/log.hpp"
#include "mk312link/registers.hpp"
#include "mk312link/serial_transport.hpp"
#include "mk312link/session.hpp"

using namespace mk312::link;

namespace
{

void usage()
{
  std::fprintf(stderr,
               "Usage: mk312ctl [-d device] [-t timeout_ms] [-k host_key] [-K bootstrap_key] [-v]\n"
               "                <command>\n"
               "\n"
               "Commands:\n"
               "  info                       box model, firmware, mode and levels\n"
               "  read <register>            read a named register\n"
               "  write <register> <value>   write a named register\n"
               "  mode <hex>                 switch program mode\n"
               "  favorite                   start the favorite mode\n"
               "  power <low|normal|high>    set the power level\n"
               "  adc <on|off>               enable/disable front panel potentiometers\n"
               "  level <a|b> [value]        read or set an output level\n"
               "  registers                  list known registers\n");
}

int report(Error err)
{
  if (err == Error::OK)
  {
    return 0;
  }
  std::fprintf(stderr, "mk312ctl: %s\n", strerror(err));
  return 1;
}

const char* access_name(Access access)
{
  switch (access)
  {
    case Access::READ_ONLY:
      return "ro";
    case Access::WRITE_ONLY:
      return "wo";
    default:
      return "rw";
  }
}

int list_registers()
{
  size_t count = 0;
  const Register* const* regs = all_registers(count);
  for (size_t i = 0; i < count; ++i)
  {
    std::printf("%-18s 0x%04X  %u byte(s)  %s\n", regs[i]->name, regs[i]->address,
                static_cast<unsigned>(regs[i]->width), access_name(regs[i]->access));
  }
  return 0;
}

int cmd_info(Controller& controller, RegisterAccess& access)
{
  uint16_t model = 0;
  uint16_t firmware = 0;
  uint8_t mode = 0;
  uint8_t power = 0;
  uint8_t a = 0;
  uint8_t b = 0;

  Error err = access.read(reg::BOX_MODEL, model);
  if (err == Error::OK)
  {
    err = access.read(reg::FIRMWARE_VERSION, firmware);
  }
  if (err == Error::OK)
  {
    err = controller.mode(mode);
  }
  if (err == Error::OK)
  {
    err = controller.power_level(power);
  }
  if (err == Error::OK)
  {
    err = controller.level_a(a);
  }
  if (err == Error::OK)
  {
    err = controller.level_b(b);
  }
  if (err != Error::OK)
  {
    return report(err);
  }

  std::printf("box model:   0x%02X\n", static_cast<unsigned>(model));
  std::printf("firmware:    %u.%u\n", static_cast<unsigned>(firmware >> 8),
              static_cast<unsigned>(firmware & 0xFF));
  std::printf("mode:        0x%02X\n", mode);
  std::printf("power level: %u\n", static_cast<unsigned>(power));
  std::printf("level a:     0x%02X\n", a);
  std::printf("level b:     0x%02X\n", b);
  return 0;
}

int run(Controller& controller, RegisterAccess& access, int argc, char** argv)
{
  const std::string cmd = argv[0];
  unsigned long value = 0;

  if (cmd == "info")
  {
    return cmd_info(controller, access);
  }

  if (cmd == "read" && argc == 2)
  {
    const Register* r = find_register(argv[1]);
    if (r == nullptr)
    {
      return report(Error::UNKNOWN_REGISTER);
    }
    uint16_t v = 0;
    const Error err = access.read(*r, v);
    if (err == Error::OK)
    {
      std::printf("%s = 0x%0*X\n", r->name, r->width * 2, static_cast<unsigned>(v));
    }
    return report(err);
  }

  if (cmd == "write" && argc == 3)
  {
    const Register* r = find_register(argv[1]);
    if (r == nullptr)
    {
      return report(Error::UNKNOWN_REGISTER);
    }
    if (!cli::parse_number(argv[2], 0, 0xFFFF, value))
    {
      return report(Error::VALUE_OUT_OF_RANGE);
    }
    return report(access.write(*r, static_cast<uint16_t>(value)));
  }

  if (cmd == "mode" && argc == 2)
  {
    if (!cli::parse_number(argv[1], 0, 0xFF, value))
    {
      return report(Error::VALUE_OUT_OF_RANGE);
    }
    return report(controller.load_mode(static_cast<uint8_t>(value)));
  }

  if (cmd == "favorite" && argc == 1)
  {
    return report(controller.load_favorite_mode());
  }

  if (cmd == "power" && argc == 2)
  {
    const std::string level = argv[1];
    uint8_t power = 0;
    if (level == "low")
    {
      power = POWERLEVEL_LOW;
    }
    else if (level == "normal")
    {
      power = POWERLEVEL_NORMAL;
    }
    else if (level == "high")
    {
      power = POWERLEVEL_HIGH;
    }
    else
    {
      return report(Error::VALUE_OUT_OF_RANGE);
    }
    return report(controller.set_power_level(power));
  }

  if (cmd == "adc" && argc == 2)
  {
    const std::string state = argv[1];
    if (state == "on")
    {
      return report(controller.enable_adc());
    }
    if (state == "off")
    {
      return report(controller.disable_adc());
    }
    return report(Error::VALUE_OUT_OF_RANGE);
  }

  if (cmd == "level" && (argc == 2 || argc == 3))
  {
    const std::string channel = argv[1];
    if (channel != "a" && channel != "b")
    {
      return report(Error::UNKNOWN_REGISTER);
    }

    if (argc == 2)
    {
      uint8_t level = 0;
      const Error err = channel == "a" ? controller.level_a(level) : controller.level_b(level);
      if (err == Error::OK)
      {
        std::printf("level %s = 0x%02X\n", channel.c_str(), level);
      }
      return report(err);
    }

    if (!cli::parse_number(argv[2], 0, 0xFF, value))
    {
      return report(Error::VALUE_OUT_OF_RANGE);
    }
    const uint8_t level = static_cast<uint8_t>(value);
    return report(channel == "a" ? controller.set_level_a(level) : controller.set_level_b(level));
  }

  usage();
  return 2;
}

}  // namespace

int main(int argc, char** argv)
{
  cli::Options options;
  if (cli::parse_options(argc, argv, options) != Error::OK)
  {
    usage();
    return 2;
  }
  options.session.log = make_stderr_sink();

  char** args = argv + options.command;
  const int nargs = argc - options.command;

  if (std::strcmp(args[0], "registers") == 0)
  {
    return list_registers();
  }

  Error err = cli::install_interrupt_handlers();
  if (err != Error::OK)
  {
    return report(err);
  }

  SerialTransport port;
  err = port.open(options.serial);
  if (err != Error::OK)
  {
    std::fprintf(stderr, "mk312ctl: cannot open %s: %s\n", options.serial.device.c_str(),
                 strerror(err));
    return 1;
  }

  Session session(port, options.session);
  int rc = 0;
  {
    ScopedSession scoped(session);
    if (!scoped.ok())
    {
      return report(scoped.error());
    }

    if (!cli::interrupted())
    {
      Controller controller(session);
      RegisterAccess access(session);
      rc = run(controller, access, nargs, args);
    }

    if (cli::interrupted())
    {
      std::fprintf(stderr, "mk312ctl: interrupted, resetting the device key\n");
      rc = 130;
    }
  }

  port.close();
  return rc;
}
