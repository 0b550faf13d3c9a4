/**
 * @file test_cli.cpp
 * @brief mk312ctl option parsing and interrupt handling tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <csignal>
#include <initializer_list>
#include <string>
#include <vector>

#include "cli.hpp"

using namespace mk312::link;

namespace
{

/**
 * @brief Mutable argv built from string literals
 */
class Args
{
 public:
  Args(std::initializer_list<const char*> words) : storage_(words.begin(), words.end())
  {
    for (std::string& word : storage_)
    {
      argv_.push_back(&word[0]);
    }
  }

  int argc() const
  {
    return static_cast<int>(argv_.size());
  }

  char** argv()
  {
    return argv_.data();
  }

 private:
  std::vector<std::string> storage_;
  std::vector<char*> argv_;
};

}  // namespace

TEST_CASE("Number parsing")
{
  unsigned long value = 0;

  CHECK(cli::parse_number("0x3A", 0, 0xFF, value));
  CHECK(value == 0x3A);
  CHECK(cli::parse_number("200", 1, 60000, value));
  CHECK(value == 200);

  CHECK_FALSE(cli::parse_number("0", 1, 60000, value));
  CHECK_FALSE(cli::parse_number("0x100", 0, 0xFF, value));
  CHECK_FALSE(cli::parse_number("-1", 0, 0xFF, value));
  CHECK_FALSE(cli::parse_number("12ab", 0, 0xFFFF, value));
  CHECK_FALSE(cli::parse_number("", 0, 0xFF, value));
  CHECK_FALSE(cli::parse_number(nullptr, 0, 0xFF, value));
}

TEST_CASE("Option parsing")
{
  cli::Options options;

  SUBCASE("Defaults")
  {
    Args args = {"mk312ctl", "info"};
    REQUIRE(cli::parse_options(args.argc(), args.argv(), options) == Error::OK);
    CHECK(options.command == 1);
    CHECK(options.serial.device == "/dev/ttyUSB0");
    CHECK(options.session.timeout_ms == 2000);
    CHECK(options.session.host_key == 0x00);
    CHECK(options.session.bootstrap_key == NEUTRAL_KEY);
    CHECK(options.session.log_level == LogLevel::WARNING);
  }

  SUBCASE("Every flag")
  {
    Args args = {"mk312ctl", "-d", "/dev/ttyS1", "-t", "500", "-k", "0x3A",
                 "-K", "0x47", "-v", "level", "a"};
    REQUIRE(cli::parse_options(args.argc(), args.argv(), options) == Error::OK);
    CHECK(options.command == 10);
    CHECK(options.serial.device == "/dev/ttyS1");
    CHECK(options.session.timeout_ms == 500);
    CHECK(options.session.host_key == 0x3A);
    CHECK(options.session.bootstrap_key == 0x47);
    CHECK(options.session.log_level == LogLevel::DEBUG);
  }

  SUBCASE("Zero timeout is rejected")
  {
    Args args = {"mk312ctl", "-t", "0", "info"};
    CHECK(cli::parse_options(args.argc(), args.argv(), options) == Error::INVALID_CONFIG);
  }

  SUBCASE("Bootstrap key must fit a byte")
  {
    Args args = {"mk312ctl", "-K", "256", "info"};
    CHECK(cli::parse_options(args.argc(), args.argv(), options) == Error::INVALID_CONFIG);
  }

  SUBCASE("Flag without its value")
  {
    Args args = {"mk312ctl", "-d"};
    CHECK(cli::parse_options(args.argc(), args.argv(), options) == Error::INVALID_CONFIG);
  }

  SUBCASE("Unknown flag")
  {
    Args args = {"mk312ctl", "-x", "info"};
    CHECK(cli::parse_options(args.argc(), args.argv(), options) == Error::INVALID_CONFIG);
  }

  SUBCASE("Missing command")
  {
    Args args = {"mk312ctl", "-v"};
    CHECK(cli::parse_options(args.argc(), args.argv(), options) == Error::INVALID_CONFIG);
  }
}

TEST_CASE("Interrupts are recorded instead of terminating")
{
  REQUIRE(cli::install_interrupt_handlers() == Error::OK);
  CHECK_FALSE(cli::interrupted());

  REQUIRE(std::raise(SIGINT) == 0);
  CHECK(cli::interrupted());

  REQUIRE(std::raise(SIGTERM) == 0);
  CHECK(cli::interrupted());
}
