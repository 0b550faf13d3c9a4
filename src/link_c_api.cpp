/**
 * @file link_c_api.cpp
 * @brief MK312-link C API implementation
 *
 * C wrapper for the C++ Session class.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <new>

#include "mk312link/link.h"
#include "mk312link/session.hpp"
#include "mk312link/transport.hpp"

using namespace mk312::link;

namespace
{

/**
 * @brief Transport forwarding to the C callbacks
 */
class CallbackTransport : public Transport
{
 public:
  CallbackTransport(mk312link_write_fn write_fn, mk312link_read_fn read_fn, void* user)
      : write_fn_(write_fn), read_fn_(read_fn), user_(user), closed_(false)
  {
  }

  Error write(const uint8_t* data, size_t len) override
  {
    if (closed_ || write_fn_(user_, data, len) < 0)
    {
      return Error::TRANSPORT_FATAL;
    }
    return Error::OK;
  }

  Error read(uint8_t* buf, size_t max, uint32_t timeout_ms, size_t& received) override
  {
    received = 0;
    if (closed_)
    {
      return Error::TRANSPORT_FATAL;
    }

    const int n = read_fn_(user_, buf, max, timeout_ms);
    if (n < 0)
    {
      return Error::TRANSPORT_FATAL;
    }
    if (n == 0)
    {
      return Error::TIMEOUT;
    }
    received = static_cast<size_t>(n) > max ? max : static_cast<size_t>(n);
    return Error::OK;
  }

  void discard_input() override
  {
    if (closed_)
    {
      return;
    }

    uint8_t scratch[MK312LINK_MAX_PAYLOAD_SIZE + 3];
    while (read_fn_(user_, scratch, sizeof(scratch), 0) > 0)
    {
    }
  }

  void close() override
  {
    closed_ = true;
  }

 private:
  mk312link_write_fn write_fn_;
  mk312link_read_fn read_fn_;
  void* user_;
  bool closed_;
};

mk312link_error_t to_c(Error err)
{
  return static_cast<mk312link_error_t>(err);
}

}  // namespace

/* ========================================================================= */
/* Internal wrapper structure                                                */
/* ========================================================================= */

struct MK312Link
{
  CallbackTransport transport;
  Session session;

  MK312Link(mk312link_write_fn write_fn, mk312link_read_fn read_fn, void* user,
            const SessionConfig& config)
      : transport(write_fn, read_fn, user), session(transport, config)
  {
  }

  ~MK312Link()
  {
    session.reset_key();
  }
};

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* mk312link_strerror(mk312link_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg)   \
  case MK312LINK_ERR_##name: \
    return msg;
#include "mk312link/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Lifecycle functions                                                       */
/* ========================================================================= */

MK312Link* mk312link_create(mk312link_write_fn write_fn, mk312link_read_fn read_fn, void* user,
                            uint32_t timeout_ms)
{
  if (write_fn == nullptr || read_fn == nullptr)
  {
    return nullptr;
  }

  SessionConfig config;
  if (timeout_ms != 0)
  {
    config.timeout_ms = timeout_ms;
  }

  return new (std::nothrow) MK312Link(write_fn, read_fn, user, config);
}

void mk312link_destroy(MK312Link* link)
{
  delete link;
}

/* ========================================================================= */
/* Operation functions                                                       */
/* ========================================================================= */

mk312link_error_t mk312link_handshake(MK312Link* link, uint8_t* key_out)
{
  if (link == nullptr)
  {
    return MK312LINK_ERR_INVALID_STATE;
  }
  return to_c(link->session.handshake(key_out));
}

mk312link_error_t mk312link_read_register(MK312Link* link, uint16_t address, uint8_t* value)
{
  if (link == nullptr || value == nullptr)
  {
    return MK312LINK_ERR_INVALID_STATE;
  }
  return to_c(link->session.read_register(address, *value));
}

mk312link_error_t mk312link_write_register(MK312Link* link, uint16_t address, uint8_t value)
{
  if (link == nullptr)
  {
    return MK312LINK_ERR_INVALID_STATE;
  }
  return to_c(link->session.write_register(address, value));
}

void mk312link_reset_key(MK312Link* link)
{
  if (link)
  {
    link->session.reset_key();
  }
}

mk312link_state_t mk312link_state(const MK312Link* link)
{
  if (link == nullptr)
  {
    return MK312LINK_STATE_DISCONNECTED;
  }
  return static_cast<mk312link_state_t>(link->session.state());
}
