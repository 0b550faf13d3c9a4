/**
 * @file session.cpp
 * @brief MK312-link session manager implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mk312link/session.hpp"

#include <chrono>
#include <utility>

#include "cipher.hpp"
#include "frame.hpp"

namespace mk312
{
namespace link
{

uint8_t derive_key(uint8_t host_key, uint8_t challenge)
{
  return static_cast<uint8_t>(KEY_SALT ^ host_key ^ challenge);
}

Session::Session(Transport& transport, SessionConfig config)
    : transport_(transport),
      config_(std::move(config)),
      state_(LinkState::DISCONNECTED),
      key_(NEUTRAL_KEY)
{
  if (config_.derive == nullptr)
  {
    config_.derive = derive_key;
  }
}

/* ========================================================================= */
/* Handshake                                                                 */
/* ========================================================================= */

Error Session::handshake(uint8_t* key_out)
{
  if (state_ != LinkState::DISCONNECTED)
  {
    return fail(Error::INVALID_STATE, 0);
  }

  set_state(LinkState::HANDSHAKING);

  Error err = sync();

  uint8_t key = NEUTRAL_KEY;
  if (err == Error::OK)
  {
    err = exchange_key(key);
  }

  if (err != Error::OK)
  {
    key_ = NEUTRAL_KEY;
    set_state(LinkState::DISCONNECTED);

    // Only a dead channel is reported as such, everything else is a
    // retryable handshake failure
    if (err != Error::TRANSPORT_FATAL)
    {
      err = Error::HANDSHAKE_FAILED;
    }
    return fail(err, 0);
  }

  key_ = key;
  set_state(LinkState::ACTIVE);
  emit(LogLevel::INFO, LogEvent::HANDSHAKE_DONE, Error::OK, 0, key_);

  if (key_out != nullptr)
  {
    *key_out = key_;
  }
  return Error::OK;
}

Error Session::sync()
{
  const std::vector<uint8_t> request = {static_cast<uint8_t>(Opcode::SYNC)};
  std::vector<uint8_t> response;

  const uint8_t attempts = config_.sync_attempts > 0 ? config_.sync_attempts : 1;
  Error err = Error::TIMEOUT;

  for (uint8_t i = 0; i < attempts; ++i)
  {
    err = exchange(request, config_.bootstrap_key, response);
    if (err != Error::TIMEOUT)
    {
      break;
    }
  }

  if (err != Error::OK)
  {
    return err;
  }

  if (response.size() != 1 || response[0] != static_cast<uint8_t>(Opcode::SYNC_REPLY))
  {
    return Error::UNEXPECTED_RESPONSE;
  }
  return Error::OK;
}

Error Session::exchange_key(uint8_t& key)
{
  const std::vector<uint8_t> request = {static_cast<uint8_t>(Opcode::KEY_EXCHANGE),
                                        config_.host_key};
  std::vector<uint8_t> response;

  const Error err = exchange(request, config_.bootstrap_key, response);
  if (err != Error::OK)
  {
    return err;
  }

  // Response: [KEY_REPLY][CHALLENGE]
  if (response.size() != 2 || response[0] != static_cast<uint8_t>(Opcode::KEY_REPLY))
  {
    return Error::UNEXPECTED_RESPONSE;
  }

  key = config_.derive(config_.host_key, response[1]);
  return Error::OK;
}

/* ========================================================================= */
/* Register access                                                           */
/* ========================================================================= */

Error Session::read_register(uint16_t address, uint8_t& value)
{
  return read_registers(address, &value, 1);
}

Error Session::read_registers(uint16_t address, uint8_t* out, size_t count)
{
  if (state_ != LinkState::ACTIVE)
  {
    return fail(Error::INVALID_STATE, address);
  }
  if (out == nullptr || count == 0)
  {
    return fail(Error::VALUE_OUT_OF_RANGE, address);
  }
  if (count > MAX_DATA_SIZE)
  {
    return fail(Error::FRAME_TOO_LARGE, address);
  }

  const uint8_t count_byte = static_cast<uint8_t>(count);
  std::vector<uint8_t> reply;
  const Error err = command(Opcode::READ, address, &count_byte, 1, Opcode::READ_REPLY, reply);
  if (err != Error::OK)
  {
    return fail(err, address);
  }

  // Reply: [READ_REPLY][ADDR_H][ADDR_L][DATA x count]
  if (reply.size() != COMMAND_HEADER_SIZE + count)
  {
    return fail(Error::UNEXPECTED_RESPONSE, address);
  }

  for (size_t i = 0; i < count; ++i)
  {
    out[i] = reply[COMMAND_HEADER_SIZE + i];
  }
  return Error::OK;
}

Error Session::write_register(uint16_t address, uint8_t value)
{
  return write_registers(address, &value, 1);
}

Error Session::write_registers(uint16_t address, const uint8_t* data, size_t count)
{
  if (state_ != LinkState::ACTIVE)
  {
    return fail(Error::INVALID_STATE, address);
  }
  if (data == nullptr || count == 0)
  {
    return fail(Error::VALUE_OUT_OF_RANGE, address);
  }

  std::vector<uint8_t> reply;
  const Error err = command(Opcode::WRITE, address, data, count, Opcode::WRITE_ACK, reply);
  if (err != Error::OK)
  {
    return fail(err, address);
  }

  // Reply: [WRITE_ACK][ADDR_H][ADDR_L]
  if (reply.size() != COMMAND_HEADER_SIZE)
  {
    return fail(Error::UNEXPECTED_RESPONSE, address);
  }
  return Error::OK;
}

void Session::reset_key()
{
  if (state_ != LinkState::ACTIVE)
  {
    return;
  }

  // Forced regardless of the acknowledgment, also when a log sink throws
  struct ForceDisconnect
  {
    Session& session;

    ~ForceDisconnect()
    {
      session.key_ = NEUTRAL_KEY;
      session.state_ = LinkState::DISCONNECTED;
    }
  };

  Error err = Error::OK;
  {
    ForceDisconnect force{*this};
    set_state(LinkState::RESETTING);

    const uint8_t neutral = NEUTRAL_KEY;
    std::vector<uint8_t> reply;
    err = command(Opcode::WRITE, KEY_ADDRESS, &neutral, 1, Opcode::WRITE_ACK, reply);
    if (err == Error::OK && reply.size() != COMMAND_HEADER_SIZE)
    {
      err = Error::UNEXPECTED_RESPONSE;
    }
  }

  emit(LogLevel::INFO, LogEvent::STATE_CHANGE);
  if (err != Error::OK)
  {
    emit(LogLevel::WARNING, LogEvent::RESET_DEGRADED, err, KEY_ADDRESS);
  }
}

/* ========================================================================= */
/* Exchange                                                                  */
/* ========================================================================= */

Error Session::command(Opcode op, uint16_t address, const uint8_t* data, size_t len,
                       Opcode reply_op, std::vector<uint8_t>& reply)
{
  std::vector<uint8_t> request;
  Error err = internal::build_command(op, address, data, len, request);
  if (err != Error::OK)
  {
    return err;
  }

  err = exchange(request, key_, reply);
  if (err != Error::OK)
  {
    return err;
  }

  // Desynchronised replies echo another opcode or address
  if (reply.size() < COMMAND_HEADER_SIZE || reply[0] != static_cast<uint8_t>(reply_op) ||
      reply[1] != request[1] || reply[2] != request[2])
  {
    return Error::UNEXPECTED_RESPONSE;
  }
  return Error::OK;
}

Error Session::exchange(const std::vector<uint8_t>& request, uint8_t key,
                        std::vector<uint8_t>& response)
{
  std::vector<uint8_t> payload(request);
  internal::obscure_bytes(payload.data(), payload.size(), key);

  std::vector<uint8_t> frame;
  Error err = internal::encode_frame(HOST_MARKER, payload.data(), payload.size(), frame);
  if (err != Error::OK)
  {
    return err;
  }

  // Late bytes of an earlier exchange must not be taken for this response
  transport_.discard_input();

  emit(LogLevel::DEBUG, LogEvent::FRAME_SENT, Error::OK, 0, 0, frame.data(), frame.size());
  err = transport_.write(frame.data(), frame.size());
  if (err != Error::OK)
  {
    return Error::TRANSPORT_FATAL;
  }

  std::vector<uint8_t> received;
  err = receive_frame(received);
  if (err != Error::OK)
  {
    return err;
  }

  err = internal::decode_frame(received.data(), received.size(), DEVICE_MARKER, response);
  if (err != Error::OK)
  {
    return err;
  }

  internal::reveal_bytes(response.data(), response.size(), key);
  return Error::OK;
}

Error Session::receive_frame(std::vector<uint8_t>& frame)
{
  using Clock = std::chrono::steady_clock;
  const Clock::time_point start = Clock::now();

  // Header: [MARKER][LEN]
  uint8_t header[2] = {0, 0};
  Error err = read_exact(header, sizeof(header), config_.timeout_ms);
  if (err != Error::OK)
  {
    return err;
  }

  if (header[0] != DEVICE_MARKER || header[1] > MAX_PAYLOAD_SIZE)
  {
    transport_.discard_input();
    return Error::MALFORMED_FRAME;
  }

  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
  const uint32_t remaining =
      elapsed >= config_.timeout_ms ? 0 : config_.timeout_ms - static_cast<uint32_t>(elapsed);

  // Rest: [PAYLOAD...][CHECKSUM]
  frame.assign(header, header + sizeof(header));
  frame.resize(sizeof(header) + header[1] + 1);
  err = read_exact(frame.data() + sizeof(header), header[1] + 1, remaining);
  if (err != Error::OK)
  {
    return err;
  }

  emit(LogLevel::DEBUG, LogEvent::FRAME_RECEIVED, Error::OK, 0, 0, frame.data(), frame.size());
  return Error::OK;
}

Error Session::read_exact(uint8_t* buf, size_t len, uint32_t budget_ms)
{
  using Clock = std::chrono::steady_clock;
  const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(budget_ms);

  size_t pos = 0;
  while (pos < len)
  {
    const Clock::time_point now = Clock::now();
    const uint32_t wait =
        now >= deadline
            ? 0
            : static_cast<uint32_t>(
                  std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

    size_t received = 0;
    const Error err = transport_.read(buf + pos, len - pos, wait, received);
    if (err == Error::TRANSPORT_FATAL)
    {
      return err;
    }
    if (err != Error::OK || received == 0)
    {
      // Nothing or only part of the frame arrived in time
      return Error::TIMEOUT;
    }
    pos += received;
  }
  return Error::OK;
}

/* ========================================================================= */
/* State and logging                                                         */
/* ========================================================================= */

Error Session::fail(Error err, uint16_t address)
{
  if (err == Error::TRANSPORT_FATAL && state_ != LinkState::DISCONNECTED)
  {
    key_ = NEUTRAL_KEY;
    set_state(LinkState::DISCONNECTED);
  }

  emit(LogLevel::ERROR, LogEvent::REQUEST_FAILED, err, address);
  return err;
}

void Session::set_state(LinkState state)
{
  if (state == state_)
  {
    return;
  }
  state_ = state;
  emit(LogLevel::INFO, LogEvent::STATE_CHANGE);
}

void Session::emit(LogLevel level, LogEvent event, Error err, uint16_t address, uint8_t value,
                   const uint8_t* bytes, size_t len) const
{
  if (!config_.log || level < config_.log_level)
  {
    return;
  }

  const LogRecord record = {level, event, state_, err, address, value, bytes, len};
  config_.log(record);
}

/* ========================================================================= */
/* ScopedSession                                                             */
/* ========================================================================= */

ScopedSession::ScopedSession(Session& session) : session_(session), error_(Error::OK)
{
  error_ = session_.handshake();
}

ScopedSession::~ScopedSession()
{
  if (session_.active())
  {
    session_.reset_key();
  }
}

}  // namespace link
}  // namespace mk312
