/**
 * @file serial_transport.cpp
 * @brief POSIX serial port transport implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mk312link/serial_transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>

namespace mk312
{
namespace link
{

namespace
{

bool set_nonblocking(int fd)
{
  const int flags = ::fcntl(fd, F_GETFL);
  return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Consume pending wake-ups left by an earlier close()
void drain(int fd)
{
  uint8_t scratch[16];
  while (::read(fd, scratch, sizeof(scratch)) > 0)
  {
  }
}

}  // namespace

Error SerialConfig::validate() const
{
  if (device.empty() || baud_rate != BAUD_RATE || data_bits != 8 || parity != Parity::NONE ||
      stop_bits != 1)
  {
    return Error::INVALID_CONFIG;
  }
  return Error::OK;
}

SerialTransport::~SerialTransport()
{
  close();

  for (int& fd : wake_)
  {
    if (fd >= 0)
    {
      ::close(fd);
      fd = -1;
    }
  }
}

Error SerialTransport::open(const SerialConfig& config)
{
  const Error err = config.validate();
  if (err != Error::OK)
  {
    return err;
  }

  close();

  std::lock_guard<std::mutex> lock(io_mutex_);

  if (wake_[0] < 0)
  {
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0)
    {
      return Error::TRANSPORT_FATAL;
    }
    if (!set_nonblocking(fds[0]) || !set_nonblocking(fds[1]))
    {
      ::close(fds[0]);
      ::close(fds[1]);
      return Error::TRANSPORT_FATAL;
    }
    wake_[0] = fds[0];
    wake_[1] = fds[1];
  }
  drain(wake_[0]);

  const int fd = ::open(config.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0)
  {
    return Error::TRANSPORT_FATAL;
  }

  termios tio{};
  if (::tcgetattr(fd, &tio) != 0)
  {
    ::close(fd);
    return Error::TRANSPORT_FATAL;
  }

  ::cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;  // no HW flow control
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);
  tio.c_cflag &= ~PARENB;
  tio.c_cflag &= ~CSTOPB;
  tio.c_cflag &= ~CSIZE;
  tio.c_cflag |= CS8;

  ::cfsetispeed(&tio, B19200);
  ::cfsetospeed(&tio, B19200);

  if (::tcsetattr(fd, TCSANOW, &tio) != 0)
  {
    ::close(fd);
    return Error::TRANSPORT_FATAL;
  }

  ::tcflush(fd, TCIOFLUSH);

  fd_ = fd;
  closed_ = false;
  return Error::OK;
}

Error SerialTransport::write(const uint8_t* data, size_t len)
{
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (closed_)
  {
    return Error::TRANSPORT_FATAL;
  }

  size_t pos = 0;
  while (pos < len)
  {
    const ssize_t n = ::write(fd_, data + pos, len - pos);
    if (n < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK)
      {
        pollfd pfd = {fd_, POLLOUT, 0};
        if (::poll(&pfd, 1, 100) < 0 && errno != EINTR)
        {
          return Error::TRANSPORT_FATAL;
        }
        continue;
      }
      return Error::TRANSPORT_FATAL;
    }
    pos += static_cast<size_t>(n);
  }

  // Half-duplex link: the request must be on the wire before the response
  // window starts
  while (::tcdrain(fd_) != 0)
  {
    if (errno != EINTR)
    {
      return Error::TRANSPORT_FATAL;
    }
  }
  return Error::OK;
}

Error SerialTransport::read(uint8_t* buf, size_t max, uint32_t timeout_ms, size_t& received)
{
  received = 0;

  pollfd pfds[2];
  {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (closed_)
    {
      return Error::TRANSPORT_FATAL;
    }
    pfds[0] = {fd_, POLLIN, 0};
    pfds[1] = {wake_[0], POLLIN, 0};
  }

  // Not locked while waiting, so close() can get in and wake us
  int ready = 0;
  do
  {
    ready = ::poll(pfds, 2, static_cast<int>(timeout_ms));
  } while (ready < 0 && errno == EINTR);

  std::lock_guard<std::mutex> lock(io_mutex_);
  if (closed_ || pfds[1].revents != 0)
  {
    return Error::TRANSPORT_FATAL;
  }
  if (ready < 0 || (pfds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) != 0)
  {
    return Error::TRANSPORT_FATAL;
  }
  if (ready == 0)
  {
    return Error::TIMEOUT;
  }

  const ssize_t n = ::read(fd_, buf, max);
  if (n < 0)
  {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
    {
      return Error::TIMEOUT;
    }
    return Error::TRANSPORT_FATAL;
  }
  if (n == 0)
  {
    return Error::TRANSPORT_FATAL;
  }

  received = static_cast<size_t>(n);
  return Error::OK;
}

void SerialTransport::discard_input()
{
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (!closed_)
  {
    ::tcflush(fd_, TCIFLUSH);
  }
}

void SerialTransport::close()
{
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (fd_ >= 0)
  {
    ::close(fd_);
  }
  fd_ = -1;
  closed_ = true;

  if (wake_[1] >= 0)
  {
    // A full pipe already holds a pending wake-up
    const uint8_t byte = 1;
    while (::write(wake_[1], &byte, 1) < 0 && errno == EINTR)
    {
    }
  }
}

}  // namespace link
}  // namespace mk312
