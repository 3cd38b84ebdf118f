/**
 * @file serial_transport.cpp
 * @brief termios-backed Transport for Linux serial devices.
 * @ingroup roomba_base
 */

#include "roomba_base/transport.hpp"

#include "roomba_base/errors.hpp"
#include "roomba_base/oi_protocol.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace roomba_base {

namespace {

/**
 * @brief Convert integer baud rate to termios speed_t.
 * @throws std::runtime_error if unsupported baud rate.
 */
speed_t toSpeed(int baud) {
  switch (baud) {
    case 57600:  return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    case 921600: return B921600;
    default: throw std::runtime_error("Unsupported baud rate " + std::to_string(baud));
  }
}

std::string errnoText() {
  return std::string(std::strerror(errno));
}

}  // namespace

SerialTransport::SerialTransport(const std::string& port, int baud) : port_(port) {
  fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY | O_SYNC);
  if (fd_ < 0) {
    throw std::runtime_error("SerialTransport: failed to open " + port_ + ": " + errnoText());
  }

  termios tty{};
  if (tcgetattr(fd_, &tty) != 0) {
    const std::string err = errnoText();
    close();
    throw std::runtime_error("SerialTransport: tcgetattr failed on " + port_ + ": " + err);
  }
  cfmakeraw(&tty);

  const speed_t spd = toSpeed(baud);
  cfsetispeed(&tty, spd);
  cfsetospeed(&tty, spd);

  tty.c_cflag |= (CLOCAL | CREAD); // ignore modem controls, enable reading
  tty.c_cflag &= ~CRTSCTS;         // no hardware flow control
  tty.c_cflag &= ~CSTOPB;          // 1 stop bit
  tty.c_cflag &= ~PARENB;          // no parity
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;

  // Block for the first byte until setReadTimeout() says otherwise.
  tty.c_cc[VMIN]  = 1;
  tty.c_cc[VTIME] = 0;

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    const std::string err = errnoText();
    close();
    throw std::runtime_error("SerialTransport: tcsetattr failed on " + port_ + ": " + err);
  }
}

SerialTransport::~SerialTransport() {
  close();
}

void SerialTransport::write(const uint8_t* data, std::size_t n) {
  if (fd_ < 0) {
    throw TransportError("write on " + port_ + ": port is closed");
  }

  std::size_t sent = 0;
  while (sent < n) {
    const ssize_t w = ::write(fd_, data + sent, n - sent);
    if (w < 0) {
      if (errno == EINTR) continue;
      throw TransportError("write on " + port_ + " failed: " + errnoText());
    }
    sent += static_cast<std::size_t>(w);
  }
}

std::size_t SerialTransport::read(uint8_t* data, std::size_t n) {
  if (fd_ < 0) {
    throw TransportError("read on " + port_ + ": port is closed");
  }

  while (true) {
    const ssize_t r = ::read(fd_, data, n);
    if (r < 0) {
      if (errno == EINTR) continue;
      throw TransportError("read on " + port_ + " failed: " + errnoText());
    }
    return static_cast<std::size_t>(r);
  }
}

void SerialTransport::setReadTimeout(std::chrono::milliseconds timeout) {
  termios tty{};
  if (tcgetattr(fd_, &tty) != 0) {
    throw TransportError("setReadTimeout on " + port_ + ": tcgetattr failed: " + errnoText());
  }

  const long deciseconds = std::max<long>(1, std::min<long>(255, timeout.count() / 100));
  tty.c_cc[VMIN]  = 0;
  tty.c_cc[VTIME] = static_cast<cc_t>(deciseconds);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    throw TransportError("setReadTimeout on " + port_ + ": tcsetattr failed: " + errnoText());
  }
}

void SerialTransport::flushReceiveBuffer() {
  if (tcflush(fd_, TCIFLUSH) != 0) {
    throw TransportError("flush on " + port_ + " failed: " + errnoText());
  }
}

void SerialTransport::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

std::unique_ptr<Transport> openSerialTransport(const std::string& port) {
  return std::make_unique<SerialTransport>(port, kDefaultBaud);
}

}  // namespace roomba_base
