/**
 * @file transport.hpp
 * @brief Byte-stream transport abstraction and the Linux serial implementation.
 *
 * The OI driver talks to the robot through a Transport so that the protocol
 * and motion logic never touch termios directly and can be exercised against
 * an in-memory link in tests.
 *
 * @ingroup roomba_base
 */

#ifndef ROOMBA_BASE_TRANSPORT_HPP__
#define ROOMBA_BASE_TRANSPORT_HPP__

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace roomba_base {

/**
 * @defgroup roomba_base Roomba OI Base Drivers
 * @brief Serial-link drivers for robots speaking the Roomba Open Interface.
 */

/**
 * @brief Capability interface over one physical byte-stream port.
 *
 * Implementations must make read() return after a bounded wait, possibly with
 * zero bytes, once setReadTimeout() has been called. Callers serialize access
 * themselves (see Connection); implementations need not be thread-safe.
 *
 * @ingroup roomba_base
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * @brief Write all @p n bytes, blocking until done.
   *
   * @throws TransportError on write failure.
   */
  virtual void write(const uint8_t* data, std::size_t n) = 0;

  /**
   * @brief Read up to @p n bytes.
   *
   * @return Number of bytes read; 0 when the read timeout elapsed with no data.
   *
   * @throws TransportError on read failure.
   */
  virtual std::size_t read(uint8_t* data, std::size_t n) = 0;

  /**
   * @brief Bound the time a single read() may block waiting for the first byte.
   *
   * @throws TransportError if the port cannot be reconfigured.
   */
  virtual void setReadTimeout(std::chrono::milliseconds timeout) = 0;

  /**
   * @brief Discard any bytes received but not yet read.
   *
   * @throws TransportError if the receive buffer cannot be flushed.
   */
  virtual void flushReceiveBuffer() = 0;

  /** @brief Release the underlying device handle. Idempotent. */
  virtual void close() = 0;
};

/**
 * @brief Raw 8N1 serial port opened through termios.
 *
 * Owns the file descriptor (RAII) and is non-copyable.
 *
 * @ingroup roomba_base
 */
class SerialTransport final : public Transport {
public:
  /**
   * @brief Open and configure a serial device.
   *
   * @param port Device node, e.g. "/dev/ttyUSB0".
   * @param baud One of 57600, 115200, 230400, 921600.
   *
   * @throws std::runtime_error if the device cannot be opened or configured.
   */
  SerialTransport(const std::string& port, int baud);
  ~SerialTransport() override;

  SerialTransport(const SerialTransport&) = delete;
  SerialTransport& operator=(const SerialTransport&) = delete;

  void write(const uint8_t* data, std::size_t n) override;
  std::size_t read(uint8_t* data, std::size_t n) override;

  /**
   * @brief Apply VMIN=0 / VTIME=timeout (deciseconds, clamped to [1, 255]).
   *
   * With VMIN=0 and VTIME=N the kernel waits up to N*100ms for the first byte
   * and returns 0 bytes if nothing arrives.
   */
  void setReadTimeout(std::chrono::milliseconds timeout) override;
  void flushReceiveBuffer() override;
  void close() override;

private:
  std::string port_;
  int fd_{-1};
};

/**
 * @brief Default transport factory: a SerialTransport at the OI baud rate.
 */
std::unique_ptr<Transport> openSerialTransport(const std::string& port);

}  // namespace roomba_base

#endif  // ROOMBA_BASE_TRANSPORT_HPP__
