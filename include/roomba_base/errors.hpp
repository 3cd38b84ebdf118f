/**
 * @file errors.hpp
 * @brief Exception types raised by the Roomba OI driver.
 * @ingroup roomba_base
 */

#ifndef ROOMBA_BASE_ERRORS_HPP__
#define ROOMBA_BASE_ERRORS_HPP__

#include <stdexcept>
#include <string>

namespace roomba_base {

/**
 * @brief Port could not be opened or the OI could not be brought up on it.
 *
 * Fatal to driver construction; never retried automatically.
 */
class ConnectionError : public std::runtime_error {
public:
  explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Write or read failure on an already established connection.
 */
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Malformed or incomplete response from the device.
 */
class ProtocolError : public std::runtime_error {
public:
  enum class Kind {
    ShortRead,      ///< Fewer bytes than expected arrived before the read timeout.
    CountMismatch,  ///< Number of decoded segments differs from the request.
  };

  ProtocolError(Kind kind, const std::string& what)
  : std::runtime_error(what), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

/**
 * @brief Caller asked for a command name the driver does not know.
 */
class UnknownCommand : public std::runtime_error {
public:
  explicit UnknownCommand(const std::string& name)
  : std::runtime_error("unknown command: " + name), name_(name) {}

  const std::string& name() const { return name_; }

private:
  std::string name_;
};

}  // namespace roomba_base

#endif  // ROOMBA_BASE_ERRORS_HPP__
