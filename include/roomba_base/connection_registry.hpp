/**
 * @file connection_registry.hpp
 * @brief Ref-counted sharing of one serial connection between logical drivers.
 * @ingroup roomba_base
 */

#ifndef ROOMBA_BASE_CONNECTION_REGISTRY_HPP__
#define ROOMBA_BASE_CONNECTION_REGISTRY_HPP__

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <rclcpp/logger.hpp>

#include "roomba_base/transport.hpp"

namespace roomba_base {

/** @brief Read timeout applied to every freshly opened port. */
static constexpr std::chrono::milliseconds kDefaultReadTimeout{2000};

/**
 * @brief One physical port: its transport plus the lock that serializes it.
 *
 * Every protocol exchange (send and the matching read) holds mutex() for its
 * whole duration. The transport is closed when the last owner drops the
 * Connection.
 *
 * @ingroup roomba_base
 */
class Connection {
public:
  Connection(std::string port, std::unique_ptr<Transport> transport);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  const std::string& port() const { return port_; }

  /** @brief Transport; only touch it while holding mutex(). */
  Transport& transport() { return *transport_; }

  std::mutex& mutex() { return mtx_; }

private:
  friend class ConnectionRegistry;

  std::string port_;
  std::unique_ptr<Transport> transport_;
  std::mutex mtx_;

  // Guarded by the owning registry's lock.
  int refs_{0};
};

/**
 * @brief Factory used by the registry to open a port.
 *
 * May throw any std::exception; the registry reports it as ConnectionError.
 */
using TransportFactory = std::function<std::unique_ptr<Transport>(const std::string& port)>;

/**
 * @brief Process-wide map from port identifier to a shared Connection.
 *
 * Construct one at process start and hand it to every driver. The registry
 * lock is held only for map lookups and mutations, never across device I/O.
 *
 * @ingroup roomba_base
 */
class ConnectionRegistry {
public:
  explicit ConnectionRegistry(
    TransportFactory factory = openSerialTransport,
    std::chrono::milliseconds read_timeout = kDefaultReadTimeout,
    const rclcpp::Logger& logger = rclcpp::get_logger("roomba_base.connections"));

  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  /**
   * @brief Share the Connection for @p port, opening it on first use.
   *
   * A new port is opened through the factory, sent START (enter Passive mode)
   * and configured with the read timeout before it is published.
   *
   * @throws ConnectionError if the port cannot be opened or START fails.
   */
  std::shared_ptr<Connection> acquire(const std::string& port);

  /**
   * @brief Drop one reference to @p port. Unknown ports are ignored.
   *
   * @return true if this released the last reference and the entry was removed.
   */
  bool release(const std::string& port);

  /** @brief Current reference count for @p port, 0 if not registered. */
  int refCount(const std::string& port) const;

  /** @brief Number of registered ports. */
  std::size_t size() const;

  /**
   * @brief Forget every entry. Connections still held by drivers stay open
   * until those drivers drop them.
   */
  void shutdown();

private:
  std::shared_ptr<Connection> open(const std::string& port);

  TransportFactory factory_;
  std::chrono::milliseconds read_timeout_;
  rclcpp::Logger logger_;

  mutable std::mutex mtx_;
  std::map<std::string, std::shared_ptr<Connection>> connections_;
};

}  // namespace roomba_base

#endif  // ROOMBA_BASE_CONNECTION_REGISTRY_HPP__
