/**
 * @file roomba_sensor.hpp
 * @brief Logical sensor driver returning decoded OI readings.
 * @ingroup roomba_base
 */

#ifndef ROOMBA_BASE_ROOMBA_SENSOR_HPP__
#define ROOMBA_BASE_ROOMBA_SENSOR_HPP__

#include <memory>
#include <string>

#include <rclcpp/logger.hpp>

#include "roomba_base/connection_registry.hpp"
#include "roomba_base/protocol_client.hpp"
#include "roomba_base/sensor_decoder.hpp"

namespace roomba_base {

struct SensorConfig {
  std::string serial_port;

  /** @throws std::runtime_error if serial_port is empty. */
  void validate() const;
};

/**
 * @brief Polls the full sensor packet list on a shared connection.
 *
 * @ingroup roomba_base
 */
class RoombaSensor {
public:
  /**
   * @throws std::runtime_error for an invalid config.
   * @throws ConnectionError if the port cannot be opened.
   */
  RoombaSensor(ConnectionRegistry& registry, std::string name, const SensorConfig& config,
               const rclcpp::Logger& logger = rclcpp::get_logger("roomba_sensor"));
  ~RoombaSensor();

  RoombaSensor(const RoombaSensor&) = delete;
  RoombaSensor& operator=(const RoombaSensor&) = delete;

  const std::string& name() const { return name_; }

  /**
   * @brief Query and decode every packet in kSensorPackets.
   *
   * @throws TransportError, ProtocolError on a failed or malformed exchange.
   * @throws std::logic_error after close().
   */
  Readings readings();

  /** @brief Release the connection. Idempotent. */
  void close();

private:
  ConnectionRegistry& registry_;
  std::string name_;
  std::string port_;
  rclcpp::Logger logger_;

  std::unique_ptr<ProtocolClient> client_;
};

}  // namespace roomba_base

#endif  // ROOMBA_BASE_ROOMBA_SENSOR_HPP__
