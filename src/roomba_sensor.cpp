#include "roomba_base/roomba_sensor.hpp"

#include <stdexcept>
#include <utility>

#include <rclcpp/logging.hpp>

namespace roomba_base {

void SensorConfig::validate() const {
  if (serial_port.empty()) {
    throw std::runtime_error("serial_port is required");
  }
}

RoombaSensor::RoombaSensor(ConnectionRegistry& registry, std::string name,
                           const SensorConfig& config, const rclcpp::Logger& logger)
: registry_(registry), name_(std::move(name)), port_(config.serial_port), logger_(logger)
{
  config.validate();
  client_ = std::make_unique<ProtocolClient>(registry_.acquire(port_));
  RCLCPP_INFO(logger_, "Roomba sensor initialized on %s", port_.c_str());
}

RoombaSensor::~RoombaSensor() {
  close();
}

Readings RoombaSensor::readings() {
  if (!client_) {
    throw std::logic_error("sensor " + name_ + " is closed");
  }
  return client_->readSensors();
}

void RoombaSensor::close() {
  if (!client_) {
    return;
  }
  client_.reset();
  registry_.release(port_);
}

}  // namespace roomba_base
