#include "roomba_base/roomba_base.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <rclcpp/logging.hpp>

#include "roomba_base/errors.hpp"

namespace roomba_base {

void BaseConfig::validate() const {
  if (serial_port.empty()) {
    throw std::runtime_error("serial_port is required");
  }
  if (width_mm < 0) {
    throw std::runtime_error("width_mm must be a positive number");
  }
  if (wheel_circumference_mm < 0) {
    throw std::runtime_error("wheel_circumference_mm must be a positive number");
  }
}

RobotGeometry BaseConfig::geometry() const {
  RobotGeometry g;
  g.width_mm = width_mm == 0 ? kDefaultWidthMm : width_mm;
  g.wheel_circumference_mm =
    wheel_circumference_mm == 0 ? kDefaultWheelCircumferenceMm : wheel_circumference_mm;
  return g;
}

RoombaBase::RoombaBase(ConnectionRegistry& registry, std::string name, const BaseConfig& config,
                       const rclcpp::Logger& logger)
: registry_(registry),
  name_(std::move(name)),
  port_(config.serial_port),
  geometry_(config.geometry()),
  logger_(logger)
{
  config.validate();

  conn_ = registry_.acquire(port_);
  client_ = std::make_unique<ProtocolClient>(conn_);

  try {
    client_->safe();
  } catch (const std::exception& e) {
    client_.reset();
    conn_.reset();
    registry_.release(port_);
    throw ConnectionError("failed to enter Safe mode on " + port_ + ": " + e.what());
  }

  motion_ = std::make_unique<MotionController>(*client_, geometry_, logger_);

  RCLCPP_INFO(logger_, "Roomba base initialized on %s (width: %dmm, wheel circumference: %dmm)",
              port_.c_str(), geometry_.width_mm, geometry_.wheel_circumference_mm);
}

RoombaBase::~RoombaBase() {
  close();
}

MotionController& RoombaBase::motion() {
  if (closed_.load()) {
    throw std::logic_error("base " + name_ + " is closed");
  }
  return *motion_;
}

CommandResult RoombaBase::doCommand(const std::string& command) {
  if (command != "stop" && command != "enter_full_mode" && command != "enter_safe_mode" &&
      command != "seek_dock" && command != "clean")
  {
    throw UnknownCommand(command);
  }

  MotionController& mc = motion();

  if (command == "stop") {
    mc.stop();
    return {{"status", "stopped"}};
  }

  // The device takes over the wheels for these; a pending timed stop must not follow.
  mc.cancelCurrent();

  if (command == "enter_full_mode") {
    client_->full();
    RCLCPP_INFO(logger_, "Entered Full mode (safety features disabled)");
    return {{"status", "full_mode_enabled"}};
  }
  if (command == "enter_safe_mode") {
    client_->safe();
    RCLCPP_INFO(logger_, "Entered Safe mode (safety features enabled)");
    return {{"status", "safe_mode_enabled"}};
  }
  if (command == "seek_dock") {
    client_->seekDock();
    RCLCPP_INFO(logger_, "Seeking charging dock");
    return {{"status", "seeking_dock"}};
  }

  client_->clean();
  RCLCPP_INFO(logger_, "Started cleaning mode");
  return {{"status", "cleaning"}};
}

BaseProperties RoombaBase::properties() const {
  BaseProperties p;
  p.width_m = geometry_.width_mm / 1000.0;
  p.turning_radius_m = 0.0;  // turns in place
  p.wheel_circumference_m = geometry_.wheel_circumference_mm / 1000.0;
  return p;
}

std::vector<SphereGeometry> RoombaBase::geometries() const {
  return {SphereGeometry{name_, kBodyRadiusMm}};
}

void RoombaBase::close() {
  if (closed_.exchange(true)) {
    return;
  }

  // MotionController::close() logs its own stop failure.
  motion_->close();
  registry_.release(port_);

  RCLCPP_INFO(logger_, "Roomba base closed");
}

}  // namespace roomba_base
