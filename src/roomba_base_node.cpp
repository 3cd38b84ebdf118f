#include "roomba_base/roomba_base_node.hpp"

#include <diagnostic_msgs/msg/diagnostic_status.hpp>
#include <diagnostic_msgs/msg/key_value.hpp>

#include <chrono>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

#include "roomba_base/errors.hpp"

using namespace std::chrono_literals;

namespace roomba_base {

RoombaBaseNode::RoombaBaseNode(std::shared_ptr<ConnectionRegistry> registry,
                               const rclcpp::NodeOptions& options)
: rclcpp::Node("roomba_base", options), registry_(std::move(registry)) {

  // === Serial / geometry parameters ===
  serial_port_            = declare_parameter<std::string>("serial_port", "");
  width_mm_               = declare_parameter<int>("width_mm", kDefaultWidthMm);
  wheel_circumference_mm_ = declare_parameter<int>("wheel_circumference_mm",
                                                   kDefaultWheelCircumferenceMm);

  // === Node behaviour ===
  cmd_timeout_     = declare_parameter<double>("cmd_timeout_sec", 0.5);
  readings_period_ = declare_parameter<double>("readings_period_sec", 1.0);

  if (serial_port_.empty()) {
    throw std::runtime_error("serial_port parameter is required");
  }
  if (cmd_timeout_ <= 0.0) {
    throw std::runtime_error("cmd_timeout_sec must be > 0");
  }
  if (readings_period_ <= 0.0) {
    throw std::runtime_error("readings_period_sec must be > 0");
  }

  BaseConfig base_cfg;
  base_cfg.serial_port = serial_port_;
  base_cfg.width_mm = width_mm_;
  base_cfg.wheel_circumference_mm = wheel_circumference_mm_;

  SensorConfig sensor_cfg;
  sensor_cfg.serial_port = serial_port_;

  base_ = std::make_unique<RoombaBase>(*registry_, "base", base_cfg,
                                       get_logger().get_child("base"));
  sensor_ = std::make_unique<RoombaSensor>(*registry_, "sensor", sensor_cfg,
                                           get_logger().get_child("sensor"));

  cmd_sub_ = create_subscription<geometry_msgs::msg::Twist>(
    "cmd_vel", rclcpp::QoS(10),
    [this](geometry_msgs::msg::Twist::SharedPtr msg) { onCmdVel(*msg); });

  command_sub_ = create_subscription<std_msgs::msg::String>(
    "oi_command", rclcpp::QoS(10),
    [this](std_msgs::msg::String::SharedPtr msg) { onCommand(*msg); });

  diag_pub_ = create_publisher<diagnostic_msgs::msg::DiagnosticArray>("/diagnostics", rclcpp::QoS(10));

  last_cmd_time_ = now();
  watchdog_timer_ = create_wall_timer(50ms, std::bind(&RoombaBaseNode::checkWatchdog, this));
  readings_timer_ = create_wall_timer(
    std::chrono::duration<double>(readings_period_),
    std::bind(&RoombaBaseNode::publishReadings, this));

  const BaseProperties props = base_->properties();
  RCLCPP_INFO(get_logger(),
    "Started on %s: width=%.3fm wheel_circumference=%.3fm cmd_timeout=%.2fs readings every %.2fs",
    serial_port_.c_str(), props.width_m, props.wheel_circumference_m,
    cmd_timeout_, readings_period_);
}

RoombaBaseNode::~RoombaBaseNode() {
  watchdog_timer_.reset();
  readings_timer_.reset();

  // Both close() calls log their own failures and always release the port.
  if (sensor_) sensor_->close();
  if (base_) base_->close();
}

void RoombaBaseNode::onCmdVel(const geometry_msgs::msg::Twist& msg) {
  last_cmd_time_ = now();

  // ROS: +x forward in m/s, +z counter-clockwise in rad/s.
  Vector3 linear;
  linear.y = msg.linear.x * 1000.0;
  Vector3 angular;
  angular.z = msg.angular.z * 180.0 / M_PI;

  try {
    base_->setVelocity(linear, angular);
    driving_ = linear.y != 0.0 || angular.z != 0.0;
  } catch (const std::exception& e) {
    RCLCPP_ERROR(get_logger(), "cmd_vel failed: %s", e.what());
  }

  RCLCPP_DEBUG_THROTTLE(get_logger(), *get_clock(), 1000,
    "cmd_vel received: v=%.1f mm/s w=%.1f deg/s", linear.y, angular.z);
}

void RoombaBaseNode::onCommand(const std_msgs::msg::String& msg) {
  try {
    const CommandResult result = base_->doCommand(msg.data);
    const auto it = result.find("status");
    RCLCPP_INFO(get_logger(), "Command %s: %s", msg.data.c_str(),
                it == result.end() ? "ok" : it->second.c_str());
    if (msg.data == "stop") {
      driving_ = false;
    }
  } catch (const UnknownCommand& e) {
    RCLCPP_WARN(get_logger(), "%s", e.what());
  } catch (const std::exception& e) {
    RCLCPP_ERROR(get_logger(), "Command %s failed: %s", msg.data.c_str(), e.what());
  }
}

void RoombaBaseNode::checkWatchdog() {
  if (!driving_) {
    return;
  }
  if ((now() - last_cmd_time_).seconds() <= cmd_timeout_) {
    return;
  }

  driving_ = false;
  RCLCPP_WARN(get_logger(), "cmd_vel stale for %.2fs, stopping base", cmd_timeout_);
  try {
    base_->stop();
  } catch (const std::exception& e) {
    RCLCPP_ERROR(get_logger(), "Watchdog stop failed: %s", e.what());
  }
}

void RoombaBaseNode::publishReadings() {
  diagnostic_msgs::msg::DiagnosticArray arr;
  arr.header.stamp = now();

  diagnostic_msgs::msg::DiagnosticStatus st;
  st.name = "roomba_base";
  st.hardware_id = serial_port_;

  auto kv = [&](const std::string& k, const std::string& v) {
    diagnostic_msgs::msg::KeyValue x;
    x.key = k;
    x.value = v;
    st.values.push_back(x);
  };

  try {
    const Readings readings = sensor_->readings();
    for (const auto& r : readings) {
      kv(r.first, toString(r.second));
    }
    kv("is_moving", base_->isMoving() ? "true" : "false");

    st.level = diagnostic_msgs::msg::DiagnosticStatus::OK;
    st.message = "Readings OK";
  } catch (const std::exception& e) {
    st.level = diagnostic_msgs::msg::DiagnosticStatus::ERROR;
    st.message = e.what();
    RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 5000, "Sensor read failed: %s", e.what());
  }

  arr.status.push_back(st);
  diag_pub_->publish(arr);
}

}  // namespace roomba_base
