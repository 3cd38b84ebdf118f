#pragma once
/**
 * @file roomba_base_node.hpp
 * @brief ROS 2 node that drives a Roomba over the Open Interface.
 *
 * ## Overview
 * One node hosts a base driver and a sensor driver on the same serial port;
 * both share a single Connection from the process ConnectionRegistry.
 *
 * This node:
 * - Converts geometry_msgs/Twist on `cmd_vel` into OI DRIVE commands
 * - Stops the base once if cmd_vel goes stale (watchdog)
 * - Runs named OI commands received as std_msgs/String on `oi_command`
 *   (enter_full_mode, enter_safe_mode, seek_dock, clean, stop)
 * - Publishes decoded sensor readings as diagnostic_msgs/DiagnosticArray
 * - Stops the base and releases the port on shutdown
 */

#include <rclcpp/rclcpp.hpp>
#include <geometry_msgs/msg/twist.hpp>
#include <std_msgs/msg/string.hpp>
#include <diagnostic_msgs/msg/diagnostic_array.hpp>

#include <memory>
#include <string>

#include "roomba_base/connection_registry.hpp"
#include "roomba_base/roomba_base.hpp"
#include "roomba_base/roomba_sensor.hpp"

namespace roomba_base {

/**
 * @brief ROS 2 front end for RoombaBase and RoombaSensor.
 */
class RoombaBaseNode final : public rclcpp::Node {
public:
  /**
   * @param registry Process-wide registry; must outlive the node.
   *
   * @throws std::runtime_error on invalid parameters.
   * @throws ConnectionError if the port cannot be brought up.
   */
  RoombaBaseNode(std::shared_ptr<ConnectionRegistry> registry,
                 const rclcpp::NodeOptions& options = rclcpp::NodeOptions());
  ~RoombaBaseNode() override;

  RoombaBaseNode(const RoombaBaseNode&) = delete;
  RoombaBaseNode& operator=(const RoombaBaseNode&) = delete;

private:
  void onCmdVel(const geometry_msgs::msg::Twist& msg);
  void onCommand(const std_msgs::msg::String& msg);
  void checkWatchdog();
  void publishReadings();

  // === Parameters ===
  std::string serial_port_;
  int width_mm_{kDefaultWidthMm};
  int wheel_circumference_mm_{kDefaultWheelCircumferenceMm};
  double cmd_timeout_{0.5};
  double readings_period_{1.0};

  // === Drivers ===
  std::shared_ptr<ConnectionRegistry> registry_;
  std::unique_ptr<RoombaBase> base_;
  std::unique_ptr<RoombaSensor> sensor_;

  // === Watchdog state ===
  rclcpp::Time last_cmd_time_;
  bool driving_{false};

  // ROS interfaces
  rclcpp::Subscription<geometry_msgs::msg::Twist>::SharedPtr cmd_sub_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr command_sub_;
  rclcpp::Publisher<diagnostic_msgs::msg::DiagnosticArray>::SharedPtr diag_pub_;
  rclcpp::TimerBase::SharedPtr watchdog_timer_;
  rclcpp::TimerBase::SharedPtr readings_timer_;
};

}  // namespace roomba_base
