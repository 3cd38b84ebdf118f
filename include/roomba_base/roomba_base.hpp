/**
 * @file roomba_base.hpp
 * @brief Logical base driver: motion, OI mode commands and physical properties.
 * @ingroup roomba_base
 */

#ifndef ROOMBA_BASE_ROOMBA_BASE_HPP__
#define ROOMBA_BASE_ROOMBA_BASE_HPP__

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <rclcpp/logger.hpp>

#include "roomba_base/connection_registry.hpp"
#include "roomba_base/motion_controller.hpp"
#include "roomba_base/protocol_client.hpp"

namespace roomba_base {

/** @brief Default wheelbase of a 600-series Roomba, mm. */
static constexpr int kDefaultWidthMm = 235;

/** @brief Default wheel circumference, mm. */
static constexpr int kDefaultWheelCircumferenceMm = 220;

/** @brief Radius of the sphere approximating the 340 mm round body, mm. */
static constexpr double kBodyRadiusMm = 170.0;

/**
 * @brief Base driver configuration.
 *
 * Zero for width_mm or wheel_circumference_mm selects the default.
 */
struct BaseConfig {
  std::string serial_port;
  int width_mm{0};
  int wheel_circumference_mm{0};

  /**
   * @throws std::runtime_error naming the first invalid field.
   */
  void validate() const;

  /** @brief Geometry with defaults filled in. */
  RobotGeometry geometry() const;
};

/** @brief Physical properties reported to callers, in meters. */
struct BaseProperties {
  double width_m{0.0};
  double turning_radius_m{0.0};
  double wheel_circumference_m{0.0};
};

/** @brief Sphere centred on the base origin. */
struct SphereGeometry {
  std::string label;
  double radius_mm{0.0};
};

/** @brief Result of a named command, e.g. {"status": "seeking_dock"}. */
using CommandResult = std::map<std::string, std::string>;

/**
 * @brief One logical differential-drive base on a shared OI connection.
 *
 * Construction acquires the port's Connection and enters Safe mode; close()
 * (or destruction) stops the robot and releases the reference. Several
 * drivers may sit on the same port.
 *
 * @ingroup roomba_base
 */
class RoombaBase {
public:
  /**
   * @throws std::runtime_error for an invalid config.
   * @throws ConnectionError if the port cannot be opened or Safe mode fails.
   */
  RoombaBase(ConnectionRegistry& registry, std::string name, const BaseConfig& config,
             const rclcpp::Logger& logger = rclcpp::get_logger("roomba_base"));
  ~RoombaBase();

  RoombaBase(const RoombaBase&) = delete;
  RoombaBase& operator=(const RoombaBase&) = delete;

  const std::string& name() const { return name_; }

  /**
   * @throws std::logic_error after close().
   */
  MotionController& motion();

  MotionOutcome moveStraight(int distance_mm, double speed_mmps,
                             const CancellationToken& token = CancellationToken()) {
    return motion().moveStraight(distance_mm, speed_mmps, token);
  }

  MotionOutcome spin(double angle_deg, double speed_degps,
                     const CancellationToken& token = CancellationToken()) {
    return motion().spin(angle_deg, speed_degps, token);
  }

  MotionOutcome setVelocity(const Vector3& linear, const Vector3& angular) {
    return motion().setVelocity(linear, angular);
  }

  MotionOutcome setPower(const Vector3& linear, const Vector3& angular) {
    return motion().setPower(linear, angular);
  }

  MotionOutcome stop() { return motion().stop(); }

  bool isMoving() { return motion().isMoving(); }

  /**
   * @brief Run a named command.
   *
   * Known names: enter_full_mode, enter_safe_mode, seek_dock, clean, stop.
   * Mode, dock and clean commands first cancel any in-flight motion.
   *
   * @throws UnknownCommand before any I/O for other names.
   * @throws TransportError if the command cannot be sent.
   */
  CommandResult doCommand(const std::string& command);

  BaseProperties properties() const;
  std::vector<SphereGeometry> geometries() const;

  /**
   * @brief Stop, release the registry reference. Idempotent; never throws.
   *
   * The controller and client stay allocated until destruction, so a call
   * racing close() sees Shutdown rather than a dead object.
   */
  void close();

private:
  ConnectionRegistry& registry_;
  std::string name_;
  std::string port_;
  RobotGeometry geometry_;
  rclcpp::Logger logger_;

  std::shared_ptr<Connection> conn_;
  std::unique_ptr<ProtocolClient> client_;
  std::unique_ptr<MotionController> motion_;
  std::atomic<bool> closed_{false};
};

}  // namespace roomba_base

#endif  // ROOMBA_BASE_ROOMBA_BASE_HPP__
