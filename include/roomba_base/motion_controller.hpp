/**
 * @file motion_controller.hpp
 * @brief Open-loop timed motion for a differential-drive OI base.
 *
 * Kinematic requests (straight distance, spin angle, linear+angular velocity,
 * normalized power) are reduced to a single OI DRIVE command. Distance and
 * angle requests then block for the expected duration and always finish with
 * a stop, since the device never reports that a movement is complete.
 *
 * @ingroup roomba_base
 */

#ifndef ROOMBA_BASE_MOTION_CONTROLLER_HPP__
#define ROOMBA_BASE_MOTION_CONTROLLER_HPP__

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>

#include <rclcpp/logger.hpp>

#include "roomba_base/cancellation.hpp"
#include "roomba_base/protocol_client.hpp"

namespace roomba_base {

/** @brief Plain 3-vector. Forward is +y, counter-clockwise is +z. */
struct Vector3 {
  double x{0.0};
  double y{0.0};
  double z{0.0};
};

/** @brief Static shape of the base. */
struct RobotGeometry {
  int width_mm{235};
  int wheel_circumference_mm{220};
};

/** @brief Wire-level DRIVE arguments. */
struct DriveCommand {
  int16_t velocity_mmps{0};
  int16_t radius_mm{0};

  bool isStop() const { return velocity_mmps == 0 && radius_mm == 0; }
  bool operator==(const DriveCommand& o) const {
    return velocity_mmps == o.velocity_mmps && radius_mm == o.radius_mm;
  }
};

struct StraightMotion {
  int distance_mm{0};
  double speed_mmps{0.0};
};

struct SpinMotion {
  double angle_deg{0.0};
  double speed_degps{0.0};
};

struct VelocityMotion {
  double linear_mmps{0.0};
  double angular_degps{0.0};
};

struct StopMotion {};

using MotionRequest = std::variant<StraightMotion, SpinMotion, VelocityMotion, StopMotion>;

/**
 * @brief A request reduced to what will be sent and how long it runs.
 */
struct MotionPlan {
  DriveCommand command;
  double duration_s{0.0};  ///< Only meaningful when blocking.
  bool blocking{false};    ///< Wait duration_s then stop.
  bool clamped{false};     ///< Requested velocity exceeded +-500 mm/s.
  double requested_velocity_mmps{0.0};
};

/** @brief Wire velocity for spinning in place; the device ignores its magnitude. */
static constexpr int16_t kSpinVelocityMmps = 100;

/** @brief Requested velocity above this magnitude counts as moving. */
static constexpr int kMovingThresholdMmps = 5;

/**
 * @brief Reduce a motion request to a DRIVE command.
 *
 * Pure; performs no I/O and no logging.
 */
MotionPlan planMotion(const MotionRequest& request, const RobotGeometry& geometry);

/**
 * @brief Scale normalized power ([-1, 1] on linear.y and angular.z) to a
 * velocity request. Full angular power gives the same wheel speed as full
 * linear power.
 */
VelocityMotion powerToVelocity(const Vector3& linear, const Vector3& angular,
                               const RobotGeometry& geometry);

enum class MotionState { Idle, Driving, Stopping };

/** @brief How a motion call ended. */
enum class MotionOutcome {
  Completed,
  Superseded,        ///< A newer request replaced this one.
  Cancelled,         ///< The caller's token was cancelled.
  DeadlineExceeded,  ///< The caller's token deadline came first.
  Shutdown,          ///< The controller was closed.
};

const char* toString(MotionOutcome outcome);

/**
 * @brief The single in-flight motion of a MotionController.
 */
class MotionOperation {
public:
  using Clock = std::chrono::steady_clock;

  /** @brief Interrupt the wait. The first reason sticks. */
  void cancel(MotionOutcome reason);

  std::optional<MotionOutcome> cancelReason() const;

  /**
   * @brief Block until @p deadline or cancellation.
   * @return The cancel reason, or nullopt if the deadline passed first.
   */
  std::optional<MotionOutcome> waitUntil(Clock::time_point deadline);

  void markDone();
  void waitDone();

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::optional<MotionOutcome> reason_;
  bool done_{false};
};

/**
 * @brief Executes motion requests on one base, one at a time.
 *
 * A new request cancels the in-flight one and waits until it has issued its
 * stop before sending its own DRIVE, so two drive commands from this
 * controller are never in flight together.
 *
 * @ingroup roomba_base
 */
class MotionController {
public:
  MotionController(ProtocolClient& client, const RobotGeometry& geometry,
                   const rclcpp::Logger& logger);
  ~MotionController();

  MotionController(const MotionController&) = delete;
  MotionController& operator=(const MotionController&) = delete;

  /**
   * @brief Run any motion request.
   *
   * Blocking requests race the duration timer against @p token (cancel and
   * deadline), a superseding request, and close(); whichever fires first ends
   * the wait, and a stop is sent before returning.
   *
   * @throws TransportError if a DRIVE or the final stop cannot be written.
   */
  MotionOutcome execute(const MotionRequest& request,
                        const CancellationToken& token = CancellationToken());

  MotionOutcome moveStraight(int distance_mm, double speed_mmps,
                             const CancellationToken& token = CancellationToken());

  MotionOutcome spin(double angle_deg, double speed_degps,
                     const CancellationToken& token = CancellationToken());

  /** @brief Non-blocking. linear.y in mm/s, angular.z in deg/s. */
  MotionOutcome setVelocity(const Vector3& linear, const Vector3& angular);

  /** @brief Non-blocking. linear.y and angular.z in [-1, 1]. */
  MotionOutcome setPower(const Vector3& linear, const Vector3& angular);

  MotionOutcome stop();

  /**
   * @brief Cancel the in-flight operation, if any, and wait for its stop.
   */
  void cancelCurrent();

  /**
   * @brief Whether the base was last commanded to move.
   *
   * Reads packet 39 (requested velocity). This reflects the last command the
   * device accepted, not measured wheel motion: a stalled or lifted robot
   * still reports moving.
   *
   * @throws TransportError, ProtocolError on query failure.
   */
  bool isMoving();

  MotionState state() const { return state_.load(); }

  const RobotGeometry& geometry() const { return geometry_; }

  /**
   * @brief Cancel any in-flight motion, send a final stop, reject further
   * requests. A failing stop is logged, not thrown. Idempotent.
   */
  void close();

private:
  friend class OperationGuard;

  std::shared_ptr<MotionOperation> beginOperation();
  void finishOperation(const std::shared_ptr<MotionOperation>& op);
  MotionOutcome runBlocking(const std::shared_ptr<MotionOperation>& op,
                            const MotionPlan& plan, const CancellationToken& token);
  void issue(const DriveCommand& cmd);

  ProtocolClient& client_;
  RobotGeometry geometry_;
  rclcpp::Logger logger_;

  std::mutex slot_mtx_;
  std::shared_ptr<MotionOperation> current_;

  CancellationToken shutdown_;
  std::atomic<bool> closed_{false};
  std::atomic<MotionState> state_{MotionState::Idle};
};

}  // namespace roomba_base

#endif  // ROOMBA_BASE_MOTION_CONTROLLER_HPP__
