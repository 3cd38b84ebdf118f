/**
 * @file motion_controller.cpp
 * @brief Kinematic-to-OI mapping and single-operation motion execution.
 * @ingroup roomba_base
 */

#include "roomba_base/motion_controller.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include <rclcpp/logging.hpp>

#include "roomba_base/oi_protocol.hpp"

namespace roomba_base {

namespace {

/**
 * @brief Helper function to clamp a double value between lo and hi.
 */
static inline double clampd(double x, double lo, double hi) {
  return std::max(lo, std::min(hi, x));
}

// Longer waits overflow steady_clock arithmetic; nobody drives for a decade.
constexpr double kMaxWaitSec = 3.0e8;

MotionPlan stopPlan() {
  return MotionPlan{};
}

MotionPlan planStraight(const StraightMotion& m) {
  if (m.distance_mm == 0 || m.speed_mmps == 0.0) {
    return stopPlan();
  }

  MotionPlan plan;
  plan.blocking = true;
  plan.duration_s = std::abs(static_cast<double>(m.distance_mm) / m.speed_mmps);

  const double sign = m.distance_mm > 0 ? 1.0 : -1.0;
  const double mag = std::abs(m.speed_mmps);
  plan.requested_velocity_mmps = sign * mag;
  plan.clamped = mag > kMaxVelocityMmps;

  plan.command.velocity_mmps = static_cast<int16_t>(sign * std::min<double>(mag, kMaxVelocityMmps));
  plan.command.radius_mm = kRadiusStraight;
  return plan;
}

MotionPlan planSpin(const SpinMotion& m) {
  if (m.angle_deg == 0.0 || m.speed_degps == 0.0) {
    return stopPlan();
  }

  MotionPlan plan;
  plan.blocking = true;
  plan.duration_s = std::abs(m.angle_deg / m.speed_degps);
  // Positive angle turns left (counter-clockwise).
  plan.command.velocity_mmps = kSpinVelocityMmps;
  plan.command.radius_mm = m.angle_deg > 0.0 ? kRadiusSpinCcw : kRadiusSpinCw;
  plan.requested_velocity_mmps = kSpinVelocityMmps;
  return plan;
}

MotionPlan planVelocity(const VelocityMotion& m, const RobotGeometry& geometry) {
  const double linear = m.linear_mmps;
  const double angular = m.angular_degps;

  if (linear == 0.0 && angular == 0.0) {
    return stopPlan();
  }

  MotionPlan plan;

  if (linear == 0.0) {
    // Pure spin: wheel-tip speed for the requested rate, capped at max wheel speed.
    const double wheel_speed = std::abs(angular) * M_PI / 180.0 * geometry.width_mm / 2.0;
    plan.requested_velocity_mmps = wheel_speed;
    plan.command.velocity_mmps = static_cast<int16_t>(std::min<double>(kMaxVelocityMmps, wheel_speed));
    plan.command.radius_mm = angular > 0.0 ? kRadiusSpinCcw : kRadiusSpinCw;
    return plan;
  }

  plan.requested_velocity_mmps = linear;
  plan.clamped = std::abs(linear) > kMaxVelocityMmps;
  const int16_t velocity =
    static_cast<int16_t>(clampd(linear, -kMaxVelocityMmps, kMaxVelocityMmps));
  plan.command.velocity_mmps = velocity;

  if (angular == 0.0) {
    plan.command.radius_mm = kRadiusStraight;
    return plan;
  }

  // v = w * r  =>  r = v / w, with w converted to rad/s.
  const double radius = clampd((static_cast<double>(velocity) * 180.0) / (angular * M_PI),
                               -kMaxRadiusMm, kMaxRadiusMm);
  int16_t wire_radius = static_cast<int16_t>(radius);
  if (wire_radius == 0) {
    // 0 is not a defined radius; anything this tight is a spin.
    wire_radius = radius < 0.0 ? kRadiusSpinCw : kRadiusSpinCcw;
  }
  plan.command.radius_mm = wire_radius;
  return plan;
}

}  // namespace

MotionPlan planMotion(const MotionRequest& request, const RobotGeometry& geometry) {
  if (const auto* m = std::get_if<StraightMotion>(&request)) {
    return planStraight(*m);
  }
  if (const auto* m = std::get_if<SpinMotion>(&request)) {
    return planSpin(*m);
  }
  if (const auto* m = std::get_if<VelocityMotion>(&request)) {
    return planVelocity(*m, geometry);
  }
  return stopPlan();
}

VelocityMotion powerToVelocity(const Vector3& linear, const Vector3& angular,
                               const RobotGeometry& geometry) {
  const double max_wheel_speed = kMaxVelocityMmps;
  const double max_angular_degps =
    max_wheel_speed * 180.0 / (M_PI * static_cast<double>(geometry.width_mm) / 2.0);

  VelocityMotion v;
  v.linear_mmps = linear.y * max_wheel_speed;
  v.angular_degps = angular.z * max_angular_degps;
  return v;
}

const char* toString(MotionOutcome outcome) {
  switch (outcome) {
    case MotionOutcome::Completed:        return "completed";
    case MotionOutcome::Superseded:       return "superseded";
    case MotionOutcome::Cancelled:        return "cancelled";
    case MotionOutcome::DeadlineExceeded: return "deadline_exceeded";
    case MotionOutcome::Shutdown:         return "shutdown";
  }
  return "unknown";
}

// -------------------------
// MotionOperation
// -------------------------

void MotionOperation::cancel(MotionOutcome reason) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!reason_) {
      reason_ = reason;
    }
  }
  cv_.notify_all();
}

std::optional<MotionOutcome> MotionOperation::cancelReason() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return reason_;
}

std::optional<MotionOutcome> MotionOperation::waitUntil(Clock::time_point deadline) {
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait_until(lk, deadline, [this] { return reason_.has_value(); });
  return reason_;
}

void MotionOperation::markDone() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    done_ = true;
  }
  cv_.notify_all();
}

void MotionOperation::waitDone() {
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait(lk, [this] { return done_; });
}

// -------------------------
// MotionController
// -------------------------

/**
 * @brief Releases the operation slot however execute() exits.
 */
class OperationGuard {
public:
  OperationGuard(MotionController& mc, std::shared_ptr<MotionOperation> op)
  : mc_(mc), op_(std::move(op)) {}
  ~OperationGuard() { mc_.finishOperation(op_); }

  OperationGuard(const OperationGuard&) = delete;
  OperationGuard& operator=(const OperationGuard&) = delete;

private:
  MotionController& mc_;
  std::shared_ptr<MotionOperation> op_;
};

MotionController::MotionController(ProtocolClient& client, const RobotGeometry& geometry,
                                   const rclcpp::Logger& logger)
: client_(client), geometry_(geometry), logger_(logger) {}

MotionController::~MotionController() {
  close();
}

MotionOutcome MotionController::execute(const MotionRequest& request,
                                        const CancellationToken& token) {
  const MotionPlan plan = planMotion(request, geometry_);
  if (plan.clamped) {
    RCLCPP_WARN(logger_, "Clamping velocity from %.0f to %d mm/sec",
                plan.requested_velocity_mmps, plan.command.velocity_mmps);
  }

  if (closed_.load()) {
    RCLCPP_WARN(logger_, "Ignoring motion request on closed base (%s)", client_.port().c_str());
    return MotionOutcome::Shutdown;
  }

  auto op = beginOperation();
  OperationGuard guard(*this, op);

  if (shutdown_.isCancelled()) {
    return MotionOutcome::Shutdown;
  }

  if (!plan.blocking) {
    if (auto reason = op->cancelReason()) {
      return *reason;
    }
    issue(plan.command);
    return MotionOutcome::Completed;
  }

  return runBlocking(op, plan, token);
}

MotionOutcome MotionController::runBlocking(const std::shared_ptr<MotionOperation>& op,
                                            const MotionPlan& plan,
                                            const CancellationToken& token) {
  using Clock = MotionOperation::Clock;

  // Copies: the tokens' callbacks outlive nothing but this call.
  CancellationToken caller = token;
  CancellationToken shutdown = shutdown_;
  const std::size_t caller_sub = caller.subscribe([op] { op->cancel(MotionOutcome::Cancelled); });
  const std::size_t shutdown_sub = shutdown.subscribe([op] { op->cancel(MotionOutcome::Shutdown); });

  struct Unsubscribe {
    CancellationToken& caller;
    CancellationToken& shutdown;
    std::size_t caller_sub;
    std::size_t shutdown_sub;
    ~Unsubscribe() {
      caller.unsubscribe(caller_sub);
      shutdown.unsubscribe(shutdown_sub);
    }
  } unsubscribe{caller, shutdown, caller_sub, shutdown_sub};

  const Clock::time_point start = Clock::now();
  const auto wait = std::chrono::duration_cast<Clock::duration>(
    std::chrono::duration<double>(std::min(plan.duration_s, kMaxWaitSec)));
  const Clock::time_point finish = start + wait;

  const std::optional<Clock::time_point> deadline = caller.deadline();
  const bool deadline_first = deadline && *deadline < finish;

  std::optional<MotionOutcome> reason = op->cancelReason();
  if (!reason && deadline_first && *deadline <= start) {
    reason = MotionOutcome::DeadlineExceeded;
  }

  if (!reason) {
    state_ = MotionState::Driving;
    try {
      client_.drive(plan.command.velocity_mmps, plan.command.radius_mm);
    } catch (...) {
      state_ = MotionState::Idle;
      throw;
    }
    RCLCPP_DEBUG(logger_, "Drive: velocity=%d mm/sec, radius=%d mm, duration=%.2f sec",
                 plan.command.velocity_mmps, plan.command.radius_mm, plan.duration_s);

    reason = op->waitUntil(deadline_first ? *deadline : finish);
    if (!reason && deadline_first) {
      reason = MotionOutcome::DeadlineExceeded;
    }
  }

  const MotionOutcome outcome = reason ? *reason : MotionOutcome::Completed;

  state_ = MotionState::Stopping;
  try {
    client_.stop();
  } catch (...) {
    state_ = MotionState::Idle;
    throw;
  }
  state_ = MotionState::Idle;

  RCLCPP_DEBUG(logger_, "Motion %s after %.2f sec", toString(outcome),
               std::chrono::duration<double>(Clock::now() - start).count());
  return outcome;
}

MotionOutcome MotionController::moveStraight(int distance_mm, double speed_mmps,
                                             const CancellationToken& token) {
  return execute(StraightMotion{distance_mm, speed_mmps}, token);
}

MotionOutcome MotionController::spin(double angle_deg, double speed_degps,
                                     const CancellationToken& token) {
  return execute(SpinMotion{angle_deg, speed_degps}, token);
}

MotionOutcome MotionController::setVelocity(const Vector3& linear, const Vector3& angular) {
  return execute(VelocityMotion{linear.y, angular.z});
}

MotionOutcome MotionController::setPower(const Vector3& linear, const Vector3& angular) {
  return execute(powerToVelocity(linear, angular, geometry_));
}

MotionOutcome MotionController::stop() {
  return execute(StopMotion{});
}

void MotionController::cancelCurrent() {
  std::shared_ptr<MotionOperation> current;
  {
    std::lock_guard<std::mutex> lk(slot_mtx_);
    current = current_;
  }
  if (current) {
    current->cancel(MotionOutcome::Cancelled);
    current->waitDone();
  }
}

bool MotionController::isMoving() {
  const PacketSegments data = client_.queryList({39});
  const int16_t requested = readInt16BE(data.at(0).data());
  const bool moving = std::abs(static_cast<int>(requested)) > kMovingThresholdMmps;

  RCLCPP_DEBUG(logger_, "IsMoving: requested_velocity=%d mm/s, moving=%s",
               requested, moving ? "true" : "false");
  return moving;
}

void MotionController::close() {
  if (closed_.exchange(true)) {
    return;
  }

  shutdown_.cancel();

  std::shared_ptr<MotionOperation> current;
  {
    std::lock_guard<std::mutex> lk(slot_mtx_);
    current = current_;
  }
  if (current) {
    current->waitDone();
  }

  try {
    client_.stop();
  } catch (const std::exception& e) {
    RCLCPP_WARN(logger_, "Failed to stop base on %s during close: %s",
                client_.port().c_str(), e.what());
  }
  state_ = MotionState::Idle;
}

std::shared_ptr<MotionOperation> MotionController::beginOperation() {
  auto op = std::make_shared<MotionOperation>();
  std::shared_ptr<MotionOperation> previous;
  {
    std::lock_guard<std::mutex> lk(slot_mtx_);
    previous = current_;
    current_ = op;
  }

  if (previous) {
    previous->cancel(MotionOutcome::Superseded);
    previous->waitDone();
  }
  return op;
}

void MotionController::finishOperation(const std::shared_ptr<MotionOperation>& op) {
  {
    std::lock_guard<std::mutex> lk(slot_mtx_);
    if (current_ == op) {
      current_.reset();
    }
  }
  // Last access: close() may return and the owner destroy *this once the op is done.
  op->markDone();
}

void MotionController::issue(const DriveCommand& cmd) {
  if (cmd.isStop()) {
    client_.stop();
    RCLCPP_DEBUG(logger_, "Base stopped");
    return;
  }

  client_.drive(cmd.velocity_mmps, cmd.radius_mm);
  RCLCPP_DEBUG(logger_, "SetVelocity: velocity=%d mm/sec, radius=%d mm",
               cmd.velocity_mmps, cmd.radius_mm);
}

}  // namespace roomba_base
