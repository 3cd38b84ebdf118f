#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

#include <rclcpp/logger.hpp>

#include "fake_transport.hpp"
#include "roomba_base/motion_controller.hpp"
#include "roomba_base/oi_protocol.hpp"

using namespace std::chrono_literals;

using roomba_base::CancellationToken;
using roomba_base::MotionController;
using roomba_base::MotionOutcome;
using roomba_base::MotionPlan;
using roomba_base::ProtocolClient;
using roomba_base::RobotGeometry;
using roomba_base::SpinMotion;
using roomba_base::StopMotion;
using roomba_base::StraightMotion;
using roomba_base::Vector3;
using roomba_base::VelocityMotion;
using roomba_base::planMotion;
using roomba_base::test::FakeLink;
using roomba_base::test::makeFakeConnection;

using Drive = std::pair<int16_t, int16_t>;

// -------------------------
// planMotion
// -------------------------

TEST(PlanMotion, StraightClampsVelocity) {
  const MotionPlan p = planMotion(StraightMotion{1000, 800.0}, RobotGeometry{});
  EXPECT_TRUE(p.blocking);
  EXPECT_TRUE(p.clamped);
  EXPECT_EQ(p.command.velocity_mmps, 500);
  EXPECT_EQ(p.command.radius_mm, roomba_base::kRadiusStraight);
  EXPECT_DOUBLE_EQ(p.duration_s, 1.25);
}

TEST(PlanMotion, StraightBackwardsUsesDistanceSign) {
  const MotionPlan p = planMotion(StraightMotion{-300, 150.0}, RobotGeometry{});
  EXPECT_EQ(p.command.velocity_mmps, -150);
  EXPECT_DOUBLE_EQ(p.duration_s, 2.0);
  EXPECT_FALSE(p.clamped);
}

TEST(PlanMotion, StraightWithZeroDistanceOrSpeedIsStop) {
  EXPECT_TRUE(planMotion(StraightMotion{0, 100.0}, RobotGeometry{}).command.isStop());
  EXPECT_FALSE(planMotion(StraightMotion{0, 100.0}, RobotGeometry{}).blocking);
  EXPECT_TRUE(planMotion(StraightMotion{100, 0.0}, RobotGeometry{}).command.isStop());
}

TEST(PlanMotion, SpinDirectionAndDuration) {
  const MotionPlan ccw = planMotion(SpinMotion{1000.0, 10.0}, RobotGeometry{});
  EXPECT_TRUE(ccw.blocking);
  EXPECT_DOUBLE_EQ(ccw.duration_s, 100.0);
  EXPECT_EQ(ccw.command.velocity_mmps, roomba_base::kSpinVelocityMmps);
  EXPECT_EQ(ccw.command.radius_mm, roomba_base::kRadiusSpinCcw);

  const MotionPlan cw = planMotion(SpinMotion{-90.0, 45.0}, RobotGeometry{});
  EXPECT_DOUBLE_EQ(cw.duration_s, 2.0);
  EXPECT_EQ(cw.command.radius_mm, roomba_base::kRadiusSpinCw);
}

TEST(PlanMotion, VelocityStraightClamps) {
  const MotionPlan p = planMotion(VelocityMotion{-1000.0, 0.0}, RobotGeometry{});
  EXPECT_FALSE(p.blocking);
  EXPECT_TRUE(p.clamped);
  EXPECT_EQ(p.command.velocity_mmps, -500);
  EXPECT_EQ(p.command.radius_mm, roomba_base::kRadiusStraight);
}

TEST(PlanMotion, VelocityArcRadius) {
  // 200 mm/s at 45 deg/s: r = 200 / (pi/4) = 254.6
  const MotionPlan left = planMotion(VelocityMotion{200.0, 45.0}, RobotGeometry{});
  EXPECT_EQ(left.command.velocity_mmps, 200);
  EXPECT_EQ(left.command.radius_mm, 254);

  const MotionPlan right = planMotion(VelocityMotion{200.0, -45.0}, RobotGeometry{});
  EXPECT_EQ(right.command.radius_mm, -254);
}

TEST(PlanMotion, VelocityArcRadiusClamps) {
  const MotionPlan p = planMotion(VelocityMotion{500.0, 1.0}, RobotGeometry{});
  EXPECT_EQ(p.command.radius_mm, roomba_base::kMaxRadiusMm);
}

TEST(PlanMotion, VelocityTightArcBecomesSpin) {
  const MotionPlan p = planMotion(VelocityMotion{1.0, -720.0}, RobotGeometry{});
  EXPECT_EQ(p.command.radius_mm, roomba_base::kRadiusSpinCw);
}

TEST(PlanMotion, PureAngularVelocitySpinsAtWheelSpeed) {
  // 90 deg/s * 117.5 mm = 184.57 mm/s at the wheels
  const MotionPlan p = planMotion(VelocityMotion{0.0, 90.0}, RobotGeometry{});
  EXPECT_EQ(p.command.velocity_mmps, 184);
  EXPECT_EQ(p.command.radius_mm, roomba_base::kRadiusSpinCcw);

  const MotionPlan fast = planMotion(VelocityMotion{0.0, -3600.0}, RobotGeometry{});
  EXPECT_EQ(fast.command.velocity_mmps, 500);
  EXPECT_EQ(fast.command.radius_mm, roomba_base::kRadiusSpinCw);
}

TEST(PlanMotion, StopRequestIsStop) {
  EXPECT_TRUE(planMotion(StopMotion{}, RobotGeometry{}).command.isStop());
  EXPECT_TRUE(planMotion(VelocityMotion{0.0, 0.0}, RobotGeometry{}).command.isStop());
}

TEST(PowerToVelocity, FullLinearIsMaxWheelSpeed) {
  const auto v = roomba_base::powerToVelocity(Vector3{0, 1, 0}, Vector3{}, RobotGeometry{});
  EXPECT_DOUBLE_EQ(v.linear_mmps, 500.0);
  EXPECT_DOUBLE_EQ(v.angular_degps, 0.0);

  const MotionPlan p = planMotion(v, RobotGeometry{});
  EXPECT_EQ(p.command.velocity_mmps, 500);
  EXPECT_EQ(p.command.radius_mm, roomba_base::kRadiusStraight);
}

TEST(PowerToVelocity, FullAngularSpinsAtMaxWheelSpeed) {
  const auto v = roomba_base::powerToVelocity(Vector3{}, Vector3{0, 0, -1}, RobotGeometry{});
  const MotionPlan p = planMotion(v, RobotGeometry{});
  EXPECT_NEAR(p.command.velocity_mmps, 500, 1);
  EXPECT_EQ(p.command.radius_mm, roomba_base::kRadiusSpinCw);
}

// -------------------------
// MotionController
// -------------------------

namespace {

class MotionControllerTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeLink> link = std::make_shared<FakeLink>();
  ProtocolClient client{makeFakeConnection(link)};
  MotionController mc{client, RobotGeometry{}, rclcpp::get_logger("test_motion_controller")};
};

}  // namespace

TEST_F(MotionControllerTest, ZeroDistanceSendsOnlyStop) {
  EXPECT_EQ(mc.moveStraight(0, 100.0), MotionOutcome::Completed);
  EXPECT_EQ(link->drives(), (std::vector<Drive>{{0, 0}}));
}

TEST_F(MotionControllerTest, ShortMoveDrivesThenStops) {
  EXPECT_EQ(mc.moveStraight(10, 100.0), MotionOutcome::Completed);
  EXPECT_EQ(link->drives(), (std::vector<Drive>{{100, 32767}, {0, 0}}));
  EXPECT_EQ(mc.state(), roomba_base::MotionState::Idle);
}

TEST_F(MotionControllerTest, SetVelocityDoesNotStop) {
  EXPECT_EQ(mc.setVelocity(Vector3{0, 200, 0}, Vector3{0, 0, 45}), MotionOutcome::Completed);
  EXPECT_EQ(link->drives(), (std::vector<Drive>{{200, 254}}));
}

TEST_F(MotionControllerTest, NewRequestSupersedesBlockingMove) {
  MotionOutcome first = MotionOutcome::Completed;
  std::thread t([&] { first = mc.moveStraight(100000, 100.0); });

  EXPECT_TRUE(link->waitForDrives(1, 2s));
  const MotionOutcome second = mc.moveStraight(10, 100.0);
  t.join();

  EXPECT_EQ(first, MotionOutcome::Superseded);
  EXPECT_EQ(second, MotionOutcome::Completed);
  EXPECT_EQ(link->drives(),
            (std::vector<Drive>{{100, 32767}, {0, 0}, {100, 32767}, {0, 0}}));
}

TEST_F(MotionControllerTest, CancelledTokenStopsMove) {
  CancellationToken token;
  MotionOutcome outcome = MotionOutcome::Completed;
  std::thread t([&] { outcome = mc.spin(3600.0, 1.0, token); });

  EXPECT_TRUE(link->waitForDrives(1, 2s));
  token.cancel();
  t.join();

  EXPECT_EQ(outcome, MotionOutcome::Cancelled);
  EXPECT_EQ(link->drives(), (std::vector<Drive>{{100, 1}, {0, 0}}));
}

TEST_F(MotionControllerTest, AlreadyCancelledTokenOnlyStops) {
  CancellationToken token;
  token.cancel();

  EXPECT_EQ(mc.moveStraight(1000, 100.0, token), MotionOutcome::Cancelled);
  EXPECT_EQ(link->drives(), (std::vector<Drive>{{0, 0}}));
}

TEST_F(MotionControllerTest, DeadlineEndsMoveEarly) {
  const auto token = CancellationToken::withTimeout(50ms);
  const auto start = std::chrono::steady_clock::now();

  EXPECT_EQ(mc.moveStraight(100000, 100.0, token), MotionOutcome::DeadlineExceeded);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  EXPECT_EQ(link->drives(), (std::vector<Drive>{{100, 32767}, {0, 0}}));
}

TEST_F(MotionControllerTest, ExpiredDeadlineSkipsDrive) {
  const auto token =
    CancellationToken::withDeadline(std::chrono::steady_clock::now() - 1s);

  EXPECT_EQ(mc.moveStraight(1000, 100.0, token), MotionOutcome::DeadlineExceeded);
  EXPECT_EQ(link->drives(), (std::vector<Drive>{{0, 0}}));
}

TEST_F(MotionControllerTest, CancelCurrentStopsAndWaits) {
  MotionOutcome outcome = MotionOutcome::Completed;
  std::thread t([&] { outcome = mc.moveStraight(-100000, 200.0); });

  EXPECT_TRUE(link->waitForDrives(1, 2s));
  mc.cancelCurrent();
  // cancelCurrent returns only after the stop went out.
  EXPECT_EQ(link->drives().size(), 2u);
  t.join();

  EXPECT_EQ(outcome, MotionOutcome::Cancelled);
  EXPECT_EQ(link->drives(), (std::vector<Drive>{{-200, 32767}, {0, 0}}));
}

TEST_F(MotionControllerTest, CloseInterruptsMoveAndRejectsLaterRequests) {
  MotionOutcome outcome = MotionOutcome::Completed;
  std::thread t([&] { outcome = mc.moveStraight(100000, 100.0); });

  EXPECT_TRUE(link->waitForDrives(1, 2s));
  mc.close();
  t.join();

  EXPECT_EQ(outcome, MotionOutcome::Shutdown);
  const auto after_close = link->writes().size();

  EXPECT_EQ(mc.setVelocity(Vector3{0, 100, 0}, Vector3{}), MotionOutcome::Shutdown);
  EXPECT_EQ(mc.moveStraight(100, 100.0), MotionOutcome::Shutdown);
  EXPECT_EQ(link->writes().size(), after_close);

  const auto drives = link->drives();
  ASSERT_GE(drives.size(), 2u);
  EXPECT_EQ(drives.front(), Drive(100, 32767));
  EXPECT_EQ(drives.back(), Drive(0, 0));
}

TEST_F(MotionControllerTest, CloseIsIdempotent) {
  mc.close();
  mc.close();
  EXPECT_EQ(link->drives(), (std::vector<Drive>{{0, 0}}));
}

TEST_F(MotionControllerTest, IsMovingUsesRequestedVelocity) {
  link->queueQueryResponse({0x00, 0x64});  // 100
  EXPECT_TRUE(mc.isMoving());
  EXPECT_EQ(link->writes().back(), (std::vector<uint8_t>{149, 1, 39}));

  link->queueQueryResponse({0x00, 0x05});
  EXPECT_FALSE(mc.isMoving());

  link->queueQueryResponse({0xFF, 0x38});  // -200
  EXPECT_TRUE(mc.isMoving());
}

TEST(MotionOutcomeNames, AllOutcomesHaveNames) {
  EXPECT_STREQ(roomba_base::toString(MotionOutcome::Completed), "completed");
  EXPECT_STREQ(roomba_base::toString(MotionOutcome::Superseded), "superseded");
  EXPECT_STREQ(roomba_base::toString(MotionOutcome::DeadlineExceeded), "deadline_exceeded");
}
