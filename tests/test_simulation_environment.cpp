#include <gtest/gtest.h>

#include "BalanceConfig.h"
#include "BalanceTypes.h"
#include "JointLayout.h"
#include "PhysicsWorld.h"
#include "SimulationEnvironment.h"
#include "StabilityMetrics.h"
#include "StandingController.h"

#include <cmath>
#include <map>
#include <memory>
#include <string>

using namespace BalanceControl;

namespace {

class SimulationEnvironmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        sim.imuNoiseLevel = 0.0;
        environment = std::make_unique<SimulationEnvironment>(sim, defaultJointRanges());
    }

    void TearDown() override {
        environment.reset();
    }

    // Declared first so ODE outlives the environment
    OdeSession ode;
    SimulationConfig sim;
    std::unique_ptr<SimulationEnvironment> environment;
};

}  // namespace

TEST_F(SimulationEnvironmentTest, ExposesEveryJoint) {
    std::map<std::string, JointState> joints = environment->getJointStates();

    EXPECT_EQ(joints.size(), Joints::all().size());
    for (const auto& joint : Joints::all()) {
        ASSERT_EQ(joints.count(joint), 1u) << joint;
        EXPECT_NEAR(joints.at(joint).angle, 0.0, 1e-6) << joint;
    }
}

TEST_F(SimulationEnvironmentTest, SpawnsUprightAtStandingHeight) {
    BaseState base = environment->getBaseState();
    const BipedRobot& robot = environment->getRobot();

    EXPECT_NEAR(base.position.z, robot.standingHeight() + robot.getConfig().spawnClearance, 1e-6);
    EXPECT_NEAR(base.position.x, 0.0, 1e-9);
    EXPECT_NEAR(base.orientation.roll, 0.0, 1e-9);
    EXPECT_NEAR(base.orientation.pitch, 0.0, 1e-9);
    EXPECT_NEAR(base.quaternion.w, 1.0, 1e-9);
}

TEST_F(SimulationEnvironmentTest, StepAdvancesTime) {
    EXPECT_DOUBLE_EQ(environment->getTime(), 0.0);

    environment->step();
    EXPECT_NEAR(environment->getTime(), sim.timeStep, 1e-12);

    environment->stepFor(0.1);
    EXPECT_NEAR(environment->getTime(), 0.101, 1e-9);
    EXPECT_NEAR(environment->getRobotState().timestamp, environment->getTime(), 1e-12);
}

TEST_F(SimulationEnvironmentTest, StandsOnBothFeetAtRest) {
    environment->stepFor(0.5);

    BaseState base = environment->getBaseState();
    EXPECT_GT(base.position.z, 0.20);
    EXPECT_LT(std::abs(base.orientation.roll), 5.0);
    EXPECT_LT(std::abs(base.orientation.pitch), 5.0);

    SimulationEnvironment::FootContacts feet = environment->getFootContacts();
    EXPECT_TRUE(feet.left);
    EXPECT_TRUE(feet.right);
}

TEST_F(SimulationEnvironmentTest, ImuReadsGravityAtRest) {
    environment->stepFor(0.5);

    ImuReading imu = environment->getImuData();
    EXPECT_NEAR(imu.linearAcceleration.z, 9.81, 2.0);
    EXPECT_NEAR(imu.linearAcceleration.x, 0.0, 2.0);
    EXPECT_NEAR(imu.linearAcceleration.y, 0.0, 2.0);
    EXPECT_NEAR(imu.angularVelocity.x, 0.0, 0.1);
    EXPECT_NEAR(imu.angularVelocity.y, 0.0, 0.1);
}

TEST_F(SimulationEnvironmentTest, ServoTracksJointTarget) {
    environment->setJointPositions(ControlCommand{{Joints::HEAD_PITCH, 10.0}});
    environment->stepFor(0.5);

    EXPECT_NEAR(environment->getJointStates().at(Joints::HEAD_PITCH).angle, 10.0, 2.0);
}

TEST_F(SimulationEnvironmentTest, TargetsAreClampedToJointRange) {
    environment->setJointPositions(ControlCommand{{Joints::HEAD_PITCH, 75.0}});
    environment->stepFor(0.5);

    double head = environment->getJointStates().at(Joints::HEAD_PITCH).angle;
    EXPECT_LT(head, 31.0);
    EXPECT_GT(head, 25.0);
}

TEST_F(SimulationEnvironmentTest, UnknownJointsAreIgnored) {
    EXPECT_NO_THROW(environment->setJointPositions(ControlCommand{{"tail", 5.0}}));
    environment->step();
    EXPECT_EQ(environment->getJointStates().count("tail"), 0u);
}

TEST_F(SimulationEnvironmentTest, ExternalForcePushesTorso) {
    environment->stepFor(0.2);
    environment->applyExternalForce(Vec3{0.0, 50.0, 0.0}, 0.05);
    environment->stepFor(0.02);

    EXPECT_GT(environment->getBaseState().linearVelocity.y, 0.0);
}

TEST_F(SimulationEnvironmentTest, ResetRestoresSpawnState) {
    environment->setJointPositions(ControlCommand{{Joints::HEAD_PITCH, 20.0}});
    environment->stepFor(0.3);

    environment->resetRobot();
    EXPECT_DOUBLE_EQ(environment->getTime(), 0.0);
    EXPECT_NEAR(environment->getJointStates().at(Joints::HEAD_PITCH).angle, 0.0, 1e-6);
}

TEST_F(SimulationEnvironmentTest, ControllerHoldsBaselineStance) {
    StandingController controller{StandingConfig{}};
    StandingState state;
    StabilityMetrics metrics;

    environment->setJointPositions(controller.getConfig().baseline);
    environment->stepFor(1.0);

    const double dt = sim.controlPeriod;
    for (int tick = 0; tick < 200; ++tick) {
        environment->stepFor(dt);
        RobotState robot = environment->getRobotState();
        metrics.update(robot);
        environment->setJointPositions(controller.compute(state, robot, dt));
    }

    EXPECT_TRUE(metrics.isStable());
    EXPECT_GT(metrics.summary().heightMin, 0.15);
}

TEST(SimulationConfigTest, InvalidConfigurationIsRejected) {
    OdeSession ode;
    SimulationConfig bad;
    bad.timeStep = 0.0;
    EXPECT_THROW((SimulationEnvironment{bad, defaultJointRanges()}), ConfigurationError);

    JointRanges missing = defaultJointRanges();
    missing.erase(Joints::LEFT_KNEE);
    EXPECT_THROW((SimulationEnvironment{SimulationConfig{}, missing}), ConfigurationError);
}
