#pragma once

#include "BalanceConfig.h"
#include "BalanceTypes.h"
#include "BipedRobot.h"
#include "NoiseManager.h"
#include "PhysicsWorld.h"

#include <map>
#include <memory>
#include <string>

// Owns the ODE world, the biped and the sensor noise, and exposes the robot
// the way the balance controllers consume it: degrees, meters, one RobotState
// per tick. Requires a live OdeSession.
class SimulationEnvironment {
public:
    struct FootContacts {
        bool left = false;
        bool right = false;
    };

    SimulationEnvironment(const BalanceControl::SimulationConfig& sim,
                          const BalanceControl::JointRanges& ranges);
    ~SimulationEnvironment();

    BalanceControl::BaseState getBaseState() const;
    std::map<std::string, BalanceControl::JointState> getJointStates() const;
    // Body-frame angular velocity and specific force, plus noise
    BalanceControl::ImuReading getImuData();
    BalanceControl::RobotState getRobotState();

    // Unknown joints are skipped with a warning; targets are clamped to range again
    void setJointPositions(const BalanceControl::ControlCommand& command);

    void step();
    void stepFor(double seconds);

    // Force in newtons on the torso centre for the given duration
    void applyExternalForce(const BalanceControl::Vec3& force, double duration);

    // Rebuilds world and robot at the spawn pose and rewinds time
    void resetRobot();

    FootContacts getFootContacts() const;

    double getTime() const { return time; }
    const BalanceControl::SimulationConfig& getConfig() const { return config; }
    PhysicsWorld& getPhysicsWorld() { return *physicsWorld; }
    BipedRobot& getRobot() { return *robot; }
    NoiseManager& getNoiseManager() { return noise; }

private:
    void build();

    BalanceControl::SimulationConfig config;
    BalanceControl::JointRanges ranges;

    std::unique_ptr<PhysicsWorld> physicsWorld;
    std::unique_ptr<BipedRobot> robot;
    NoiseManager noise;

    double time = 0.0;

    BalanceControl::Vec3 pushForce;
    double pushRemaining = 0.0;

    BalanceControl::Vec3 previousVelocity;
    BalanceControl::Vec3 linearAcceleration;  // world frame, from finite differences
};
