#pragma once

#include "StabilityMetrics.h"
#include "StandingController.h"

#include <string>

namespace BalanceControl {

// Parameters of the physics environment and the control loop timing.
struct SimulationConfig {
    double timeStep = 0.001;        // s, physics step
    double controlPeriod = 0.01;    // s, one controller tick per period
    double gravity = -9.81;         // m/s^2 along z
    double groundFriction = 1.0;
    double servoGain = 20.0;        // 1/s, joint velocity per radian of error
    double servoMaxVelocity = 8.0;  // rad/s
    double servoMaxTorque = 20.0;   // N*m
    double imuNoiseLevel = 0.01;    // amplitude of uniform noise on IMU channels
    long noiseSeed = 42;
    double settleTime = 1.0;        // s held at the baseline pose before control starts

    void validate() const;

    // Physics steps per control tick, at least one
    int stepsPerControl() const;
};

struct BalanceConfig {
    StandingConfig controller;
    StabilityConfig stability;
    SimulationConfig simulation;
    std::string logLevel = "info";

    // Throws ConfigurationError on the first invalid field.
    void validate() const;
};

} // namespace BalanceControl
