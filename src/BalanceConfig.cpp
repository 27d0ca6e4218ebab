#include "BalanceConfig.h"
#include "DebugOutput.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace BalanceControl {

namespace {

void requirePositive(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream oss;
        oss << "simulation." << name << " must be positive, got " << value;
        throw ConfigurationError(oss.str());
    }
}

} // namespace

void SimulationConfig::validate() const {
    requirePositive(timeStep, "time_step");
    requirePositive(controlPeriod, "control_period");
    requirePositive(servoGain, "servo_gain");
    requirePositive(servoMaxVelocity, "servo_max_velocity");
    requirePositive(servoMaxTorque, "servo_max_torque");

    if (controlPeriod < timeStep) {
        throw ConfigurationError("simulation.control_period must not be shorter than simulation.time_step");
    }
    if (!std::isfinite(gravity)) {
        throw ConfigurationError("simulation.gravity must be finite");
    }
    if (!std::isfinite(groundFriction) || groundFriction < 0.0) {
        throw ConfigurationError("simulation.ground_friction must be non-negative");
    }
    if (!std::isfinite(imuNoiseLevel) || imuNoiseLevel < 0.0) {
        throw ConfigurationError("simulation.imu_noise_level must be non-negative");
    }
    if (!std::isfinite(settleTime) || settleTime < 0.0) {
        throw ConfigurationError("simulation.settle_time must be non-negative");
    }
}

int SimulationConfig::stepsPerControl() const {
    return std::max(1, static_cast<int>(std::lround(controlPeriod / timeStep)));
}

void BalanceConfig::validate() const {
    controller.validate();
    stability.validate();
    simulation.validate();

    Debug::Level level;
    if (!Debug::parseLevel(logLevel, level)) {
        throw ConfigurationError("log_level '" + logLevel + "' is not one of none/error/warning/info/verbose/all");
    }
}

} // namespace BalanceControl
