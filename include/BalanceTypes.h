#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace BalanceControl {

// ============================================================================
// ERRORS
// ============================================================================

class BalanceError : public std::runtime_error {
public:
    explicit BalanceError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed gains, baseline pose, ranges or thresholds. Raised at construction.
class ConfigurationError : public BalanceError {
public:
    explicit ConfigurationError(const std::string& what) : BalanceError(what) {}
};

// Non-positive dt, NaN or infinite state fields. Raised by the failing call.
class InvalidInput : public BalanceError {
public:
    explicit InvalidInput(const std::string& what) : BalanceError(what) {}
};

// ============================================================================
// STATE SNAPSHOT
// ============================================================================

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct Quaternion {
    double w = 1.0;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// Roll about forward (x), pitch about lateral (y), yaw about vertical (z). Degrees.
struct EulerAngles {
    double roll = 0.0;
    double pitch = 0.0;
    double yaw = 0.0;
};

struct JointState {
    double angle = 0.0;     // degrees
    double velocity = 0.0;  // degrees per second
};

struct ImuReading {
    EulerAngles orientation;
    Vec3 angularVelocity;     // rad/s
    Vec3 linearAcceleration;  // m/s^2, specific force (+9.81 z at rest)
};

struct BaseState {
    Vec3 position;            // z is pelvis height above ground
    EulerAngles orientation;
    Quaternion quaternion;
    Vec3 linearVelocity;
    Vec3 angularVelocity;
};

// One tick of sensed robot state.
struct RobotState {
    double timestamp = 0.0;
    BaseState base;
    std::map<std::string, JointState> joints;
    ImuReading imu;
};

// Joint name -> target angle in degrees.
using ControlCommand = std::map<std::string, double>;

// Throws InvalidInput when any numeric field is NaN or infinite.
void validateRobotState(const RobotState& state);

// Throws InvalidInput unless dt is finite and strictly positive.
void validateTimeStep(double dt, const char* caller);

EulerAngles quaternionToEuler(const Quaternion& q);

} // namespace BalanceControl
