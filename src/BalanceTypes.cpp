#include "BalanceTypes.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace BalanceControl {

namespace {

void requireFinite(double value, const std::string& field) {
    if (!std::isfinite(value)) {
        std::ostringstream oss;
        oss << "RobotState field '" << field << "' is not finite (" << value << ")";
        throw InvalidInput(oss.str());
    }
}

void requireFinite(const Vec3& v, const std::string& field) {
    requireFinite(v.x, field + ".x");
    requireFinite(v.y, field + ".y");
    requireFinite(v.z, field + ".z");
}

void requireFinite(const EulerAngles& e, const std::string& field) {
    requireFinite(e.roll, field + ".roll");
    requireFinite(e.pitch, field + ".pitch");
    requireFinite(e.yaw, field + ".yaw");
}

void requireFinite(const Quaternion& q, const std::string& field) {
    requireFinite(q.w, field + ".w");
    requireFinite(q.x, field + ".x");
    requireFinite(q.y, field + ".y");
    requireFinite(q.z, field + ".z");
}

} // namespace

void validateRobotState(const RobotState& state) {
    requireFinite(state.timestamp, "timestamp");
    requireFinite(state.base.position, "base.position");
    requireFinite(state.base.quaternion, "base.quaternion");
    requireFinite(state.base.orientation, "base.orientation");
    requireFinite(state.base.linearVelocity, "base.linear_velocity");
    requireFinite(state.base.angularVelocity, "base.angular_velocity");
    for (const auto& [name, joint] : state.joints) {
        requireFinite(joint.angle, "joints." + name + ".angle");
        requireFinite(joint.velocity, "joints." + name + ".velocity");
    }
    requireFinite(state.imu.orientation, "imu.orientation");
    requireFinite(state.imu.angularVelocity, "imu.angular_velocity");
    requireFinite(state.imu.linearAcceleration, "imu.linear_acceleration");
}

void validateTimeStep(double dt, const char* caller) {
    if (!std::isfinite(dt) || dt <= 0.0) {
        std::ostringstream oss;
        oss << caller << ": dt must be a positive finite number, got " << dt;
        throw InvalidInput(oss.str());
    }
}

EulerAngles quaternionToEuler(const Quaternion& q) {
    constexpr double kRadToDeg = 180.0 / M_PI;

    EulerAngles e;
    double sinrCosp = 2.0 * (q.w * q.x + q.y * q.z);
    double cosrCosp = 1.0 - 2.0 * (q.x * q.x + q.y * q.y);
    e.roll = std::atan2(sinrCosp, cosrCosp) * kRadToDeg;

    double sinp = std::clamp(2.0 * (q.w * q.y - q.z * q.x), -1.0, 1.0);
    e.pitch = std::asin(sinp) * kRadToDeg;

    double sinyCosp = 2.0 * (q.w * q.z + q.x * q.y);
    double cosyCosp = 1.0 - 2.0 * (q.y * q.y + q.z * q.z);
    e.yaw = std::atan2(sinyCosp, cosyCosp) * kRadToDeg;
    return e;
}

} // namespace BalanceControl
