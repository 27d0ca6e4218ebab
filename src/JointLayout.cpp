#include "JointLayout.h"
#include "BalanceTypes.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace BalanceControl {

namespace {

const std::string kLeftPrefix = "left_";
const std::string kRightPrefix = "right_";
constexpr double kSymmetryTolerance = 1e-9;

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string stripSide(const std::string& joint) {
    if (startsWith(joint, kLeftPrefix)) return joint.substr(kLeftPrefix.size());
    if (startsWith(joint, kRightPrefix)) return joint.substr(kRightPrefix.size());
    return joint;
}

} // namespace

namespace Joints {

const std::vector<std::string>& all() {
    static const std::vector<std::string> names = {
        HEAD_PITCH,
        LEFT_HIP_ROLL, LEFT_HIP_PITCH, LEFT_KNEE, LEFT_ANKLE_PITCH,
        RIGHT_HIP_ROLL, RIGHT_HIP_PITCH, RIGHT_KNEE, RIGHT_ANKLE_PITCH
    };
    return names;
}

} // namespace Joints

JointRole jointRole(const std::string& joint) {
    if (jointSide(joint) == LegSide::NONE) return JointRole::OTHER;

    std::string base = stripSide(joint);
    if (base == "hip_roll") return JointRole::HIP_ROLL;
    if (base == "hip_pitch") return JointRole::HIP_PITCH;
    if (base == "knee") return JointRole::KNEE;
    if (base == "ankle_pitch") return JointRole::ANKLE_PITCH;
    return JointRole::OTHER;
}

LegSide jointSide(const std::string& joint) {
    if (startsWith(joint, kLeftPrefix)) return LegSide::LEFT;
    if (startsWith(joint, kRightPrefix)) return LegSide::RIGHT;
    return LegSide::NONE;
}

std::string mirrorJoint(const std::string& joint) {
    switch (jointSide(joint)) {
        case LegSide::LEFT: return kRightPrefix + stripSide(joint);
        case LegSide::RIGHT: return kLeftPrefix + stripSide(joint);
        case LegSide::NONE: break;
    }
    return std::string();
}

double JointRange::clamp(double angle) const {
    return std::clamp(angle, min, max);
}

BaselinePose defaultBaselinePose() {
    return {
        {Joints::HEAD_PITCH, 0.0},
        {Joints::LEFT_HIP_ROLL, 0.0},
        {Joints::LEFT_HIP_PITCH, 10.0},
        {Joints::LEFT_KNEE, 20.0},
        {Joints::LEFT_ANKLE_PITCH, -10.0},
        {Joints::RIGHT_HIP_ROLL, 0.0},
        {Joints::RIGHT_HIP_PITCH, 10.0},
        {Joints::RIGHT_KNEE, 20.0},
        {Joints::RIGHT_ANKLE_PITCH, -10.0},
    };
}

JointRanges defaultJointRanges() {
    return {
        {Joints::HEAD_PITCH, {-30.0, 30.0}},
        {Joints::LEFT_HIP_ROLL, {-20.0, 20.0}},
        {Joints::LEFT_HIP_PITCH, {-30.0, 60.0}},
        {Joints::LEFT_KNEE, {0.0, 90.0}},
        {Joints::LEFT_ANKLE_PITCH, {-40.0, 40.0}},
        {Joints::RIGHT_HIP_ROLL, {-20.0, 20.0}},
        {Joints::RIGHT_HIP_PITCH, {-30.0, 60.0}},
        {Joints::RIGHT_KNEE, {0.0, 90.0}},
        {Joints::RIGHT_ANKLE_PITCH, {-40.0, 40.0}},
    };
}

void validatePose(const BaselinePose& baseline, const JointRanges& ranges) {
    if (baseline.empty()) {
        throw ConfigurationError("baseline pose is empty");
    }

    for (const auto& [joint, angle] : baseline) {
        if (!std::isfinite(angle)) {
            throw ConfigurationError("baseline angle for '" + joint + "' is not finite");
        }

        auto range = ranges.find(joint);
        if (range == ranges.end()) {
            throw ConfigurationError("joint '" + joint + "' has no declared range");
        }
        const JointRange& r = range->second;
        if (!std::isfinite(r.min) || !std::isfinite(r.max) || r.min > r.max) {
            std::ostringstream oss;
            oss << "joint '" << joint << "' has an invalid range [" << r.min << ", " << r.max << "]";
            throw ConfigurationError(oss.str());
        }
        if (!r.contains(angle)) {
            std::ostringstream oss;
            oss << "baseline angle " << angle << " for '" << joint << "' lies outside ["
                << r.min << ", " << r.max << "]";
            throw ConfigurationError(oss.str());
        }

        std::string mirror = mirrorJoint(joint);
        if (mirror.empty()) continue;

        auto other = baseline.find(mirror);
        if (other == baseline.end()) {
            throw ConfigurationError("baseline pose has '" + joint + "' but not '" + mirror + "'");
        }
        if (std::abs(other->second - angle) > kSymmetryTolerance) {
            std::ostringstream oss;
            oss << "baseline pose is not symmetric: " << joint << "=" << angle
                << ", " << mirror << "=" << other->second;
            throw ConfigurationError(oss.str());
        }
    }
}

} // namespace BalanceControl
