#pragma once

#include <map>
#include <string>
#include <vector>

namespace BalanceControl {

namespace Joints {
    constexpr const char* HEAD_PITCH = "head_pitch";
    constexpr const char* LEFT_HIP_ROLL = "left_hip_roll";
    constexpr const char* LEFT_HIP_PITCH = "left_hip_pitch";
    constexpr const char* LEFT_KNEE = "left_knee";
    constexpr const char* LEFT_ANKLE_PITCH = "left_ankle_pitch";
    constexpr const char* RIGHT_HIP_ROLL = "right_hip_roll";
    constexpr const char* RIGHT_HIP_PITCH = "right_hip_pitch";
    constexpr const char* RIGHT_KNEE = "right_knee";
    constexpr const char* RIGHT_ANKLE_PITCH = "right_ankle_pitch";

    // All nine actuated joints of the biped, head first then left leg, right leg
    const std::vector<std::string>& all();
}

enum class JointRole {
    HIP_ROLL,
    HIP_PITCH,
    KNEE,
    ANKLE_PITCH,
    OTHER
};

enum class LegSide {
    LEFT,
    RIGHT,
    NONE
};

// "left_knee" -> KNEE / LEFT, "head_pitch" -> OTHER / NONE
JointRole jointRole(const std::string& joint);
LegSide jointSide(const std::string& joint);

// Name of the mirrored joint, or empty for joints without a side.
std::string mirrorJoint(const std::string& joint);

// Closed interval in degrees.
struct JointRange {
    double min = 0.0;
    double max = 0.0;

    bool contains(double angle) const { return angle >= min && angle <= max; }
    double clamp(double angle) const;
};

using BaselinePose = std::map<std::string, double>;
using JointRanges = std::map<std::string, JointRange>;

// Bent-knee stance: hip 10, knee 20, ankle -10, everything else zero.
BaselinePose defaultBaselinePose();
JointRanges defaultJointRanges();

// Throws ConfigurationError when the pose is empty, a left/right pair is
// missing or asymmetric, a joint has no range, a range is inverted or a
// baseline angle lies outside its range.
void validatePose(const BaselinePose& baseline, const JointRanges& ranges);

} // namespace BalanceControl
