#include "StandingController.h"
#include "DebugOutput.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace BalanceControl {

void StandingConfig::validate() const {
    roll.validate("roll");
    pitch.validate("pitch");
    height.validate("height");
    postureMapping.validate();
    heightMapping.validate();

    if (!std::isfinite(targetHeight) || targetHeight <= 0.0) {
        std::ostringstream oss;
        oss << "target_height must be positive, got " << targetHeight;
        throw ConfigurationError(oss.str());
    }
    if (std::isnan(maxCorrection) || maxCorrection <= 0.0) {
        std::ostringstream oss;
        oss << "max_correction must be positive, got " << maxCorrection;
        throw ConfigurationError(oss.str());
    }

    validatePose(baseline, ranges);
}

StandingController::StandingController(const StandingConfig& config)
    : config_(config),
      posture_(config.roll, config.pitch, config.postureMapping),
      com_(config.height, config.targetHeight, config.heightMapping) {
    config_.validate();
}

ControlCommand StandingController::compute(StandingState& state, const RobotState& robot, double dt) const {
    validateTimeStep(dt, "standing");
    validateRobotState(robot);

    PostureCorrection postureCorr = posture_.compute(
        state.posture, robot.base.orientation.roll, robot.base.orientation.pitch, dt);
    HeightCorrection heightCorr = com_.compute(state.height, robot.base.position.z, dt);

    ControlCommand command;
    for (const auto& [joint, baseAngle] : config_.baseline) {
        double delta = jointDelta(joint, postureCorr, heightCorr);
        delta = std::clamp(delta, -config_.maxCorrection, config_.maxCorrection);

        const JointRange& range = config_.ranges.at(joint);
        double target = baseAngle + delta;
        double clamped = range.clamp(target);
        if (clamped != target) {
            ++state.saturations[joint];
            ++state.totalSaturations;
            std::ostringstream oss;
            oss << "[Standing] " << joint << " saturated: " << target
                << " -> " << clamped << " (t=" << robot.timestamp << ")";
            DEBUG_VERBOSE(oss.str());
        }
        command[joint] = clamped;
    }
    return command;
}

void StandingController::reset(StandingState& state) {
    PostureController::reset(state.posture);
    CenterOfMassController::reset(state.height);
    state.saturations.clear();
    state.totalSaturations = 0;
}

double StandingController::jointDelta(const std::string& joint, const PostureCorrection& posture,
                                      const HeightCorrection& height) const {
    LegSide side = jointSide(joint);
    if (side == LegSide::NONE) {
        return 0.0;
    }
    const LegDelta& leg = (side == LegSide::LEFT) ? posture.left : posture.right;

    switch (jointRole(joint)) {
        case JointRole::HIP_ROLL: return leg.hipRoll;
        case JointRole::HIP_PITCH: return leg.hipPitch + height.hipPitch;
        case JointRole::KNEE: return height.knee;
        case JointRole::ANKLE_PITCH: return leg.anklePitch + height.anklePitch;
        case JointRole::OTHER: break;
    }
    return 0.0;
}

} // namespace BalanceControl
