#include "PostureController.h"
#include "BalanceTypes.h"

#include <cmath>

namespace BalanceControl {

void PostureMapping::validate() const {
    if (!std::isfinite(hipRollGain) || !std::isfinite(hipPitchGain) || !std::isfinite(anklePitchGain)) {
        throw ConfigurationError("posture mapping gains must be finite");
    }
}

PostureController::PostureController(const PIDGains& rollGains, const PIDGains& pitchGains,
                                     const PostureMapping& mapping)
    : rollPid_(rollGains, "roll"), pitchPid_(pitchGains, "pitch"), mapping_(mapping) {
    mapping_.validate();
}

PostureCorrection PostureController::compute(PostureState& state, double roll, double pitch, double dt) const {
    // Both axes are checked before either accumulator moves
    validateTimeStep(dt, "posture");
    if (!std::isfinite(roll) || !std::isfinite(pitch)) {
        throw InvalidInput("posture: roll and pitch must be finite");
    }

    // Setpoint is upright
    double rollOut = rollPid_.update(state.roll, 0.0 - roll, dt);
    double pitchOut = pitchPid_.update(state.pitch, 0.0 - pitch, dt);

    PostureCorrection c;
    c.rollOutput = rollOut;
    c.pitchOutput = pitchOut;

    c.left.hipRoll = mapping_.hipRollGain * rollOut;
    c.right.hipRoll = -mapping_.hipRollGain * rollOut;

    c.left.hipPitch = c.right.hipPitch = mapping_.hipPitchGain * pitchOut;
    c.left.anklePitch = c.right.anklePitch = mapping_.anklePitchGain * pitchOut;
    return c;
}

void PostureController::reset(PostureState& state) {
    PIDController::reset(state.roll);
    PIDController::reset(state.pitch);
}

} // namespace BalanceControl
