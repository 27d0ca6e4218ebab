#pragma once

#include "PIDController.h"

namespace BalanceControl {

// Degrees of joint offset per degree of PID output.
struct PostureMapping {
    double hipRollGain = 0.3;      // applied +g on the left, -g on the right
    double hipPitchGain = 0.3;     // both legs
    double anklePitchGain = -0.2;  // both legs

    void validate() const;
};

struct LegDelta {
    double hipRoll = 0.0;
    double hipPitch = 0.0;
    double anklePitch = 0.0;
};

struct PostureCorrection {
    LegDelta left;
    LegDelta right;
    double rollOutput = 0.0;
    double pitchOutput = 0.0;
};

struct PostureState {
    PIDState roll;
    PIDState pitch;
};

// Cancels base roll and pitch around an upright (zero) setpoint.
// Roll is corrected differentially through the hip roll joints, pitch in
// common mode through hip and ankle pitch, so the stance stays symmetric.
class PostureController {
public:
    PostureController(const PIDGains& rollGains, const PIDGains& pitchGains,
                      const PostureMapping& mapping = PostureMapping{});

    // roll and pitch in degrees. Throws InvalidInput on dt <= 0 or NaN angles.
    PostureCorrection compute(PostureState& state, double roll, double pitch, double dt) const;

    static void reset(PostureState& state);

    const PostureMapping& getMapping() const { return mapping_; }

private:
    PIDController rollPid_;
    PIDController pitchPid_;
    PostureMapping mapping_;
};

} // namespace BalanceControl
