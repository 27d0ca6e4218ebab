#pragma once

#include "PIDController.h"

namespace BalanceControl {

// Maps the height PID output (meters) onto the leg joints.
//
// Knee angles are positive in flexion. A height deficit yields a positive PID
// output, and knee = -kneeGain * output, so the knees extend to raise the
// pelvis and flex to lower it. Hip and ankle pitch follow the knee by fixed
// ratios so that hip - knee - ankle stays constant and the torso keeps its
// pitch while the legs fold.
struct HeightMapping {
    double kneeGain = 150.0;         // degrees of knee per meter of output
    double hipPitchRatio = 0.5;      // hip delta per degree of knee delta
    double anklePitchRatio = -0.5;   // ankle delta per degree of knee delta

    void validate() const;
};

struct HeightCorrection {
    double knee = 0.0;
    double hipPitch = 0.0;
    double anklePitch = 0.0;
    double output = 0.0;  // raw PID output in meters
};

// Holds the pelvis at a target height through common-mode knee flexion.
class CenterOfMassController {
public:
    CenterOfMassController(const PIDGains& gains, double targetHeight,
                           const HeightMapping& mapping = HeightMapping{});

    // Same correction for both legs. Throws InvalidInput on dt <= 0 or NaN height.
    HeightCorrection compute(PIDState& state, double currentHeight, double dt) const;

    static void reset(PIDState& state) { PIDController::reset(state); }

    double getTargetHeight() const { return targetHeight_; }
    const HeightMapping& getMapping() const { return mapping_; }

private:
    PIDController pid_;
    double targetHeight_;
    HeightMapping mapping_;
};

} // namespace BalanceControl
