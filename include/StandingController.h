#pragma once

#include "BalanceTypes.h"
#include "CenterOfMassController.h"
#include "JointLayout.h"
#include "PostureController.h"

#include <cstddef>
#include <map>
#include <string>

namespace BalanceControl {

struct StandingConfig {
    PIDGains roll{0.3, 0.01, 0.05, -10.0, 10.0, 5.0};
    PIDGains pitch{0.3, 0.01, 0.05, -10.0, 10.0, 5.0};
    PIDGains height{8.0, 0.5, 1.0, -0.05, 0.05, 0.05};
    PostureMapping postureMapping;
    HeightMapping heightMapping;
    double targetHeight = 0.24;     // meters
    double maxCorrection = 3.0;     // degrees per joint per tick, applied to the summed delta
    BaselinePose baseline = defaultBaselinePose();
    JointRanges ranges = defaultJointRanges();

    void validate() const;
};

struct StandingState {
    PostureState posture;
    PIDState height;

    // Commands clamped to their joint range, per joint and in total
    std::map<std::string, std::size_t> saturations;
    std::size_t totalSaturations = 0;
};

// Single orchestration point: one command per control tick built from the
// baseline pose plus posture and height corrections, clamped to joint ranges.
class StandingController {
public:
    // Throws ConfigurationError on invalid gains, pose, ranges or limits.
    explicit StandingController(const StandingConfig& config);

    // Deterministic in (state, robot, dt). Command keys are exactly the
    // baseline joints. Throws InvalidInput on dt <= 0 or a non-finite state.
    ControlCommand compute(StandingState& state, const RobotState& robot, double dt) const;

    static void reset(StandingState& state);

    const StandingConfig& getConfig() const { return config_; }
    const PostureController& getPostureController() const { return posture_; }
    const CenterOfMassController& getCenterOfMassController() const { return com_; }

private:
    double jointDelta(const std::string& joint, const PostureCorrection& posture,
                      const HeightCorrection& height) const;

    StandingConfig config_;
    PostureController posture_;
    CenterOfMassController com_;
};

} // namespace BalanceControl
