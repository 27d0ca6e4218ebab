#include "CenterOfMassController.h"
#include "BalanceTypes.h"

#include <cmath>
#include <sstream>

namespace BalanceControl {

void HeightMapping::validate() const {
    if (!std::isfinite(kneeGain) || kneeGain <= 0.0) {
        std::ostringstream oss;
        oss << "knee_gain must be positive, got " << kneeGain;
        throw ConfigurationError(oss.str());
    }
    if (!std::isfinite(hipPitchRatio) || !std::isfinite(anklePitchRatio)) {
        throw ConfigurationError("height mapping ratios must be finite");
    }
}

CenterOfMassController::CenterOfMassController(const PIDGains& gains, double targetHeight,
                                               const HeightMapping& mapping)
    : pid_(gains, "height"), targetHeight_(targetHeight), mapping_(mapping) {
    if (!std::isfinite(targetHeight_) || targetHeight_ <= 0.0) {
        std::ostringstream oss;
        oss << "target_height must be positive, got " << targetHeight_;
        throw ConfigurationError(oss.str());
    }
    mapping_.validate();
}

HeightCorrection CenterOfMassController::compute(PIDState& state, double currentHeight, double dt) const {
    if (!std::isfinite(currentHeight)) {
        throw InvalidInput("height: current height is not finite");
    }

    HeightCorrection c;
    c.output = pid_.update(state, targetHeight_ - currentHeight, dt);
    c.knee = -mapping_.kneeGain * c.output;
    c.hipPitch = mapping_.hipPitchRatio * c.knee;
    c.anklePitch = mapping_.anklePitchRatio * c.knee;
    return c;
}

} // namespace BalanceControl
