#include "PIDController.h"
#include "BalanceTypes.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace BalanceControl {

namespace {

void requireGain(double value, const std::string& axis, const char* name) {
    if (std::isnan(value) || value < 0.0) {
        std::ostringstream oss;
        oss << axis << "." << name << " must be a non-negative number, got " << value;
        throw ConfigurationError(oss.str());
    }
}

} // namespace

void PIDGains::validate(const std::string& axis) const {
    requireGain(kp, axis, "kp");
    requireGain(ki, axis, "ki");
    requireGain(kd, axis, "kd");
    requireGain(integralLimit, axis, "integral_limit");

    if (std::isnan(outputMin) || std::isnan(outputMax)) {
        throw ConfigurationError(axis + ": output limits must not be NaN");
    }
    if (outputMin > outputMax) {
        std::ostringstream oss;
        oss << axis << ": output_min (" << outputMin << ") exceeds output_max (" << outputMax << ")";
        throw ConfigurationError(oss.str());
    }
}

PIDController::PIDController(const PIDGains& gains, const std::string& axis)
    : gains_(gains), axis_(axis) {
    gains_.validate(axis_);
}

double PIDController::update(PIDState& state, double error, double dt) const {
    validateTimeStep(dt, axis_.c_str());
    if (!std::isfinite(error)) {
        throw InvalidInput(axis_ + ": error term is not finite");
    }

    // Anti-windup before the derivative
    state.integral += error * dt;
    state.integral = std::clamp(state.integral, -gains_.integralLimit, gains_.integralLimit);

    double derivative = (error - state.previousError) / dt;

    state.lastTerms.proportional = gains_.kp * error;
    state.lastTerms.integral = gains_.ki * state.integral;
    state.lastTerms.derivative = gains_.kd * derivative;

    double output = state.lastTerms.proportional + state.lastTerms.integral + state.lastTerms.derivative;
    output = std::clamp(output, gains_.outputMin, gains_.outputMax);

    state.previousError = error;
    return output;
}

} // namespace BalanceControl
