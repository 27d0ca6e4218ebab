#pragma once

#include <limits>
#include <string>

namespace BalanceControl {

// ============================================================================
// PID PRIMITIVE
// ============================================================================

struct PIDGains {
    double kp = 0.0;
    double ki = 0.0;
    double kd = 0.0;
    double outputMin = -std::numeric_limits<double>::infinity();
    double outputMax = std::numeric_limits<double>::infinity();
    double integralLimit = std::numeric_limits<double>::infinity();

    // Throws ConfigurationError naming the axis on negative/NaN gains,
    // negative integral limit or outputMin > outputMax.
    void validate(const std::string& axis) const;
};

// Contribution of each term to the last output, before output clamping.
struct PIDTerms {
    double proportional = 0.0;
    double integral = 0.0;
    double derivative = 0.0;
};

// Accumulator owned by the caller and threaded through update().
struct PIDState {
    double integral = 0.0;
    double previousError = 0.0;
    PIDTerms lastTerms;

    void reset() {
        integral = 0.0;
        previousError = 0.0;
        lastTerms = PIDTerms{};
    }
};

class PIDController {
public:
    explicit PIDController(const PIDGains& gains, const std::string& axis = "pid");

    // integral += e*dt, clamped to +-integralLimit before the derivative is taken;
    // output = kp*e + ki*I + kd*(e - e_prev)/dt, clamped to [outputMin, outputMax].
    // Throws InvalidInput on dt <= 0 or a non-finite error.
    double update(PIDState& state, double error, double dt) const;

    static void reset(PIDState& state) { state.reset(); }

    const PIDGains& getGains() const { return gains_; }
    const std::string& getAxis() const { return axis_; }

private:
    PIDGains gains_;
    std::string axis_;
};

} // namespace BalanceControl
