#pragma once

#include "BalanceTypes.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace BalanceControl {

struct StabilityConfig {
    // Pass/fail thresholds on the latest sample
    double minHeight = 0.15;   // m
    double maxTilt = 30.0;     // deg, applied to |roll| and |pitch|
    double maxDrift = 0.5;     // m

    // Sub-score = 100 / (1 + x / scale)
    double heightScale = 0.01;    // m of height std dev that halves the score
    double attitudeScale = 2.0;   // deg of combined roll/pitch std dev
    double driftScale = 0.05;     // m of maximum drift

    double heightWeight = 0.4;
    double attitudeWeight = 0.4;
    double driftWeight = 0.2;

    void validate() const;
};

struct StabilitySample {
    double timestamp = 0.0;
    double height = 0.0;
    double roll = 0.0;
    double pitch = 0.0;
    double drift = 0.0;  // horizontal distance from the first sample
};

struct StabilityScore {
    double height = 0.0;
    double attitude = 0.0;
    double drift = 0.0;
    double total = 0.0;
};

struct StabilitySummary {
    std::size_t samples = 0;
    double duration = 0.0;

    double heightMean = 0.0;
    double heightMin = 0.0;
    double heightMax = 0.0;
    double heightStd = 0.0;

    double rollMeanAbs = 0.0;
    double pitchMeanAbs = 0.0;
    double rollMaxAbs = 0.0;
    double pitchMaxAbs = 0.0;

    double driftMax = 0.0;
    double driftFinal = 0.0;

    StabilityScore score;
    bool isStable = false;

    // Flat name -> value record for printing or export; isStable is 0 or 1
    std::map<std::string, double> toRecord() const;
};

// Accumulates per-tick samples and scores balance quality from the full
// history. Read-only with respect to control.
class StabilityMetrics {
public:
    explicit StabilityMetrics(const StabilityConfig& config = StabilityConfig{});

    // Appends one sample. The first sample fixes the drift reference.
    // Throws InvalidInput on a non-finite state.
    void update(const RobotState& state);

    // Latest sample only; false with no history.
    bool isStable() const;

    // Weighted score over the whole history in [0, 100]; 0 with no history.
    double score() const { return scoreBreakdown().total; }
    StabilityScore scoreBreakdown() const;

    StabilitySummary summary() const;

    void reset();

    const std::vector<StabilitySample>& getHistory() const { return history_; }
    const StabilityConfig& getConfig() const { return config_; }
    bool empty() const { return history_.empty(); }

private:
    StabilityConfig config_;
    std::vector<StabilitySample> history_;
    double originX_ = 0.0;
    double originY_ = 0.0;
};

} // namespace BalanceControl
