#include "StabilityMetrics.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace BalanceControl {

namespace {

struct Moments {
    double mean = 0.0;
    double stddev = 0.0;
};

// Population statistics (divides by N), accumulated relative to the first
// sample so a constant series has exactly zero deviation
template<typename Getter>
Moments moments(const std::vector<StabilitySample>& history, Getter get) {
    Moments m;
    if (history.empty()) return m;

    const double reference = get(history.front());
    const double n = static_cast<double>(history.size());

    double sum = 0.0;
    for (const auto& s : history) sum += get(s) - reference;
    const double shiftedMean = sum / n;
    m.mean = reference + shiftedMean;

    double sq = 0.0;
    for (const auto& s : history) {
        double d = (get(s) - reference) - shiftedMean;
        sq += d * d;
    }
    m.stddev = std::sqrt(sq / n);
    return m;
}

double saturatingScore(double value, double scale) {
    return std::clamp(100.0 / (1.0 + value / scale), 0.0, 100.0);
}

void requirePositive(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream oss;
        oss << "stability." << name << " must be positive, got " << value;
        throw ConfigurationError(oss.str());
    }
}

void requireNonNegative(double value, const char* name) {
    if (!std::isfinite(value) || value < 0.0) {
        std::ostringstream oss;
        oss << "stability." << name << " must be non-negative, got " << value;
        throw ConfigurationError(oss.str());
    }
}

} // namespace

void StabilityConfig::validate() const {
    requireNonNegative(minHeight, "min_height");
    requirePositive(maxTilt, "max_tilt");
    requirePositive(maxDrift, "max_drift");
    requirePositive(heightScale, "height_scale");
    requirePositive(attitudeScale, "attitude_scale");
    requirePositive(driftScale, "drift_scale");
    requireNonNegative(heightWeight, "weights.height");
    requireNonNegative(attitudeWeight, "weights.attitude");
    requireNonNegative(driftWeight, "weights.drift");
    if (heightWeight + attitudeWeight + driftWeight <= 0.0) {
        throw ConfigurationError("stability weights must not all be zero");
    }
}

std::map<std::string, double> StabilitySummary::toRecord() const {
    return {
        {"samples", static_cast<double>(samples)},
        {"duration", duration},
        {"height_mean", heightMean},
        {"height_min", heightMin},
        {"height_max", heightMax},
        {"height_std", heightStd},
        {"roll_mean_abs", rollMeanAbs},
        {"pitch_mean_abs", pitchMeanAbs},
        {"roll_max_abs", rollMaxAbs},
        {"pitch_max_abs", pitchMaxAbs},
        {"drift_max", driftMax},
        {"drift_final", driftFinal},
        {"score_height", score.height},
        {"score_attitude", score.attitude},
        {"score_drift", score.drift},
        {"score", score.total},
        {"is_stable", isStable ? 1.0 : 0.0},
    };
}

StabilityMetrics::StabilityMetrics(const StabilityConfig& config) : config_(config) {
    config_.validate();
}

void StabilityMetrics::update(const RobotState& state) {
    validateRobotState(state);

    const Vec3& p = state.base.position;
    if (history_.empty()) {
        originX_ = p.x;
        originY_ = p.y;
    }

    StabilitySample s;
    s.timestamp = state.timestamp;
    s.height = p.z;
    s.roll = state.base.orientation.roll;
    s.pitch = state.base.orientation.pitch;
    s.drift = std::hypot(p.x - originX_, p.y - originY_);
    history_.push_back(s);
}

bool StabilityMetrics::isStable() const {
    if (history_.empty()) return false;

    const StabilitySample& s = history_.back();
    return s.height > config_.minHeight
        && std::abs(s.roll) < config_.maxTilt
        && std::abs(s.pitch) < config_.maxTilt
        && s.drift < config_.maxDrift;
}

StabilityScore StabilityMetrics::scoreBreakdown() const {
    StabilityScore score;
    if (history_.empty()) return score;

    double heightStd = moments(history_, [](const StabilitySample& s) { return s.height; }).stddev;
    double rollStd = moments(history_, [](const StabilitySample& s) { return s.roll; }).stddev;
    double pitchStd = moments(history_, [](const StabilitySample& s) { return s.pitch; }).stddev;
    double maxDrift = 0.0;
    for (const auto& s : history_) maxDrift = std::max(maxDrift, s.drift);

    score.height = saturatingScore(heightStd, config_.heightScale);
    score.attitude = saturatingScore(std::hypot(rollStd, pitchStd), config_.attitudeScale);
    score.drift = saturatingScore(maxDrift, config_.driftScale);

    double weightSum = config_.heightWeight + config_.attitudeWeight + config_.driftWeight;
    score.total = (config_.heightWeight * score.height
                 + config_.attitudeWeight * score.attitude
                 + config_.driftWeight * score.drift) / weightSum;
    score.total = std::clamp(score.total, 0.0, 100.0);
    return score;
}

StabilitySummary StabilityMetrics::summary() const {
    StabilitySummary sum;
    sum.samples = history_.size();
    if (history_.empty()) return sum;

    Moments h = moments(history_, [](const StabilitySample& s) { return s.height; });
    sum.heightMean = h.mean;
    sum.heightStd = h.stddev;
    sum.heightMin = history_.front().height;
    sum.heightMax = history_.front().height;

    double rollAbs = 0.0;
    double pitchAbs = 0.0;
    for (const auto& s : history_) {
        sum.heightMin = std::min(sum.heightMin, s.height);
        sum.heightMax = std::max(sum.heightMax, s.height);
        rollAbs += std::abs(s.roll);
        pitchAbs += std::abs(s.pitch);
        sum.rollMaxAbs = std::max(sum.rollMaxAbs, std::abs(s.roll));
        sum.pitchMaxAbs = std::max(sum.pitchMaxAbs, std::abs(s.pitch));
        sum.driftMax = std::max(sum.driftMax, s.drift);
    }
    sum.rollMeanAbs = rollAbs / history_.size();
    sum.pitchMeanAbs = pitchAbs / history_.size();
    sum.driftFinal = history_.back().drift;
    sum.duration = history_.back().timestamp - history_.front().timestamp;

    sum.score = scoreBreakdown();
    sum.isStable = isStable();
    return sum;
}

void StabilityMetrics::reset() {
    history_.clear();
    originX_ = 0.0;
    originY_ = 0.0;
}

} // namespace BalanceControl
