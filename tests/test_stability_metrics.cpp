#include <gtest/gtest.h>

#include "BalanceTypes.h"
#include "StabilityMetrics.h"

#include <cmath>
#include <limits>
#include <map>
#include <string>

using namespace BalanceControl;

namespace {

RobotState MakeSample(double t, double height, double roll = 0.0, double pitch = 0.0,
                      double x = 0.0, double y = 0.0) {
    RobotState s;
    s.timestamp = t;
    s.base.position = Vec3{x, y, height};
    s.base.orientation.roll = roll;
    s.base.orientation.pitch = pitch;
    return s;
}

// 5 s of quiet standing at 0.25 m sampled every 0.02 s
void FeedIdealRun(StabilityMetrics& metrics) {
    for (int i = 0; i <= 250; ++i) {
        metrics.update(MakeSample(0.02 * i, 0.25));
    }
}

}  // namespace

TEST(StabilityMetricsTest, EmptyHistoryScoresZeroAndIsUnstable) {
    StabilityMetrics metrics;

    EXPECT_TRUE(metrics.empty());
    EXPECT_FALSE(metrics.isStable());
    EXPECT_DOUBLE_EQ(metrics.score(), 0.0);

    StabilitySummary summary = metrics.summary();
    EXPECT_EQ(summary.samples, 0u);
    EXPECT_FALSE(summary.isStable);
    EXPECT_DOUBLE_EQ(summary.score.total, 0.0);
}

TEST(StabilityMetricsTest, IdenticalIdealSamplesScoreFullMarks) {
    StabilityMetrics metrics;
    for (int i = 0; i < 50; ++i) {
        metrics.update(MakeSample(0.01 * i, 0.24));
    }

    StabilityScore score = metrics.scoreBreakdown();
    EXPECT_DOUBLE_EQ(score.height, 100.0);
    EXPECT_DOUBLE_EQ(score.attitude, 100.0);
    EXPECT_DOUBLE_EQ(score.drift, 100.0);
    EXPECT_DOUBLE_EQ(score.total, 100.0);
    EXPECT_TRUE(metrics.isStable());
}

TEST(StabilityMetricsTest, ConstantSeriesHasZeroSpread) {
    StabilityMetrics metrics;
    for (int i = 0; i < 50; ++i) {
        metrics.update(MakeSample(0.01 * i, 0.24, 1.7, -0.3));
    }

    StabilitySummary summary = metrics.summary();
    EXPECT_EQ(summary.heightStd, 0.0);
    EXPECT_EQ(summary.heightMean, 0.24);
    EXPECT_EQ(summary.score.height, 100.0);
    EXPECT_EQ(summary.score.attitude, 100.0);
}

TEST(StabilityMetricsTest, QuietStandingRunIsStableWithHighScore) {
    StabilityMetrics metrics;
    FeedIdealRun(metrics);

    StabilitySummary summary = metrics.summary();
    EXPECT_TRUE(summary.isStable);
    EXPECT_GE(summary.score.total, 95.0);
    EXPECT_EQ(summary.samples, 251u);
    EXPECT_NEAR(summary.duration, 5.0, 1e-9);
    EXPECT_NEAR(summary.heightMean, 0.25, 1e-12);
}

TEST(StabilityMetricsTest, SingleLowSampleOnlyLowersHeightScore) {
    StabilityMetrics metrics;
    for (int i = 0; i <= 250; ++i) {
        double height = (i == 125) ? 0.05 : 0.25;
        metrics.update(MakeSample(0.02 * i, height));
    }

    StabilityScore score = metrics.scoreBreakdown();
    EXPECT_LT(score.height, 50.0);
    EXPECT_GT(score.height, 40.0);
    EXPECT_DOUBLE_EQ(score.attitude, 100.0);
    EXPECT_DOUBLE_EQ(score.drift, 100.0);

    // Latest sample is nominal again
    EXPECT_TRUE(metrics.isStable());
    EXPECT_DOUBLE_EQ(metrics.summary().heightMin, 0.05);
}

TEST(StabilityMetricsTest, StabilityLooksAtLatestSampleOnly) {
    StabilityMetrics metrics;
    metrics.update(MakeSample(0.0, 0.24));
    metrics.update(MakeSample(0.1, 0.24, 31.0, 0.0));
    EXPECT_FALSE(metrics.isStable());

    metrics.update(MakeSample(0.2, 0.24, 2.0, 0.0));
    EXPECT_TRUE(metrics.isStable());
}

TEST(StabilityMetricsTest, EachThresholdMarksUnstable) {
    {
        StabilityMetrics metrics;
        metrics.update(MakeSample(0.0, 0.24, -30.0, 0.0));
        EXPECT_FALSE(metrics.isStable()) << "roll at the limit";
    }
    {
        StabilityMetrics metrics;
        metrics.update(MakeSample(0.0, 0.24, 0.0, 35.0));
        EXPECT_FALSE(metrics.isStable()) << "pitch";
    }
    {
        StabilityMetrics metrics;
        metrics.update(MakeSample(0.0, 0.15));
        EXPECT_FALSE(metrics.isStable()) << "height at the limit";
    }
    {
        StabilityMetrics metrics;
        metrics.update(MakeSample(0.0, 0.24));
        metrics.update(MakeSample(0.1, 0.24, 0.0, 0.0, 0.6, 0.0));
        EXPECT_FALSE(metrics.isStable()) << "drift beyond 0.5 m";
    }
}

TEST(StabilityMetricsTest, DriftIsMeasuredFromFirstSample) {
    StabilityMetrics metrics;
    metrics.update(MakeSample(0.0, 0.24, 0.0, 0.0, 1.0, 2.0));
    metrics.update(MakeSample(0.1, 0.24, 0.0, 0.0, 1.03, 2.04));
    metrics.update(MakeSample(0.2, 0.24, 0.0, 0.0, 1.0, 2.01));

    StabilitySummary summary = metrics.summary();
    EXPECT_NEAR(summary.driftMax, 0.05, 1e-9);
    EXPECT_NEAR(summary.driftFinal, 0.01, 1e-9);
    // 100 / (1 + 0.05 / 0.05)
    EXPECT_NEAR(summary.score.drift, 50.0, 1e-6);
}

TEST(StabilityMetricsTest, SummaryReportsAbsoluteAttitude) {
    StabilityMetrics metrics;
    metrics.update(MakeSample(0.0, 0.24, 2.0, -1.0));
    metrics.update(MakeSample(0.1, 0.22, -4.0, 3.0));

    StabilitySummary summary = metrics.summary();
    EXPECT_NEAR(summary.rollMeanAbs, 3.0, 1e-12);
    EXPECT_NEAR(summary.pitchMeanAbs, 2.0, 1e-12);
    EXPECT_NEAR(summary.rollMaxAbs, 4.0, 1e-12);
    EXPECT_NEAR(summary.pitchMaxAbs, 3.0, 1e-12);
    EXPECT_NEAR(summary.heightMin, 0.22, 1e-12);
    EXPECT_NEAR(summary.heightMax, 0.24, 1e-12);
    EXPECT_NEAR(summary.heightStd, 0.01, 1e-12);
}

TEST(StabilityMetricsTest, SummaryIsIdempotent) {
    StabilityMetrics metrics;
    metrics.update(MakeSample(0.0, 0.24, 1.0, -0.5, 0.0, 0.0));
    metrics.update(MakeSample(0.1, 0.23, -2.0, 0.5, 0.01, 0.0));

    std::map<std::string, double> first = metrics.summary().toRecord();
    std::map<std::string, double> second = metrics.summary().toRecord();
    EXPECT_EQ(first, second);
    EXPECT_EQ(metrics.getHistory().size(), 2u);
}

TEST(StabilityMetricsTest, RecordContainsReportKeys) {
    StabilityMetrics metrics;
    FeedIdealRun(metrics);

    std::map<std::string, double> record = metrics.summary().toRecord();
    for (const char* key : {"samples", "height_mean", "height_min", "height_max", "roll_mean_abs",
                            "pitch_mean_abs", "drift_max", "score", "is_stable"}) {
        EXPECT_EQ(record.count(key), 1u) << key;
    }
    EXPECT_DOUBLE_EQ(record.at("is_stable"), 1.0);
    EXPECT_DOUBLE_EQ(record.at("samples"), 251.0);
}

TEST(StabilityMetricsTest, WeightsAreConfigurable) {
    StabilityConfig config;
    config.heightWeight = 0.0;
    config.attitudeWeight = 0.0;
    config.driftWeight = 1.0;
    StabilityMetrics metrics(config);

    // Noisy height, no drift: only the drift sub-score counts
    metrics.update(MakeSample(0.0, 0.20));
    metrics.update(MakeSample(0.1, 0.30));
    EXPECT_LT(metrics.scoreBreakdown().height, 100.0);
    EXPECT_DOUBLE_EQ(metrics.score(), 100.0);
}

TEST(StabilityMetricsTest, ResetClearsHistoryAndReference) {
    StabilityMetrics metrics;
    metrics.update(MakeSample(0.0, 0.24, 0.0, 0.0, 5.0, 5.0));
    metrics.reset();

    EXPECT_TRUE(metrics.empty());
    EXPECT_DOUBLE_EQ(metrics.score(), 0.0);

    metrics.update(MakeSample(0.0, 0.24, 0.0, 0.0, 0.0, 0.0));
    EXPECT_DOUBLE_EQ(metrics.getHistory().back().drift, 0.0);
}

TEST(StabilityMetricsTest, NonFiniteStateIsRejected) {
    StabilityMetrics metrics;
    EXPECT_THROW(metrics.update(MakeSample(0.0, std::numeric_limits<double>::quiet_NaN())), InvalidInput);
    EXPECT_THROW(metrics.update(MakeSample(0.0, 0.24, std::numeric_limits<double>::infinity())), InvalidInput);
    EXPECT_TRUE(metrics.empty());
}

TEST(StabilityMetricsTest, InvalidConfigurationIsRejected) {
    StabilityConfig zeroWeights;
    zeroWeights.heightWeight = 0.0;
    zeroWeights.attitudeWeight = 0.0;
    zeroWeights.driftWeight = 0.0;
    EXPECT_THROW(StabilityMetrics{zeroWeights}, ConfigurationError);

    StabilityConfig negativeWeight;
    negativeWeight.driftWeight = -0.2;
    EXPECT_THROW(StabilityMetrics{negativeWeight}, ConfigurationError);

    StabilityConfig zeroScale;
    zeroScale.heightScale = 0.0;
    EXPECT_THROW(StabilityMetrics{zeroScale}, ConfigurationError);
}
