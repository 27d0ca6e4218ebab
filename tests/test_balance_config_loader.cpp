#include <gtest/gtest.h>

#include "BalanceConfig.h"
#include "BalanceConfigLoader.h"
#include "JointLayout.h"

#include <cstdio>
#include <string>

using namespace BalanceControl;

namespace {

std::string ShippedConfigPath() {
    return std::string(BALANCE_CONFIG_DIR) + "/balance_config.yaml";
}

std::string TempPath(const char* name) {
    return testing::TempDir() + name;
}

}  // namespace

TEST(BalanceConfigLoaderTest, EmptyDocumentYieldsDefaults) {
    BalanceConfig config = BalanceConfigLoader::parse("");
    BalanceConfig defaults;

    EXPECT_DOUBLE_EQ(config.controller.targetHeight, defaults.controller.targetHeight);
    EXPECT_DOUBLE_EQ(config.controller.roll.kp, defaults.controller.roll.kp);
    EXPECT_EQ(config.controller.baseline, defaults.controller.baseline);
    EXPECT_DOUBLE_EQ(config.stability.maxTilt, 30.0);
    EXPECT_DOUBLE_EQ(config.simulation.timeStep, 0.001);
    EXPECT_EQ(config.logLevel, "info");
}

TEST(BalanceConfigLoaderTest, ShippedConfigurationLoads) {
    BalanceConfig config = BalanceConfigLoader::load(ShippedConfigPath());

    EXPECT_DOUBLE_EQ(config.controller.targetHeight, 0.24);
    EXPECT_DOUBLE_EQ(config.controller.maxCorrection, 3.0);
    EXPECT_DOUBLE_EQ(config.controller.heightMapping.kneeGain, 150.0);
    EXPECT_DOUBLE_EQ(config.controller.postureMapping.anklePitchGain, -0.2);
    EXPECT_DOUBLE_EQ(config.controller.baseline.at(Joints::LEFT_KNEE), 20.0);
    EXPECT_DOUBLE_EQ(config.controller.ranges.at(Joints::LEFT_KNEE).max, 90.0);
    EXPECT_DOUBLE_EQ(config.stability.heightWeight, 0.4);
    EXPECT_EQ(config.simulation.noiseSeed, 42);
    EXPECT_EQ(config.simulation.stepsPerControl(), 10);
}

TEST(BalanceConfigLoaderTest, PartialSectionsOverrideOnlyGivenKeys) {
    BalanceConfig config = BalanceConfigLoader::parse(
        "controller:\n"
        "  roll:\n"
        "    kp: 0.8\n"
        "  height_mapping:\n"
        "    knee_gain: 120\n"
        "stability:\n"
        "  weights:\n"
        "    drift: 0.0\n"
        "log_level: verbose\n");

    EXPECT_DOUBLE_EQ(config.controller.roll.kp, 0.8);
    EXPECT_DOUBLE_EQ(config.controller.roll.ki, 0.01);
    EXPECT_DOUBLE_EQ(config.controller.pitch.kp, 0.3);
    EXPECT_DOUBLE_EQ(config.controller.heightMapping.kneeGain, 120.0);
    EXPECT_DOUBLE_EQ(config.stability.driftWeight, 0.0);
    EXPECT_DOUBLE_EQ(config.stability.heightWeight, 0.4);
    EXPECT_EQ(config.logLevel, "verbose");
}

TEST(BalanceConfigLoaderTest, JointRangesMergeOverDefaults) {
    BalanceConfig config = BalanceConfigLoader::parse(
        "joint_ranges:\n"
        "  head_pitch: [-10, 10]\n");

    EXPECT_DOUBLE_EQ(config.controller.ranges.at(Joints::HEAD_PITCH).min, -10.0);
    EXPECT_DOUBLE_EQ(config.controller.ranges.at(Joints::HEAD_PITCH).max, 10.0);
    EXPECT_DOUBLE_EQ(config.controller.ranges.at(Joints::LEFT_KNEE).max, 90.0);
}

TEST(BalanceConfigLoaderTest, BaselinePoseReplacesDefaults) {
    BalanceConfig config = BalanceConfigLoader::parse(
        "baseline_pose:\n"
        "  left_knee: 30\n"
        "  right_knee: 30\n");

    EXPECT_EQ(config.controller.baseline.size(), 2u);
    EXPECT_DOUBLE_EQ(config.controller.baseline.at(Joints::RIGHT_KNEE), 30.0);
}

TEST(BalanceConfigLoaderTest, InvalidValuesRaiseConfigurationError) {
    EXPECT_THROW(BalanceConfigLoader::parse("controller:\n  roll:\n    kp: -1\n"), ConfigurationError);
    EXPECT_THROW(BalanceConfigLoader::parse("controller:\n  max_correction: 0\n"), ConfigurationError);
    EXPECT_THROW(BalanceConfigLoader::parse("controller:\n  target_height: fast\n"), ConfigurationError);
    EXPECT_THROW(BalanceConfigLoader::parse("stability:\n  weights:\n    height: -0.5\n"), ConfigurationError);
    EXPECT_THROW(BalanceConfigLoader::parse("simulation:\n  time_step: 0\n"), ConfigurationError);
    EXPECT_THROW(BalanceConfigLoader::parse("simulation:\n  control_period: 0.0005\n"), ConfigurationError);
    EXPECT_THROW(BalanceConfigLoader::parse("log_level: chatty\n"), ConfigurationError);
}

TEST(BalanceConfigLoaderTest, MalformedStructureRaisesConfigurationError) {
    EXPECT_THROW(BalanceConfigLoader::parse("- just\n- a list\n"), ConfigurationError);
    EXPECT_THROW(BalanceConfigLoader::parse("controller: 3\n"), ConfigurationError);
    EXPECT_THROW(BalanceConfigLoader::parse("joint_ranges:\n  left_knee: [0, 90, 120]\n"), ConfigurationError);
    EXPECT_THROW(BalanceConfigLoader::parse("baseline_pose:\n  left_knee: 20\n"), ConfigurationError);
    EXPECT_THROW(BalanceConfigLoader::parse("controller: {roll: [1, 2\n"), ConfigurationError);
}

TEST(BalanceConfigLoaderTest, ErrorMessageNamesTheKey) {
    try {
        BalanceConfigLoader::parse("controller:\n  pitch:\n    kd: abc\n");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("controller.pitch.kd"), std::string::npos) << e.what();
    }
}

TEST(BalanceConfigLoaderTest, MissingFileRaisesConfigurationError) {
    EXPECT_THROW(BalanceConfigLoader::load(TempPath("does_not_exist.yaml")), ConfigurationError);
}

TEST(BalanceConfigLoaderTest, SavedConfigurationLoadsBack) {
    BalanceConfig config;
    config.controller.roll.kp = 0.45;
    config.controller.maxCorrection = 2.5;
    config.controller.ranges[Joints::HEAD_PITCH] = JointRange{-15.0, 15.0};
    config.stability.driftWeight = 0.1;
    config.simulation.noiseSeed = 7;
    config.logLevel = "warning";

    const std::string path = TempPath("balance_config_saved.yaml");
    BalanceConfigLoader::save(path, config);
    BalanceConfig loaded = BalanceConfigLoader::load(path);
    std::remove(path.c_str());

    EXPECT_NEAR(loaded.controller.roll.kp, 0.45, 1e-12);
    EXPECT_NEAR(loaded.controller.maxCorrection, 2.5, 1e-12);
    EXPECT_NEAR(loaded.controller.ranges.at(Joints::HEAD_PITCH).max, 15.0, 1e-12);
    EXPECT_NEAR(loaded.stability.driftWeight, 0.1, 1e-12);
    EXPECT_EQ(loaded.simulation.noiseSeed, 7);
    EXPECT_EQ(loaded.logLevel, "warning");
    EXPECT_EQ(loaded.controller.baseline.size(), config.controller.baseline.size());
}
