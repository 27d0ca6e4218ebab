#include <gtest/gtest.h>

#include "BalanceTypes.h"
#include "JointLayout.h"

#include <limits>
#include <string>

using namespace BalanceControl;

TEST(JointLayoutTest, ClassifiesJointNames) {
    EXPECT_EQ(jointRole("left_hip_roll"), JointRole::HIP_ROLL);
    EXPECT_EQ(jointRole("right_hip_pitch"), JointRole::HIP_PITCH);
    EXPECT_EQ(jointRole("left_knee"), JointRole::KNEE);
    EXPECT_EQ(jointRole("right_ankle_pitch"), JointRole::ANKLE_PITCH);
    EXPECT_EQ(jointRole("head_pitch"), JointRole::OTHER);
    EXPECT_EQ(jointRole("left_elbow"), JointRole::OTHER);

    EXPECT_EQ(jointSide("left_knee"), LegSide::LEFT);
    EXPECT_EQ(jointSide("right_knee"), LegSide::RIGHT);
    EXPECT_EQ(jointSide("head_pitch"), LegSide::NONE);
}

TEST(JointLayoutTest, MirrorsSidedJoints) {
    EXPECT_EQ(mirrorJoint("left_ankle_pitch"), "right_ankle_pitch");
    EXPECT_EQ(mirrorJoint("right_hip_roll"), "left_hip_roll");
    EXPECT_TRUE(mirrorJoint("head_pitch").empty());
}

TEST(JointLayoutTest, RangeClampsAndContains) {
    JointRange range{-20.0, 20.0};
    EXPECT_TRUE(range.contains(-20.0));
    EXPECT_TRUE(range.contains(20.0));
    EXPECT_FALSE(range.contains(20.1));
    EXPECT_DOUBLE_EQ(range.clamp(35.0), 20.0);
    EXPECT_DOUBLE_EQ(range.clamp(-35.0), -20.0);
    EXPECT_DOUBLE_EQ(range.clamp(5.0), 5.0);
}

TEST(JointLayoutTest, DefaultPoseCoversEveryJoint) {
    BaselinePose pose = defaultBaselinePose();
    JointRanges ranges = defaultJointRanges();

    EXPECT_EQ(pose.size(), Joints::all().size());
    for (const auto& joint : Joints::all()) {
        ASSERT_EQ(pose.count(joint), 1u) << joint;
        ASSERT_EQ(ranges.count(joint), 1u) << joint;
        EXPECT_TRUE(ranges.at(joint).contains(pose.at(joint))) << joint;
    }
    EXPECT_NO_THROW(validatePose(pose, ranges));
}

TEST(JointLayoutTest, DefaultPoseKeepsFeetFlat) {
    BaselinePose pose = defaultBaselinePose();
    for (const char* side : {"left_", "right_"}) {
        std::string s(side);
        double hip = pose.at(s + "hip_pitch");
        double knee = pose.at(s + "knee");
        double ankle = pose.at(s + "ankle_pitch");
        EXPECT_DOUBLE_EQ(hip - knee - ankle, 0.0) << side;
    }
}

TEST(JointLayoutTest, ValidatePoseRejectsBadPoses) {
    JointRanges ranges = defaultJointRanges();

    EXPECT_THROW(validatePose(BaselinePose{}, ranges), ConfigurationError);

    BaselinePose outOfRange = defaultBaselinePose();
    outOfRange["left_knee"] = -5.0;
    outOfRange["right_knee"] = -5.0;
    EXPECT_THROW(validatePose(outOfRange, ranges), ConfigurationError);

    BaselinePose asymmetric = defaultBaselinePose();
    asymmetric["left_hip_pitch"] = 12.0;
    EXPECT_THROW(validatePose(asymmetric, ranges), ConfigurationError);

    BaselinePose unpaired = defaultBaselinePose();
    unpaired.erase("right_ankle_pitch");
    EXPECT_THROW(validatePose(unpaired, ranges), ConfigurationError);

    BaselinePose notFinite = defaultBaselinePose();
    notFinite["head_pitch"] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validatePose(notFinite, ranges), ConfigurationError);

    JointRanges missing = defaultJointRanges();
    missing.erase("head_pitch");
    EXPECT_THROW(validatePose(defaultBaselinePose(), missing), ConfigurationError);

    JointRanges inverted = defaultJointRanges();
    inverted["head_pitch"] = JointRange{10.0, -10.0};
    EXPECT_THROW(validatePose(defaultBaselinePose(), inverted), ConfigurationError);
}
