#include <vigil/core/direction.hpp>
#include <vigil/core/head_pose.hpp>
#include <gtest/gtest.h>
#include <limits>

namespace vc = vigil::core;

TEST(Direction, ZeroRotationIsStraight) {
  const auto v = vc::classify_direction({0.0, 0.0, 0.0});
  EXPECT_TRUE(v.looking_straight);
  EXPECT_FALSE(v.looking_up);
  EXPECT_FALSE(v.looking_down);
  EXPECT_FALSE(v.looking_left);
  EXPECT_FALSE(v.looking_right);
}

TEST(Direction, PitchSignSelectsUpOrDown) {
  const auto down = vc::classify_direction({0.5, 0.0, 0.0});
  EXPECT_TRUE(down.looking_down);
  EXPECT_FALSE(down.looking_up);
  EXPECT_FALSE(down.looking_straight);

  const auto up = vc::classify_direction({-0.5, 0.0, 0.0});
  EXPECT_TRUE(up.looking_up);
  EXPECT_FALSE(up.looking_down);
}

TEST(Direction, YawSignSelectsLeftOrRight) {
  const auto right = vc::classify_direction({0.0, -0.5, 0.0});
  EXPECT_TRUE(right.looking_right);
  EXPECT_FALSE(right.looking_left);

  const auto left = vc::classify_direction({0.0, 0.5, 0.0});
  EXPECT_TRUE(left.looking_left);
  EXPECT_FALSE(left.looking_right);
}

TEST(Direction, ValuesExactlyAtThresholdAreStraight) {
  EXPECT_TRUE(vc::classify_direction({0.3, 0.0, 0.0}).looking_straight);
  EXPECT_TRUE(vc::classify_direction({-0.3, 0.0, 0.0}).looking_straight);
  EXPECT_TRUE(vc::classify_direction({0.0, 0.4, 0.0}).looking_straight);
  EXPECT_TRUE(vc::classify_direction({0.0, -0.4, 0.0}).looking_straight);
}

TEST(Direction, DiagonalSetsOneVerticalAndOneHorizontalFlag) {
  const auto v = vc::classify_direction({-0.5, 0.6, 0.0});
  EXPECT_TRUE(v.looking_up);
  EXPECT_TRUE(v.looking_left);
  EXPECT_FALSE(v.looking_down);
  EXPECT_FALSE(v.looking_right);
  EXPECT_FALSE(v.looking_straight);
}

TEST(Direction, RollNeverSetsAFlag) {
  const auto v = vc::classify_direction({0.0, 0.0, 3.1});
  EXPECT_TRUE(v.looking_straight);
  EXPECT_DOUBLE_EQ(v.roll, 3.1);
}

TEST(Direction, CarriesSourceAngles) {
  const auto v = vc::classify_direction({0.1, -0.2, 0.7});
  EXPECT_DOUBLE_EQ(v.pitch, 0.1);
  EXPECT_DOUBLE_EQ(v.yaw, -0.2);
  EXPECT_DOUBLE_EQ(v.roll, 0.7);
}

TEST(Direction, NaNClassifiesAsStraight) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const auto v = vc::classify_direction({nan, nan, nan});
  EXPECT_TRUE(v.looking_straight);
}

TEST(Direction, StraightIsNegationOfFlagsOverAGrid) {
  for (double pitch = -1.0; pitch <= 1.0; pitch += 0.25) {
    for (double yaw = -1.0; yaw <= 1.0; yaw += 0.25) {
      const auto v = vc::classify_direction({pitch, yaw, 0.0});
      EXPECT_EQ(v.looking_straight,
                !(v.looking_up || v.looking_down || v.looking_left || v.looking_right))
          << "pitch=" << pitch << " yaw=" << yaw;
      EXPECT_FALSE(v.looking_up && v.looking_down);
      EXPECT_FALSE(v.looking_left && v.looking_right);
    }
  }
}

TEST(Direction, CustomThresholds) {
  const vc::DirectionThresholds tight{0.1, 0.1};
  EXPECT_TRUE(vc::classify_direction({0.2, 0.0, 0.0}, tight).looking_down);
  EXPECT_TRUE(vc::classify_direction({0.2, 0.0, 0.0}).looking_straight);
}
