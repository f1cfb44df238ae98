#pragma once

#include <vigil/core/head_pose.hpp>

namespace vigil::core {

/// Default pitch threshold in radians (~17 degrees).
inline constexpr double kPitchThreshold = 0.3;
/// Default yaw threshold in radians (~23 degrees).
inline constexpr double kYawThreshold = 0.4;

/// Thresholds for DirectionClassifier; comparisons are strict.
struct DirectionThresholds {
  double pitch{kPitchThreshold};
  double yaw{kYawThreshold};
};

/// Where the head points, plus the source angles for observability.
/// looking_straight is true iff none of the four directional flags is set.
/// Pitch and yaw are evaluated independently, so one vertical and one
/// horizontal flag may be set together (diagonal gaze).
struct DirectionVerdict {
  bool looking_up{false};
  bool looking_down{false};
  bool looking_left{false};
  bool looking_right{false};
  bool looking_straight{true};
  double pitch{0.0};
  double yaw{0.0};
  double roll{0.0};
};

/// Classifies a rotation estimate. Total over any input: non-finite angles
/// fail every comparison and therefore classify as straight. Roll is carried
/// through but never sets a flag.
[[nodiscard]] DirectionVerdict classify_direction(const RotationEstimate& rotation,
                                                  const DirectionThresholds& thresholds = {});

}  // namespace vigil::core
