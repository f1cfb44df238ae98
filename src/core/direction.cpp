#include <vigil/core/direction.hpp>

namespace vigil::core {

DirectionVerdict classify_direction(const RotationEstimate& rotation,
                                    const DirectionThresholds& thresholds) {
  DirectionVerdict v;
  v.pitch = rotation.pitch;
  v.yaw = rotation.yaw;
  v.roll = rotation.roll;

  v.looking_up = rotation.pitch < -thresholds.pitch;
  v.looking_down = rotation.pitch > thresholds.pitch;

  // Negative yaw: subject turned toward their own right.
  v.looking_right = rotation.yaw < -thresholds.yaw;
  v.looking_left = rotation.yaw > thresholds.yaw;

  v.looking_straight =
      !(v.looking_up || v.looking_down || v.looking_left || v.looking_right);
  return v;
}

}  // namespace vigil::core
