#pragma once

#include <cmath>

namespace vigil::core {

/// Head rotation in radians: pitch (up/down), yaw (left/right), roll (tilt).
struct RotationEstimate {
  double pitch{0.0};
  double yaw{0.0};
  double roll{0.0};
};

/// Camera-space head translation from the pose solve (model units).
struct TranslationVector {
  double x{0.0};
  double y{0.0};
  double z{0.0};
};

/// Output of one pose solve.
struct PoseEstimate {
  RotationEstimate rotation{};
  TranslationVector translation{};
};

[[nodiscard]] inline bool is_finite(const RotationEstimate& r) noexcept {
  return std::isfinite(r.pitch) && std::isfinite(r.yaw) && std::isfinite(r.roll);
}

}  // namespace vigil::core
