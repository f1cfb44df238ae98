#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <vector>

namespace vigil::core {

/// Axis-aligned face rectangle in image pixel coordinates; (x2, y2) is exclusive.
struct FaceBox {
  int x1{0};
  int y1{0};
  int x2{0};
  int y2{0};

  [[nodiscard]] int width() const noexcept { return x2 - x1; }
  [[nodiscard]] int height() const noexcept { return y2 - y1; }

  friend bool operator==(const FaceBox&, const FaceBox&) = default;
};

/// Single facial keypoint (eye corner, nose tip, ...).
struct Landmark {
  float x{0.f};
  float y{0.f};
};

/// Ordered keypoints; crop-normalized from the landmark detector, pixels after rescale_landmarks().
using LandmarkSet = std::vector<Landmark>;

/// Size of the reference (iBUG 300-W) landmark layout.
inline constexpr std::size_t kReferenceLandmarkCount = 68;

/// Maps crop-normalized landmarks to image pixels: both coordinates are scaled
/// by the box width (face boxes are square), then offset by the box top-left.
[[nodiscard]] LandmarkSet rescale_landmarks(const LandmarkSet& marks, const FaceBox& box);

/// Copies the box region out of an 8-bit frame (same pixel format).
/// Empty boxes, boxes outside the frame and float frames yield InvalidFrame.
[[nodiscard]] std::expected<Frame, AnalysisError> crop_frame(const Frame& frame,
                                                             const FaceBox& box);

}  // namespace vigil::core
