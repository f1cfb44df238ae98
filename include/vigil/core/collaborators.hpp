#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/face.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/core/head_pose.hpp>
#include <cstdint>
#include <expected>
#include <optional>

namespace vigil::core {

/// Model-backed collaborators of FrameAnalysisPipeline. Instances are loaded once
/// and shared read-only between requests: every method is const and must be safe
/// to call concurrently (implementations gate non-reentrant runtimes internally).

/// Locates the face to analyze. nullopt is a valid outcome (no face in frame).
class IFaceDetector {
 public:
  virtual ~IFaceDetector() = default;

  [[nodiscard]] virtual std::expected<std::optional<FaceBox>, AnalysisError> detect(
      const Frame& image) const = 0;
};

/// Extracts facial keypoints from a face crop, normalized to [0, 1] of the crop.
class ILandmarkDetector {
 public:
  virtual ~ILandmarkDetector() = default;

  [[nodiscard]] virtual std::expected<LandmarkSet, AnalysisError> detect_marks(
      const Frame& face_crop) const = 0;
};

/// Solves head rotation/translation from landmarks in image pixel coordinates.
class IPoseSolver {
 public:
  virtual ~IPoseSolver() = default;

  [[nodiscard]] virtual std::expected<PoseEstimate, AnalysisError> solve_pose(
      const LandmarkSet& image_points,
      std::uint32_t image_width,
      std::uint32_t image_height) const = 0;
};

}  // namespace vigil::core
