#pragma once

#include <vigil/core/collaborators.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/face.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/core/head_pose.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>

namespace vigil::vision {

/// Mock face detector (for tests/demo). Default-constructed it reports a centred
/// square face covering half the shorter image side; otherwise it returns the
/// configured box, or no face for nullopt. Counts calls.
class MockFaceDetector : public vigil::core::IFaceDetector {
 public:
  MockFaceDetector() = default;
  explicit MockFaceDetector(std::optional<vigil::core::FaceBox> box)
      : box_(box), centered_(false) {}

  void set_face(std::optional<vigil::core::FaceBox> box) {
    box_ = box;
    centered_ = false;
  }
  void set_failure(std::optional<vigil::core::AnalysisError> error) { failure_ = error; }

  [[nodiscard]] std::expected<std::optional<vigil::core::FaceBox>, vigil::core::AnalysisError>
  detect(const vigil::core::Frame& image) const override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

 private:
  std::optional<vigil::core::FaceBox> box_;
  bool centered_{true};
  std::optional<vigil::core::AnalysisError> failure_;
  mutable std::atomic<std::size_t> calls_{0};
};

/// Mock landmark detector: returns a fixed crop-normalized landmark set.
/// Default: kReferenceLandmarkCount points spread over a grid inside the crop.
class MockLandmarkDetector : public vigil::core::ILandmarkDetector {
 public:
  MockLandmarkDetector();
  explicit MockLandmarkDetector(vigil::core::LandmarkSet marks) : marks_(std::move(marks)) {}

  void set_failure(std::optional<vigil::core::AnalysisError> error) { failure_ = error; }

  [[nodiscard]] std::expected<vigil::core::LandmarkSet, vigil::core::AnalysisError>
  detect_marks(const vigil::core::Frame& face_crop) const override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

 private:
  vigil::core::LandmarkSet marks_;
  std::optional<vigil::core::AnalysisError> failure_;
  mutable std::atomic<std::size_t> calls_{0};
};

/// Mock pose solver: returns a configured pose and remembers the last landmarks it saw.
class MockPoseSolver : public vigil::core::IPoseSolver {
 public:
  MockPoseSolver() = default;
  explicit MockPoseSolver(vigil::core::PoseEstimate pose) : pose_(pose) {}

  void set_pose(vigil::core::PoseEstimate pose) { pose_ = pose; }
  void set_failure(std::optional<vigil::core::AnalysisError> error) { failure_ = error; }

  [[nodiscard]] std::expected<vigil::core::PoseEstimate, vigil::core::AnalysisError>
  solve_pose(const vigil::core::LandmarkSet& image_points,
             std::uint32_t image_width,
             std::uint32_t image_height) const override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

  /// First landmark of the last call (not synchronized; single-threaded tests only).
  [[nodiscard]] std::optional<vigil::core::Landmark> last_first_point() const {
    return last_first_point_;
  }

 private:
  vigil::core::PoseEstimate pose_{};
  std::optional<vigil::core::AnalysisError> failure_;
  mutable std::atomic<std::size_t> calls_{0};
  mutable std::optional<vigil::core::Landmark> last_first_point_;
};

}  // namespace vigil::vision
