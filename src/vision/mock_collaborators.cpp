#include <vigil/vision/mock_collaborators.hpp>
#include <algorithm>
#include <cstddef>

namespace vigil::vision {

std::expected<std::optional<vigil::core::FaceBox>, vigil::core::AnalysisError>
MockFaceDetector::detect(const vigil::core::Frame& image) const {
  ++calls_;
  if (image.empty()) {
    return std::unexpected(vigil::core::AnalysisError::InvalidFrame);
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  if (centered_) {
    const int side = static_cast<int>(std::min(image.width(), image.height()) / 2);
    if (side == 0) return std::optional<vigil::core::FaceBox>{};
    const int x1 = (static_cast<int>(image.width()) - side) / 2;
    const int y1 = (static_cast<int>(image.height()) - side) / 2;
    return std::optional<vigil::core::FaceBox>{vigil::core::FaceBox{x1, y1, x1 + side, y1 + side}};
  }
  return box_;
}

MockLandmarkDetector::MockLandmarkDetector() {
  constexpr std::size_t kColumns = 8;
  marks_.reserve(vigil::core::kReferenceLandmarkCount);
  for (std::size_t i = 0; i < vigil::core::kReferenceLandmarkCount; ++i) {
    const auto col = static_cast<float>(i % kColumns);
    const auto row = static_cast<float>(i / kColumns);
    marks_.push_back({0.1f + 0.1f * col, 0.1f + 0.08f * row});
  }
}

std::expected<vigil::core::LandmarkSet, vigil::core::AnalysisError>
MockLandmarkDetector::detect_marks(const vigil::core::Frame& face_crop) const {
  ++calls_;
  if (face_crop.empty()) {
    return std::unexpected(vigil::core::AnalysisError::InvalidFrame);
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return marks_;
}

std::expected<vigil::core::PoseEstimate, vigil::core::AnalysisError>
MockPoseSolver::solve_pose(const vigil::core::LandmarkSet& image_points,
                           std::uint32_t /*image_width*/,
                           std::uint32_t /*image_height*/) const {
  ++calls_;
  if (!image_points.empty()) {
    last_first_point_ = image_points.front();
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return pose_;
}

}  // namespace vigil::vision
