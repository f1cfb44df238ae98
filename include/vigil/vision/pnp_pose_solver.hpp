#pragma once

#include <vigil/core/collaborators.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/face.hpp>
#include <vigil/core/head_pose.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace vigil::vision {

/// Point of the generic 3D face model (model units, roughly millimetres).
struct ModelPoint {
  float x{0.f};
  float y{0.f};
  float z{0.f};
};

/// Loads a 3D face model from a whitespace-separated text file holding all x
/// values, then all y values, then all z values. z is negated on load so the
/// model faces the camera. Returns LoadFailed on a missing or malformed file.
[[nodiscard]] std::expected<std::vector<ModelPoint>, vigil::core::AnalysisError>
load_model_points(const std::string& path,
                  std::size_t expected_count = vigil::core::kReferenceLandmarkCount);

/// IPoseSolver using cv::solvePnP (iterative) against a fixed 3D face model.
///
/// Camera: focal length = image width, principal point at the image centre, no
/// lens distortion. Each solve starts from the same extrinsic guess, so the
/// solver keeps no state between requests. The returned rotation is the
/// Rodrigues vector; its components are read as pitch, yaw, roll.
class PnpPoseSolver : public vigil::core::IPoseSolver {
 public:
  /// Throws std::invalid_argument if fewer than 4 model points are given.
  explicit PnpPoseSolver(std::vector<ModelPoint> model_points);

  /// Loads the model with load_model_points(); throws std::runtime_error on failure.
  static PnpPoseSolver from_file(const std::string& path);

  [[nodiscard]] std::expected<vigil::core::PoseEstimate, vigil::core::AnalysisError>
  solve_pose(const vigil::core::LandmarkSet& image_points,
             std::uint32_t image_width,
             std::uint32_t image_height) const override;

  [[nodiscard]] std::size_t model_size() const noexcept { return model_points_.size(); }

  /// Initial guess used by every solve (a frontal face about 2 m from the camera).
  static constexpr std::array<double, 3> kInitialRotation{0.01891013, 0.08560084, -3.14392813};
  static constexpr std::array<double, 3> kInitialTranslation{-14.97821226, -10.62040383,
                                                             -2053.03596872};

 private:
  std::vector<ModelPoint> model_points_;
};

}  // namespace vigil::vision
