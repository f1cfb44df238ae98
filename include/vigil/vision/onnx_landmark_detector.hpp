#pragma once

#include <vigil/core/collaborators.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/face.hpp>
#include <vigil/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace vigil::vision {

struct LandmarkDetectorOptions {
  float pixel_scale{1.f};  // raw 0-255 pixels by default; ignored for uint8 models
  std::size_t num_landmarks{vigil::core::kReferenceLandmarkCount};
};

/// ONNX Runtime facial landmark CNN.
///
/// Expected model: one square RGB input ([1,3,S,S] or [1,S,S,3]; the reference model
/// takes uint8 [1,128,128,3]) and one output whose first 2 * num_landmarks values are
/// (x, y) pairs normalized to the crop. The crop is converted to RGB and resized to
/// the model input; it is sent as float, or as 0-255 bytes when the model's input
/// element type is uint8. Session::Run is gated by a per-instance mutex.
class OnnxLandmarkDetector : public vigil::core::ILandmarkDetector {
 public:
  /// Throws Ort::Exception if the model cannot be loaded, std::runtime_error on an unexpected input shape.
  explicit OnnxLandmarkDetector(std::string model_path, LandmarkDetectorOptions options = {});

  ~OnnxLandmarkDetector() override;

  OnnxLandmarkDetector(const OnnxLandmarkDetector&) = delete;
  OnnxLandmarkDetector& operator=(const OnnxLandmarkDetector&) = delete;

  [[nodiscard]] std::expected<vigil::core::LandmarkSet, vigil::core::AnalysisError>
  detect_marks(const vigil::core::Frame& face_crop) const override;

  [[nodiscard]] std::uint32_t input_size() const noexcept;

  void warmup();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/// Reads 2 * count values as (x, y) pairs; LandmarkFailed if there are too few.
[[nodiscard]] std::expected<vigil::core::LandmarkSet, vigil::core::AnalysisError>
landmarks_from_values(const float* values, std::size_t num_values, std::size_t count);

/// Rounds 0-255 float pixels to bytes, clamping out-of-range values.
[[nodiscard]] std::vector<std::uint8_t> quantize_pixels(std::span<const float> pixels);

}  // namespace vigil::vision
