#pragma once

#include <vigil/core/collaborators.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/face.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/core/preprocessor.hpp>
#include <vigil/vision/detection_backend.hpp>
#include <vigil/vision/detection_decoder.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>

namespace vigil::vision {

/// Preprocessing and decoding settings for the SSD face detector.
/// Defaults match the OpenCV res10 300x300 Caffe face model.
struct SsdFaceDetectorOptions {
  std::uint32_t input_width{300};
  std::uint32_t input_height{300};
  std::array<float, 3> channel_mean{104.f, 177.f, 123.f};  // BGR order
  float confidence_threshold{0.9f};  // faces must score strictly above this
  BoxLayout box_layout{BoxLayout::XYXY};
};

/// IFaceDetector over a detection backend: BGR -> resize -> mean subtraction ->
/// backend -> decode. Candidates are tried in descending score order and the first
/// one that survives refine_face_box() is returned.
class SsdFaceDetector : public vigil::core::IFaceDetector {
 public:
  SsdFaceDetector(std::unique_ptr<IDetectionBackend> backend,
                  SsdFaceDetectorOptions options = {});

  [[nodiscard]] std::expected<std::optional<vigil::core::FaceBox>, vigil::core::AnalysisError>
  detect(const vigil::core::Frame& image) const override;

 private:
  std::unique_ptr<IDetectionBackend> backend_;
  vigil::core::Preprocessor preprocessor_;
  DetectionDecoder decoder_;
};

}  // namespace vigil::vision
