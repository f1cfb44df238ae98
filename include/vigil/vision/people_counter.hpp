#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/core/preprocessor.hpp>
#include <vigil/vision/detection_backend.hpp>
#include <vigil/vision/detection_decoder.hpp>
#include <cstdint>
#include <expected>
#include <memory>

namespace vigil::vision {

/// Number of people visible in a frame.
struct PeopleCount {
  std::uint32_t people{0};
};

/// Settings for a COCO-style object detector (EfficientDet / SSD exported to ONNX).
struct PeopleCounterOptions {
  std::uint32_t input_width{512};
  std::uint32_t input_height{512};
  /// Detections must score strictly above this.
  float confidence_threshold{0.5f};
  std::int64_t person_class_id{1};
  BoxLayout box_layout{BoxLayout::YXYX};
};

/// Counts "person" detections in a frame: RGB -> resize -> float -> backend.
class PeopleCounter {
 public:
  PeopleCounter(std::unique_ptr<IDetectionBackend> backend, PeopleCounterOptions options = {});

  /// Thread-safe if the backend is.
  [[nodiscard]] std::expected<PeopleCount, vigil::core::AnalysisError> count(
      const vigil::core::Frame& image) const;

  [[nodiscard]] const PeopleCounterOptions& options() const noexcept { return options_; }

 private:
  std::unique_ptr<IDetectionBackend> backend_;
  PeopleCounterOptions options_;
  vigil::core::Preprocessor preprocessor_;
  DetectionDecoder decoder_;
};

}  // namespace vigil::vision
