#pragma once

#include <vigil/vision/detections.hpp>
#include <cstdint>
#include <vector>

namespace vigil::vision {

/// Coordinate order of the 4 box values a model emits (normalized 0-1).
enum class BoxLayout : std::uint8_t {
  XYXY,  // xmin, ymin, xmax, ymax (Caffe / OpenCV SSD)
  YXYX,  // ymin, xmin, ymax, xmax (TF object detection API)
};

/// Whether a score equal to the threshold is kept.
enum class ScoreCutoff : std::uint8_t {
  Inclusive,  // score >= threshold
  Strict,     // score > threshold
};

/// Normalized box, always stored as xmin, ymin, xmax, ymax.
struct NormalizedBox {
  float x1{0.f};
  float y1{0.f};
  float x2{0.f};
  float y2{0.f};
};

/// One decoded detection above the confidence threshold.
struct Detection {
  NormalizedBox box{};
  float score{0.f};
  std::int64_t class_id{-1};
};

/// Decodes Detections -> vector<Detection>, dropping scores below the threshold
/// (and equal to it with ScoreCutoff::Strict). Model order is preserved.
class DetectionDecoder {
 public:
  explicit DetectionDecoder(float confidence_threshold,
                            BoxLayout layout = BoxLayout::XYXY,
                            ScoreCutoff cutoff = ScoreCutoff::Inclusive);

  [[nodiscard]] std::vector<Detection> decode(const Detections& result) const;

  void set_confidence_threshold(float t) noexcept { confidence_threshold_ = t; }
  [[nodiscard]] float confidence_threshold() const noexcept {
    return confidence_threshold_;
  }
  [[nodiscard]] BoxLayout layout() const noexcept { return layout_; }
  [[nodiscard]] ScoreCutoff cutoff() const noexcept { return cutoff_; }

 private:
  float confidence_threshold_;
  BoxLayout layout_;
  ScoreCutoff cutoff_;
};

}  // namespace vigil::vision
