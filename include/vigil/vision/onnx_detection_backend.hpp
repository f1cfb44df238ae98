#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/vision/detection_backend.hpp>
#include <vigil/vision/detections.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace vigil::vision {

/// ONNX Runtime detection backend (face SSD, person detector).
///
/// Expected model: one float image input ([1,3,H,W] or [1,H,W,3]) and either:
/// - **Three or more outputs**: boxes [1,N,4], scores [1,N], class ids [1,N]
///   (int64 or float, as exported by the TF object detection API), or
/// - **One output**: [1, N, 6] or [1, 6, N] with (box0..box3, score, class_id), or the
///   Caffe DetectionOutput [1, 1, N, 7] with (image_id, label, score, x1, y1, x2, y2),
///   which is what the res10 300x300 face SSD emits.
/// Output names are configurable; if empty, the first output(s) are used.
///
/// Input contract: Float32Planar HWC frame matching the model input size; the
/// backend transposes to NCHW when the model expects it. Session::Run is gated
/// by a per-instance mutex, so one backend may be shared across request threads.
class OnnxDetectionBackend : public IDetectionBackend {
 public:
  /// \param model_path Path to the .onnx model file. Throws Ort::Exception if it cannot be loaded,
  ///        std::runtime_error on an unsupported input or output layout.
  /// \param input_name Optional input tensor name; if empty, the first input is used.
  /// \param output_names Optional {boxes, scores, class_ids}.
  OnnxDetectionBackend(std::string model_path,
                       std::string input_name = {},
                       std::array<std::string, 3> output_names = {});

  ~OnnxDetectionBackend() override;

  OnnxDetectionBackend(const OnnxDetectionBackend&) = delete;
  OnnxDetectionBackend& operator=(const OnnxDetectionBackend&) = delete;

  [[nodiscard]] std::expected<Detections, vigil::core::AnalysisError>
  infer(const vigil::core::Frame& input) const override;

  [[nodiscard]] std::expected<void, vigil::core::AnalysisError>
  validate_input(const vigil::core::Frame& input) const override;

  void warmup() override;

  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/// Splits a single detection output tensor into Detections. Accepts [1,N,6], [1,6,N]
/// and [1,1,N,7]; any other shape, or fewer values than the shape needs, is InferenceFailed.
[[nodiscard]] std::expected<Detections, vigil::core::AnalysisError>
detections_from_single_output(const float* data, std::size_t num_values,
                              const std::vector<std::int64_t>& shape);

}  // namespace vigil::vision
