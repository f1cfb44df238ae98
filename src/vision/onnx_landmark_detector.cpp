#include <vigil/vision/onnx_landmark_detector.hpp>
#include "onnx_utils.hpp"
#include <vigil/core/preprocessor.hpp>
#include <vigil/vision/color_convert_stage.hpp>
#include <vigil/vision/normalize_stage.hpp>
#include <vigil/vision/resize_stage.hpp>
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace vigil::vision {

std::expected<vigil::core::LandmarkSet, vigil::core::AnalysisError>
landmarks_from_values(const float* values, std::size_t num_values, std::size_t count) {
  if (values == nullptr || count == 0 || num_values < count * 2) {
    return std::unexpected(vigil::core::AnalysisError::LandmarkFailed);
  }
  vigil::core::LandmarkSet marks;
  marks.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    marks.push_back({values[2 * i], values[2 * i + 1]});
  }
  return marks;
}

std::vector<std::uint8_t> quantize_pixels(std::span<const float> pixels) {
  std::vector<std::uint8_t> out;
  out.reserve(pixels.size());
  for (const float p : pixels) {
    const float v = std::isnan(p) ? 0.f : std::clamp(std::round(p), 0.f, 255.f);
    out.push_back(static_cast<std::uint8_t>(v));
  }
  return out;
}

struct OnnxLandmarkDetector::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "vigil-landmarks"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;
  detail::ImageInputShape input_shape;
  LandmarkDetectorOptions options;
  vigil::core::Preprocessor preprocessor;

  std::mutex run_mutex;  // Session::Run and the scratch buffers
  std::vector<float> nchw_buffer;
  std::vector<std::uint8_t> u8_buffer;

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  std::expected<vigil::core::LandmarkSet, vigil::core::AnalysisError> run(
      const vigil::core::Frame& input) {
    std::lock_guard lock(run_mutex);

    Ort::MemoryInfo mem_info = detail::cpu_memory_info();
    if (input_shape.uint8) {
      const auto* pixels = reinterpret_cast<const float*>(input.data().data());
      u8_buffer = quantize_pixels(std::span<const float>(
          pixels, std::size_t{3} * input_shape.width * input_shape.height));
    }
    Ort::Value input_tensor =
        input_shape.uint8
            ? detail::make_u8_image_tensor(u8_buffer, input_shape, mem_info)
            : detail::make_image_tensor(input, input_shape, mem_info, nchw_buffer);
    const char* input_names_c[] = {input_name.c_str()};
    const char* output_names_c[] = {output_name.c_str()};

    std::vector<Ort::Value> outputs;
    try {
      outputs = session.Run(Ort::RunOptions{}, input_names_c, &input_tensor, 1,
                            output_names_c, 1);
    } catch (const Ort::Exception&) {
      return std::unexpected(vigil::core::AnalysisError::InferenceFailed);
    }
    if (outputs.empty()) {
      return std::unexpected(vigil::core::AnalysisError::LandmarkFailed);
    }
    const auto info = outputs[0].GetTensorTypeAndShapeInfo();
    return landmarks_from_values(outputs[0].GetTensorData<float>(), info.GetElementCount(),
                                 options.num_landmarks);
  }
};

OnnxLandmarkDetector::OnnxLandmarkDetector(std::string model_path,
                                           LandmarkDetectorOptions options)
    : impl_(std::make_unique<Impl>()) {
  impl_->options = options;
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0 || impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxLandmarkDetector: model needs one input and one output");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();
  impl_->input_shape = detail::read_image_input_shape(impl_->session);

  using vigil::core::PixelFormat;
  impl_->preprocessor.add_stage(std::make_unique<ColorConvertStage>(PixelFormat::RGB8));
  impl_->preprocessor.add_stage(std::make_unique<ResizeStage>(impl_->input_shape.width,
                                                              impl_->input_shape.height));
  const float scale = impl_->input_shape.uint8 ? 1.f : options.pixel_scale;
  impl_->preprocessor.add_stage(std::make_unique<NormalizeStage>(0.f, scale));
}

OnnxLandmarkDetector::~OnnxLandmarkDetector() = default;

std::uint32_t OnnxLandmarkDetector::input_size() const noexcept {
  return impl_->input_shape.width;
}

std::expected<vigil::core::LandmarkSet, vigil::core::AnalysisError>
OnnxLandmarkDetector::detect_marks(const vigil::core::Frame& face_crop) const {
  auto input = impl_->preprocessor.run(face_crop);
  if (!input) {
    return std::unexpected(input.error());
  }
  auto valid = detail::validate_image_input(*input, impl_->input_shape);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  return impl_->run(*input);
}

void OnnxLandmarkDetector::warmup() {
  auto marks = impl_->run(detail::make_zero_input(impl_->input_shape));
  if (!marks) {
    throw std::runtime_error("OnnxLandmarkDetector: warmup inference failed");
  }
}

}  // namespace vigil::vision
