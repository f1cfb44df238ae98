#include <vigil/vision/onnx_detection_backend.hpp>
#include "onnx_utils.hpp"
#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace vigil::vision {

namespace {

/// Reads a class-id tensor that may be exported as int64 or float.
std::int64_t class_id_at(const Ort::Value& value, std::int64_t i) {
  const auto type = value.GetTensorTypeAndShapeInfo().GetElementType();
  if (type == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64) {
    return value.GetTensorData<std::int64_t>()[i];
  }
  if (type == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32) {
    return value.GetTensorData<std::int32_t>()[i];
  }
  return static_cast<std::int64_t>(value.GetTensorData<float>()[i]);
}

}  // namespace

std::expected<Detections, vigil::core::AnalysisError>
detections_from_single_output(const float* data, std::size_t num_values,
                              const std::vector<std::int64_t>& shape) {
  using vigil::core::AnalysisError;

  // Column offsets of box0, score and class id within one record.
  std::int64_t n = -1;
  std::int64_t columns = 0;
  std::int64_t box_col = 0;
  std::int64_t score_col = 0;
  std::int64_t class_col = 0;
  bool records_are_rows = true;
  if (shape.size() == 4u && shape[0] == 1 && shape[1] == 1 && shape[3] == 7) {
    n = shape[2];
    columns = 7;
    box_col = 3;
    score_col = 2;
    class_col = 1;
  } else if (shape.size() == 3u && shape[0] == 1 && shape[2] == 6) {
    n = shape[1];
    columns = 6;
    score_col = 4;
    class_col = 5;
  } else if (shape.size() == 3u && shape[0] == 1 && shape[1] == 6) {
    n = shape[2];
    columns = 6;
    score_col = 4;
    class_col = 5;
    records_are_rows = false;
  }
  if (data == nullptr || n < 0 ||
      num_values < static_cast<std::size_t>(n) * static_cast<std::size_t>(columns)) {
    return std::unexpected(AnalysisError::InferenceFailed);
  }

  // Value k of record i.
  const auto at = [&](std::int64_t i, std::int64_t k) {
    return records_are_rows ? data[i * columns + k] : data[k * n + i];
  };

  Detections result;
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.reserve(static_cast<std::size_t>(n) * 4u);
  result.scores.reserve(static_cast<std::size_t>(n));
  result.class_ids.reserve(static_cast<std::size_t>(n));
  for (std::int64_t i = 0; i < n; ++i) {
    for (std::int64_t k = 0; k < 4; ++k) {
      result.boxes.push_back(at(i, box_col + k));
    }
    result.scores.push_back(at(i, score_col));
    result.class_ids.push_back(static_cast<std::int64_t>(at(i, class_col)));
  }
  return result;
}

struct OnnxDetectionBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "vigil-detector"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::array<std::string, 3> output_names;
  std::vector<const char*> output_name_ptrs;

  detail::ImageInputShape input_shape;
  /// True if the model has a single detection output (see detections_from_single_output).
  bool use_single_output{false};

  std::mutex run_mutex;  // Session::Run and nchw_buffer
  std::vector<float> nchw_buffer;

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxDetectionBackend::OnnxDetectionBackend(std::string model_path,
                                           std::string input_name,
                                           std::array<std::string, 3> output_names)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxDetectionBackend: model has no inputs");
  }
  if (input_name.empty()) {
    impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  } else {
    impl_->input_name = std::move(input_name);
  }
  impl_->input_shape = detail::read_image_input_shape(impl_->session);
  if (impl_->input_shape.uint8) {
    throw std::runtime_error("OnnxDetectionBackend: model input must be float");
  }

  const std::size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 0) {
    throw std::runtime_error("OnnxDetectionBackend: model has no outputs");
  }
  if (num_outputs == 1u) {
    impl_->use_single_output = true;
    impl_->output_names[0] = impl_->session.GetOutputNameAllocated(0, allocator).get();
    impl_->output_name_ptrs.push_back(impl_->output_names[0].c_str());
  } else if (num_outputs >= 3u) {
    for (std::size_t i = 0; i < 3u; ++i) {
      if (output_names[i].empty()) {
        impl_->output_names[i] = impl_->session.GetOutputNameAllocated(i, allocator).get();
      } else {
        impl_->output_names[i] = output_names[i];
      }
      impl_->output_name_ptrs.push_back(impl_->output_names[i].c_str());
    }
  } else {
    throw std::runtime_error(
        "OnnxDetectionBackend: model must have 1 detection output or at least 3 outputs "
        "(boxes, scores, class_ids)");
  }
}

OnnxDetectionBackend::~OnnxDetectionBackend() = default;

std::uint32_t OnnxDetectionBackend::input_width() const noexcept {
  return impl_->input_shape.width;
}

std::uint32_t OnnxDetectionBackend::input_height() const noexcept {
  return impl_->input_shape.height;
}

std::expected<void, vigil::core::AnalysisError>
OnnxDetectionBackend::validate_input(const vigil::core::Frame& input) const {
  return detail::validate_image_input(input, impl_->input_shape);
}

std::expected<Detections, vigil::core::AnalysisError>
OnnxDetectionBackend::infer(const vigil::core::Frame& input) const {
  using vigil::core::AnalysisError;

  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  std::lock_guard lock(impl_->run_mutex);

  Ort::MemoryInfo mem_info = detail::cpu_memory_info();
  Ort::Value input_tensor =
      detail::make_image_tensor(input, impl_->input_shape, mem_info, impl_->nchw_buffer);

  const char* input_names_c[] = {impl_->input_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(
        run_options,
        input_names_c, &input_tensor, 1,
        impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size());
  } catch (const Ort::Exception&) {
    return std::unexpected(AnalysisError::InferenceFailed);
  }

  if (impl_->use_single_output) {
    if (outputs.size() != 1u) {
      return std::unexpected(AnalysisError::InferenceFailed);
    }
    const auto info = outputs[0].GetTensorTypeAndShapeInfo();
    return detections_from_single_output(outputs[0].GetTensorData<float>(),
                                         info.GetElementCount(), info.GetShape());
  }

  // Three-output path: boxes, scores, class_ids
  if (outputs.size() < 3u) {
    return std::unexpected(AnalysisError::InferenceFailed);
  }
  const Ort::Value& boxes_val = outputs[0];
  const Ort::Value& scores_val = outputs[1];
  const Ort::Value& classes_val = outputs[2];

  const std::vector<std::int64_t> boxes_shape =
      boxes_val.GetTensorTypeAndShapeInfo().GetShape();

  // Support [1, N, 4] or [N, 4].
  std::int64_t n = -1;
  if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[2] == 4) {
    n = boxes_shape[1];
  } else if (boxes_shape.size() == 2u && boxes_shape[1] == 4) {
    n = boxes_shape[0];
  }
  if (n < 0) {
    return std::unexpected(AnalysisError::InferenceFailed);
  }
  const std::size_t num_scores = scores_val.GetTensorTypeAndShapeInfo().GetElementCount();
  const std::size_t num_classes = classes_val.GetTensorTypeAndShapeInfo().GetElementCount();
  if (num_scores < static_cast<std::size_t>(n) || num_classes < static_cast<std::size_t>(n)) {
    return std::unexpected(AnalysisError::InferenceFailed);
  }

  const float* boxes_data = boxes_val.GetTensorData<float>();
  const float* scores_data = scores_val.GetTensorData<float>();

  Detections result;
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.assign(boxes_data, boxes_data + n * 4);
  result.scores.assign(scores_data, scores_data + n);
  result.class_ids.reserve(static_cast<std::size_t>(n));
  for (std::int64_t i = 0; i < n; ++i) {
    result.class_ids.push_back(class_id_at(classes_val, i));
  }
  return result;
}

void OnnxDetectionBackend::warmup() {
  auto result = infer(detail::make_zero_input(impl_->input_shape));
  if (!result) {
    throw std::runtime_error("OnnxDetectionBackend: warmup inference failed");
  }
}

}  // namespace vigil::vision
