#pragma once

#include <vigil/app/log.hpp>
#include <vigil/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

namespace vigil::app {

/// Collaborator backend: mock (synthetic results) or onnx (real models).
enum class InferenceBackendType {
  Mock,
  Onnx,
};

/// Analyzer configuration: model files, detector settings, direction thresholds.
struct AnalyzerConfig {
  InferenceBackendType backend_type{InferenceBackendType::Mock};

  std::string face_model_path;
  std::string landmark_model_path;
  std::string model_points_path;
  /// Optional; only needed for people counting.
  std::string people_model_path;

  float face_confidence_threshold{0.9f};
  std::uint32_t face_input_width{300};
  std::uint32_t face_input_height{300};
  std::uint32_t landmark_input_size{128};

  float people_confidence_threshold{0.5f};
  std::int64_t person_class_id{1};

  double pitch_threshold{0.3};
  double yaw_threshold{0.4};

  /// Worker threads for parallel batches; 0 = hardware concurrency.
  std::size_t num_workers{0};
  log::Level log_level{log::Level::Info};
};

/// Default config when no file is provided (mock backend).
AnalyzerConfig default_config();

/// Load config from a simple key=value file (one per line, '#' comments).
/// A missing file yields the defaults. Malformed numbers throw std::invalid_argument.
AnalyzerConfig load_config(const std::string& path);

/// InvalidConfig if onnx is selected without face/landmark/model-points paths,
/// or a threshold or input size is out of range.
[[nodiscard]] std::expected<void, vigil::core::AnalysisError> validate_config(
    const AnalyzerConfig& config);

}  // namespace vigil::app
