#include <vigil/vision/mock_detection_backend.hpp>
#include <vigil/core/error.hpp>

namespace vigil::vision {

void MockDetectionBackend::set_detections(Detections detections) {
  detections_ = std::move(detections);
}

void MockDetectionBackend::set_failure(std::optional<vigil::core::AnalysisError> error) {
  failure_ = error;
}

std::expected<Detections, vigil::core::AnalysisError>
MockDetectionBackend::infer(const vigil::core::Frame& input) const {
  ++infer_calls_;
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return detections_;
}

std::expected<void, vigil::core::AnalysisError>
MockDetectionBackend::validate_input(const vigil::core::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(vigil::core::AnalysisError::InvalidFrame);
  }
  return {};
}

}  // namespace vigil::vision
