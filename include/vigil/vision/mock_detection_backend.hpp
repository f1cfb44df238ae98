#pragma once

#include <vigil/vision/detection_backend.hpp>
#include <vigil/vision/detections.hpp>
#include <atomic>
#include <cstddef>
#include <optional>

namespace vigil::vision {

/// Mock backend that returns configurable synthetic detections (for tests/demo).
class MockDetectionBackend : public IDetectionBackend {
 public:
  /// Detections returned by every subsequent infer() call.
  void set_detections(Detections detections);

  /// Make infer() fail with the given error (nullopt to clear).
  void set_failure(std::optional<vigil::core::AnalysisError> error);

  [[nodiscard]] std::expected<Detections, vigil::core::AnalysisError>
  infer(const vigil::core::Frame& input) const override;

  [[nodiscard]] std::expected<void, vigil::core::AnalysisError>
  validate_input(const vigil::core::Frame& input) const override;

  [[nodiscard]] std::size_t infer_calls() const noexcept { return infer_calls_.load(); }

 private:
  Detections detections_;
  std::optional<vigil::core::AnalysisError> failure_;
  mutable std::atomic<std::size_t> infer_calls_{0};
};

}  // namespace vigil::vision
