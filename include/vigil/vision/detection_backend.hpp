#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/vision/detections.hpp>
#include <expected>

namespace vigil::vision {

/// Abstract detection backend: preprocessed Frame -> Detections.
/// Implement infer(); optionally override validate_input and warmup.
/// infer() is const and must be safe to call concurrently on one instance.
class IDetectionBackend {
 public:
  virtual ~IDetectionBackend() = default;

  /// Single-frame inference. Must be implemented.
  [[nodiscard]] virtual std::expected<Detections, vigil::core::AnalysisError>
  infer(const vigil::core::Frame& input) const = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, vigil::core::AnalysisError>
  validate_input(const vigil::core::Frame& /*input*/) const {
    return {};
  }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace vigil::vision
