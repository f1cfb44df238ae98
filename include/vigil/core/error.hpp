#pragma once

#include <string_view>

namespace vigil::core {

/// Analysis error codes; used with std::expected for recoverable failures.
enum class AnalysisError {
  None = 0,
  InvalidFrame,
  LoadFailed,
  DetectionFailed,
  LandmarkFailed,
  PoseFailed,
  InferenceFailed,
  InvalidConfig,
};

[[nodiscard]] std::string_view to_string(AnalysisError error) noexcept;

}  // namespace vigil::core
