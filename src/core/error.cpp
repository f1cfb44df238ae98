#include <vigil/core/error.hpp>

namespace vigil::core {

std::string_view to_string(AnalysisError error) noexcept {
  switch (error) {
    case AnalysisError::None:
      return "none";
    case AnalysisError::InvalidFrame:
      return "invalid frame";
    case AnalysisError::LoadFailed:
      return "load failed";
    case AnalysisError::DetectionFailed:
      return "face detection failed";
    case AnalysisError::LandmarkFailed:
      return "landmark detection failed";
    case AnalysisError::PoseFailed:
      return "pose solve failed";
    case AnalysisError::InferenceFailed:
      return "inference failed";
    case AnalysisError::InvalidConfig:
      return "invalid config";
    default:
      return "unknown";
  }
}

}  // namespace vigil::core
