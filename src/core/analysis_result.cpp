#include <vigil/core/analysis_result.hpp>

namespace vigil::core {

std::string_view to_string(AnalysisStatus status) noexcept {
  switch (status) {
    case AnalysisStatus::FaceFound:
      return "face_found";
    case AnalysisStatus::FaceNotFound:
      return "face_not_found";
    default:
      return "unknown";
  }
}

}  // namespace vigil::core
