#pragma once

#include <vigil/core/attention.hpp>
#include <vigil/core/direction.hpp>
#include <vigil/core/face.hpp>
#include <vigil/core/head_pose.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::core {

enum class AnalysisStatus : std::uint8_t {
  FaceFound,
  FaceNotFound,
};

/// Wire names: face_found, face_not_found.
[[nodiscard]] std::string_view to_string(AnalysisStatus status) noexcept;

/// Result of FrameAnalysisPipeline::analyze() for one frame.
/// direction, pose and face_box are set only when status is FaceFound.
/// Optional session_id identifies the exam session / student this frame belongs to
/// (set by the application or by the runners when provided).
struct AnalysisResult {
  std::uint64_t frame_id{0};
  AnalysisStatus status{AnalysisStatus::FaceNotFound};
  std::optional<DirectionVerdict> direction;
  std::optional<PoseEstimate> pose;
  std::optional<FaceBox> face_box;
  std::vector<std::string> warnings;

  std::optional<std::string> session_id;
};

/// Result of FrameAnalysisPipeline::check_attention(); direction is unset when no face was found.
struct AttentionReport {
  std::uint64_t frame_id{0};
  AttentionVerdict verdict;
  std::optional<DirectionVerdict> direction;

  std::optional<std::string> session_id;
};

}  // namespace vigil::core
