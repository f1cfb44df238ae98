#pragma once

#include <vigil/core/analysis_result.hpp>
#include <vigil/core/collaborators.hpp>
#include <vigil/core/direction.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>

namespace vigil::core {

/// Collaborator calls made by the pipeline, in order.
enum class PipelineStep : std::uint8_t {
  FaceDetection,
  LandmarkDetection,
  PoseSolve,
};

/// Callback for per-step timing: (step, duration_ms). Optional; pass to analyze() / check_attention().
using StepTimingCallback = std::function<void(PipelineStep step, double duration_ms)>;

/// Per-request orchestration: face box -> crop -> landmarks (rescaled to image
/// pixels) -> pose solve -> DirectionClassifier, then WarningComposer (analyze)
/// or AttentionEvaluator (check_attention).
///
/// No face is a result, not an error. Collaborator errors are returned as-is and
/// collaborator exceptions propagate; nothing is retried.
class FrameAnalysisPipeline {
 public:
  /// Collaborators are shared, read-only resources. Throws std::invalid_argument if any is null.
  FrameAnalysisPipeline(std::shared_ptr<const IFaceDetector> face_detector,
                        std::shared_ptr<const ILandmarkDetector> landmark_detector,
                        std::shared_ptr<const IPoseSolver> pose_solver,
                        DirectionThresholds thresholds = {});

  /// Full analysis: direction, raw pose and every triggered warning.
  /// Thread-safe: safe to call from multiple threads concurrently.
  [[nodiscard]] std::expected<AnalysisResult, AnalysisError> analyze(
      const Frame& frame,
      StepTimingCallback* timing_cb = nullptr) const;

  /// Attention check: single reason/severity verdict plus direction.
  [[nodiscard]] std::expected<AttentionReport, AnalysisError> check_attention(
      const Frame& frame,
      StepTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const DirectionThresholds& thresholds() const noexcept {
    return thresholds_;
  }

 private:
  struct Observation {
    FaceBox face_box;
    PoseEstimate pose;
    DirectionVerdict direction;
  };

  /// Face -> landmarks -> pose -> direction; nullopt when no face was found.
  [[nodiscard]] std::expected<std::optional<Observation>, AnalysisError> observe(
      const Frame& frame,
      StepTimingCallback* timing_cb) const;

  std::shared_ptr<const IFaceDetector> face_detector_;
  std::shared_ptr<const ILandmarkDetector> landmark_detector_;
  std::shared_ptr<const IPoseSolver> pose_solver_;
  DirectionThresholds thresholds_;
};

}  // namespace vigil::core
