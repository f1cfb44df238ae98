#include <vigil/core/pipeline.hpp>
#include <vigil/core/attention.hpp>
#include <vigil/core/face.hpp>
#include <vigil/core/warnings.hpp>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace vigil::core {

namespace {

/// Times one collaborator call and reports it if a callback was given.
template <typename Call>
auto timed(PipelineStep step, StepTimingCallback* timing_cb, Call&& call) {
  const auto start = std::chrono::steady_clock::now();
  auto result = std::forward<Call>(call)();
  if (timing_cb) {
    const auto end = std::chrono::steady_clock::now();
    const double ms = 1e-6 * static_cast<double>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    (*timing_cb)(step, ms);
  }
  return result;
}

}  // namespace

FrameAnalysisPipeline::FrameAnalysisPipeline(
    std::shared_ptr<const IFaceDetector> face_detector,
    std::shared_ptr<const ILandmarkDetector> landmark_detector,
    std::shared_ptr<const IPoseSolver> pose_solver,
    DirectionThresholds thresholds)
    : face_detector_(std::move(face_detector)),
      landmark_detector_(std::move(landmark_detector)),
      pose_solver_(std::move(pose_solver)),
      thresholds_(thresholds) {
  if (!face_detector_ || !landmark_detector_ || !pose_solver_) {
    throw std::invalid_argument("FrameAnalysisPipeline: all collaborators are required");
  }
}

std::expected<std::optional<FrameAnalysisPipeline::Observation>, AnalysisError>
FrameAnalysisPipeline::observe(const Frame& frame, StepTimingCallback* timing_cb) const {
  if (frame.empty()) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }

  auto face = timed(PipelineStep::FaceDetection, timing_cb,
                    [&] { return face_detector_->detect(frame); });
  if (!face) {
    return std::unexpected(face.error());
  }
  if (!face->has_value()) {
    return std::optional<Observation>{};
  }
  const FaceBox box = **face;

  auto crop = crop_frame(frame, box);
  if (!crop) {
    return std::unexpected(crop.error());
  }

  auto marks = timed(PipelineStep::LandmarkDetection, timing_cb,
                     [&] { return landmark_detector_->detect_marks(*crop); });
  if (!marks) {
    return std::unexpected(marks.error());
  }
  const LandmarkSet image_points = rescale_landmarks(*marks, box);

  auto pose = timed(PipelineStep::PoseSolve, timing_cb, [&] {
    return pose_solver_->solve_pose(image_points, frame.width(), frame.height());
  });
  if (!pose) {
    return std::unexpected(pose.error());
  }
  if (!is_finite(pose->rotation)) {
    return std::unexpected(AnalysisError::PoseFailed);
  }

  Observation obs{box, *pose, classify_direction(pose->rotation, thresholds_)};
  return std::optional<Observation>{std::move(obs)};
}

std::expected<AnalysisResult, AnalysisError> FrameAnalysisPipeline::analyze(
    const Frame& frame,
    StepTimingCallback* timing_cb) const {
  auto obs = observe(frame, timing_cb);
  if (!obs) {
    return std::unexpected(obs.error());
  }

  AnalysisResult result;
  if (!obs->has_value()) {
    result.status = AnalysisStatus::FaceNotFound;
    result.warnings.emplace_back(kNoFaceWarning);
    return result;
  }

  result.status = AnalysisStatus::FaceFound;
  result.face_box = (*obs)->face_box;
  result.pose = (*obs)->pose;
  result.direction = (*obs)->direction;
  result.warnings = compose_warnings((*obs)->direction);
  return result;
}

std::expected<AttentionReport, AnalysisError> FrameAnalysisPipeline::check_attention(
    const Frame& frame,
    StepTimingCallback* timing_cb) const {
  auto obs = observe(frame, timing_cb);
  if (!obs) {
    return std::unexpected(obs.error());
  }

  AttentionReport report;
  if (obs->has_value()) {
    report.direction = (*obs)->direction;
  }
  report.verdict = evaluate_attention(report.direction);
  return report;
}

}  // namespace vigil::core
