#pragma once

#include <vigil/app/config.hpp>
#include <vigil/core/collaborators.hpp>
#include <vigil/core/pipeline.hpp>
#include <vigil/vision/people_counter.hpp>
#include <memory>

namespace vigil::app {

/// The three collaborators of a FrameAnalysisPipeline, shared and read-only.
struct Collaborators {
  std::shared_ptr<const vigil::core::IFaceDetector> face_detector;
  std::shared_ptr<const vigil::core::ILandmarkDetector> landmark_detector;
  std::shared_ptr<const vigil::core::IPoseSolver> pose_solver;
};

/// Builds the collaborators selected by config.backend_type. ONNX models are
/// loaded and warmed up once here; the result can back any number of pipelines.
/// Throws std::invalid_argument if the config does not validate, std::runtime_error /
/// Ort::Exception if a model or the model-points file cannot be loaded.
[[nodiscard]] Collaborators make_collaborators(const AnalyzerConfig& config);

/// Pipeline over the given collaborators with the configured direction thresholds.
[[nodiscard]] vigil::core::FrameAnalysisPipeline make_pipeline(const AnalyzerConfig& config,
                                                               const Collaborators& collaborators);

/// People counter for config.backend_type. Mock: reports one person.
/// Onnx: throws std::invalid_argument if people_model_path is empty.
[[nodiscard]] std::unique_ptr<vigil::vision::PeopleCounter> make_people_counter(
    const AnalyzerConfig& config);

}  // namespace vigil::app
