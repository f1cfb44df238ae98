#include <vigil/app/factory.hpp>
#include <vigil/app/log.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/head_pose.hpp>
#include <vigil/vision/mock_collaborators.hpp>
#include <vigil/vision/mock_detection_backend.hpp>
#include <vigil/vision/onnx_detection_backend.hpp>
#include <vigil/vision/onnx_landmark_detector.hpp>
#include <vigil/vision/pnp_pose_solver.hpp>
#include <vigil/vision/ssd_face_detector.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace vigil::app {

namespace {

Collaborators make_mock_collaborators() {
  using namespace vigil::vision;
  vigil::core::PoseEstimate pose;
  pose.translation = {0.0, 0.0, -2000.0};
  return Collaborators{
      std::make_shared<MockFaceDetector>(),
      std::make_shared<MockLandmarkDetector>(),
      std::make_shared<MockPoseSolver>(pose),
  };
}

Collaborators make_onnx_collaborators(const AnalyzerConfig& config) {
  using namespace vigil::vision;

  auto face_backend = std::make_unique<OnnxDetectionBackend>(config.face_model_path);
  face_backend->warmup();
  SsdFaceDetectorOptions face_options;
  face_options.confidence_threshold = config.face_confidence_threshold;
  face_options.input_width = face_backend->input_width();
  face_options.input_height = face_backend->input_height();
  if (face_options.input_width != config.face_input_width ||
      face_options.input_height != config.face_input_height) {
    log::warn << "face model input is " << face_options.input_width << "x"
              << face_options.input_height << ", configured " << config.face_input_width
              << "x" << config.face_input_height << "; using the model size" << log::endl;
  }

  auto landmarks = std::make_shared<OnnxLandmarkDetector>(config.landmark_model_path);
  landmarks->warmup();
  if (landmarks->input_size() != config.landmark_input_size) {
    log::warn << "landmark model input is " << landmarks->input_size() << ", configured "
              << config.landmark_input_size << "; using the model size" << log::endl;
  }

  auto solver = std::make_shared<PnpPoseSolver>(PnpPoseSolver::from_file(config.model_points_path));

  log::info << "loaded face model " << config.face_model_path << ", landmark model "
            << config.landmark_model_path << ", " << solver->model_size()
            << " model points" << log::endl;

  return Collaborators{
      std::make_shared<SsdFaceDetector>(std::move(face_backend), face_options),
      std::move(landmarks),
      std::move(solver),
  };
}

}  // namespace

Collaborators make_collaborators(const AnalyzerConfig& config) {
  auto valid = validate_config(config);
  if (!valid) {
    throw std::invalid_argument("invalid analyzer config: " +
                                std::string(vigil::core::to_string(valid.error())));
  }
  if (config.backend_type == InferenceBackendType::Onnx) {
    return make_onnx_collaborators(config);
  }
  log::debug << "using mock collaborators" << log::endl;
  return make_mock_collaborators();
}

vigil::core::FrameAnalysisPipeline make_pipeline(const AnalyzerConfig& config,
                                                 const Collaborators& collaborators) {
  return vigil::core::FrameAnalysisPipeline(
      collaborators.face_detector, collaborators.landmark_detector, collaborators.pose_solver,
      vigil::core::DirectionThresholds{config.pitch_threshold, config.yaw_threshold});
}

std::unique_ptr<vigil::vision::PeopleCounter> make_people_counter(const AnalyzerConfig& config) {
  using namespace vigil::vision;

  PeopleCounterOptions options;
  options.confidence_threshold = config.people_confidence_threshold;
  options.person_class_id = config.person_class_id;

  if (config.backend_type == InferenceBackendType::Onnx) {
    if (config.people_model_path.empty()) {
      throw std::invalid_argument("backend_type=onnx requires people_model_path for people counting");
    }
    auto backend = std::make_unique<OnnxDetectionBackend>(config.people_model_path);
    backend->warmup();
    options.input_width = backend->input_width();
    options.input_height = backend->input_height();
    return std::make_unique<PeopleCounter>(std::move(backend), options);
  }

  auto mock = std::make_unique<MockDetectionBackend>();
  Detections person;
  person.boxes = {0.1f, 0.2f, 0.9f, 0.7f};
  person.scores = {0.9f};
  person.class_ids = {config.person_class_id};
  person.num_detections = 1;
  mock->set_detections(std::move(person));
  return std::make_unique<PeopleCounter>(std::move(mock), options);
}

}  // namespace vigil::app
