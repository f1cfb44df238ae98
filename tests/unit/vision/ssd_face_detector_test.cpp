#include <vigil/core/error.hpp>
#include <vigil/core/face.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/vision/mock_detection_backend.hpp>
#include <vigil/vision/ssd_face_detector.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace vv = vigil::vision;
namespace vc = vigil::core;

namespace {

vc::Frame make_frame(std::uint32_t w = 200, std::uint32_t h = 100) {
  return vc::Frame(w, h, vc::PixelFormat::RGB8,
                   std::vector<std::byte>(static_cast<std::size_t>(w) * h * 3));
}

struct DetectorWithMock {
  vv::MockDetectionBackend* backend;
  std::unique_ptr<vv::SsdFaceDetector> detector;
};

DetectorWithMock make_detector(vv::Detections detections, vv::SsdFaceDetectorOptions options = {}) {
  auto mock = std::make_unique<vv::MockDetectionBackend>();
  mock->set_detections(std::move(detections));
  auto* raw = mock.get();
  return {raw, std::make_unique<vv::SsdFaceDetector>(std::move(mock), options)};
}

vv::Detections faces(std::vector<float> boxes, std::vector<float> scores) {
  vv::Detections d;
  d.num_detections = static_cast<std::uint32_t>(scores.size());
  d.class_ids.assign(scores.size(), 1);
  d.boxes = std::move(boxes);
  d.scores = std::move(scores);
  return d;
}

}  // namespace

TEST(SsdFaceDetector, NullBackendThrows) {
  EXPECT_THROW(vv::SsdFaceDetector(nullptr), std::invalid_argument);
}

TEST(SsdFaceDetector, ConvertsAndRefinesBestFace) {
  auto d = make_detector(faces({0.25f, 0.2f, 0.5f, 0.8f}, {0.95f}));
  auto box = d.detector->detect(make_frame());
  ASSERT_TRUE(box.has_value());
  ASSERT_TRUE(box->has_value());
  // Pixel box (50,20)-(100,80), moved down 6 px, widened to 60 px.
  EXPECT_EQ(**box, (vc::FaceBox{45, 26, 105, 86}));
  EXPECT_EQ(d.backend->infer_calls(), 1u);
}

TEST(SsdFaceDetector, BelowThresholdIsNoFace) {
  auto d = make_detector(faces({0.25f, 0.2f, 0.5f, 0.8f}, {0.85f}));
  auto box = d.detector->detect(make_frame());
  ASSERT_TRUE(box.has_value());
  EXPECT_FALSE(box->has_value());
}

TEST(SsdFaceDetector, ScoreEqualToThresholdIsNoFace) {
  auto d = make_detector(faces({0.25f, 0.2f, 0.5f, 0.8f}, {0.9f}));
  auto box = d.detector->detect(make_frame());
  ASSERT_TRUE(box.has_value());
  EXPECT_FALSE(box->has_value());
}

TEST(SsdFaceDetector, ThresholdFromOptions) {
  vv::SsdFaceDetectorOptions options;
  options.confidence_threshold = 0.8f;
  auto d = make_detector(faces({0.25f, 0.2f, 0.5f, 0.8f}, {0.85f}), options);
  auto box = d.detector->detect(make_frame());
  ASSERT_TRUE(box.has_value());
  EXPECT_TRUE(box->has_value());
}

TEST(SsdFaceDetector, FallsBackWhenBestFaceLeavesImage) {
  // Second detection scores higher but its refined box leaves the image.
  auto d = make_detector(faces({0.25f, 0.2f, 0.5f, 0.8f, 0.8f, 0.1f, 1.0f, 0.9f},
                               {0.92f, 0.99f}));
  auto box = d.detector->detect(make_frame());
  ASSERT_TRUE(box.has_value());
  ASSERT_TRUE(box->has_value());
  EXPECT_EQ(**box, (vc::FaceBox{45, 26, 105, 86}));
}

TEST(SsdFaceDetector, NoSurvivingCandidateIsNoFace) {
  auto d = make_detector(faces({0.8f, 0.1f, 1.0f, 0.9f}, {0.99f}));
  auto box = d.detector->detect(make_frame());
  ASSERT_TRUE(box.has_value());
  EXPECT_FALSE(box->has_value());
}

TEST(SsdFaceDetector, BackendFailurePropagates) {
  auto d = make_detector(faces({}, {}));
  d.backend->set_failure(vc::AnalysisError::InferenceFailed);
  auto box = d.detector->detect(make_frame());
  ASSERT_FALSE(box.has_value());
  EXPECT_EQ(box.error(), vc::AnalysisError::InferenceFailed);
}

TEST(SsdFaceDetector, EmptyFrameIsInvalid) {
  auto d = make_detector(faces({}, {}));
  auto box = d.detector->detect(vc::Frame{});
  ASSERT_FALSE(box.has_value());
  EXPECT_EQ(box.error(), vc::AnalysisError::InvalidFrame);
  EXPECT_EQ(d.backend->infer_calls(), 0u);
}
