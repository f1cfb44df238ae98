#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/vision/mock_detection_backend.hpp>
#include <vigil/vision/people_counter.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace vv = vigil::vision;
namespace vc = vigil::core;

namespace {

vc::Frame make_frame() {
  return vc::Frame(64, 48, vc::PixelFormat::RGB8, std::vector<std::byte>(64 * 48 * 3));
}

vv::PeopleCounter make_counter(vv::Detections detections, vv::MockDetectionBackend** out = nullptr) {
  auto mock = std::make_unique<vv::MockDetectionBackend>();
  mock->set_detections(std::move(detections));
  if (out) *out = mock.get();
  vv::PeopleCounterOptions options;
  options.input_width = 32;
  options.input_height = 32;
  return vv::PeopleCounter(std::move(mock), options);
}

}  // namespace

TEST(PeopleCounter, CountsPersonsAboveThreshold) {
  vv::Detections d;
  d.num_detections = 5;
  d.boxes.assign(5 * 4, 0.5f);
  d.scores = {0.9f, 0.7f, 0.5f, 0.95f, 0.3f};
  d.class_ids = {1, 1, 1, 3, 1};
  auto counter = make_counter(std::move(d));
  auto count = counter.count(make_frame());
  ASSERT_TRUE(count.has_value());
  // Score exactly 0.5 does not count; class 3 is not a person.
  EXPECT_EQ(count->people, 2u);
}

TEST(PeopleCounter, NoDetectionsIsZero) {
  auto counter = make_counter({});
  auto count = counter.count(make_frame());
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(count->people, 0u);
}

TEST(PeopleCounter, ReadsOnlyNumDetections) {
  vv::Detections d;
  d.num_detections = 1;
  d.boxes.assign(2 * 4, 0.5f);
  d.scores = {0.9f, 0.9f};
  d.class_ids = {1, 1};
  auto counter = make_counter(std::move(d));
  auto count = counter.count(make_frame());
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(count->people, 1u);
}

TEST(PeopleCounter, BackendErrorPropagates) {
  vv::MockDetectionBackend* mock = nullptr;
  auto counter = make_counter({}, &mock);
  mock->set_failure(vc::AnalysisError::InferenceFailed);
  auto count = counter.count(make_frame());
  ASSERT_FALSE(count.has_value());
  EXPECT_EQ(count.error(), vc::AnalysisError::InferenceFailed);
}

TEST(PeopleCounter, DefaultOptions) {
  const vv::PeopleCounterOptions options;
  EXPECT_FLOAT_EQ(options.confidence_threshold, 0.5f);
  EXPECT_EQ(options.person_class_id, 1);
  EXPECT_EQ(options.box_layout, vv::BoxLayout::YXYX);
}
