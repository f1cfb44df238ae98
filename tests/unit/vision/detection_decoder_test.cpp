#include <vigil/vision/detection_decoder.hpp>
#include <vigil/vision/detections.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace vv = vigil::vision;

TEST(DetectionDecoder, EmptyResult) {
  vv::Detections r;
  vv::DetectionDecoder dec(0.5f);
  EXPECT_TRUE(dec.decode(r).empty());
}

TEST(DetectionDecoder, BelowThresholdFiltered) {
  vv::Detections r;
  r.num_detections = 1;
  r.boxes = {0.f, 0.f, 0.1f, 0.1f};
  r.scores = {0.3f};
  r.class_ids = {1};
  vv::DetectionDecoder dec(0.5f);
  EXPECT_TRUE(dec.decode(r).empty());
}

TEST(DetectionDecoder, ScoreEqualToThresholdKept) {
  vv::Detections r;
  r.num_detections = 1;
  r.boxes = {0.f, 0.f, 0.1f, 0.1f};
  r.scores = {0.5f};
  r.class_ids = {1};
  vv::DetectionDecoder dec(0.5f);
  EXPECT_EQ(dec.decode(r).size(), 1u);
}

TEST(DetectionDecoder, StrictCutoffDropsScoreEqualToThreshold) {
  vv::Detections r;
  r.num_detections = 2;
  r.boxes = {0.f, 0.f, 0.1f, 0.1f, 0.2f, 0.2f, 0.4f, 0.4f};
  r.scores = {0.9f, 0.91f};
  r.class_ids = {1, 1};
  vv::DetectionDecoder dec(0.9f, vv::BoxLayout::XYXY, vv::ScoreCutoff::Strict);
  auto out = dec.decode(r);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FLOAT_EQ(out[0].score, 0.91f);
}

TEST(DetectionDecoder, XyxyLayout) {
  vv::Detections r;
  r.num_detections = 1;
  r.boxes = {0.1f, 0.2f, 0.4f, 0.5f};
  r.scores = {0.9f};
  r.class_ids = {3};
  vv::DetectionDecoder dec(0.5f);
  auto out = dec.decode(r);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FLOAT_EQ(out[0].score, 0.9f);
  EXPECT_EQ(out[0].class_id, 3);
  EXPECT_FLOAT_EQ(out[0].box.x1, 0.1f);
  EXPECT_FLOAT_EQ(out[0].box.y1, 0.2f);
  EXPECT_FLOAT_EQ(out[0].box.x2, 0.4f);
  EXPECT_FLOAT_EQ(out[0].box.y2, 0.5f);
}

TEST(DetectionDecoder, YxyxLayoutIsSwapped) {
  vv::Detections r;
  r.num_detections = 1;
  r.boxes = {0.2f, 0.1f, 0.5f, 0.4f};  // ymin, xmin, ymax, xmax
  r.scores = {0.9f};
  r.class_ids = {1};
  vv::DetectionDecoder dec(0.5f, vv::BoxLayout::YXYX);
  auto out = dec.decode(r);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FLOAT_EQ(out[0].box.x1, 0.1f);
  EXPECT_FLOAT_EQ(out[0].box.y1, 0.2f);
  EXPECT_FLOAT_EQ(out[0].box.x2, 0.4f);
  EXPECT_FLOAT_EQ(out[0].box.y2, 0.5f);
}

TEST(DetectionDecoder, PreservesModelOrderAndSkipsTruncatedBoxes) {
  vv::Detections r;
  r.num_detections = 3;
  r.boxes = {0.f, 0.f, 0.1f, 0.1f, 0.2f, 0.2f, 0.3f, 0.3f};  // third box missing
  r.scores = {0.6f, 0.9f, 0.95f};
  r.class_ids = {1, 2, 3};
  vv::DetectionDecoder dec(0.5f);
  auto out = dec.decode(r);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].class_id, 1);
  EXPECT_EQ(out[1].class_id, 2);
}

TEST(DetectionDecoder, ThresholdCanBeChanged) {
  vv::DetectionDecoder dec(0.5f);
  dec.set_confidence_threshold(0.9f);
  EXPECT_FLOAT_EQ(dec.confidence_threshold(), 0.9f);
  EXPECT_EQ(dec.layout(), vv::BoxLayout::XYXY);
}
