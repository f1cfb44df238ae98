#include <vigil/app/response_json.hpp>
#include <vigil/core/analysis_result.hpp>
#include <vigil/core/attention.hpp>
#include <vigil/core/direction.hpp>
#include <vigil/core/warnings.hpp>
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>
#include <string>

namespace va = vigil::app;
namespace vc = vigil::core;

TEST(ResponseJson, FaceFoundAnalysis) {
  vc::AnalysisResult r;
  r.status = vc::AnalysisStatus::FaceFound;
  r.direction = vc::classify_direction({0.5, 0.0, 0.1});
  r.pose = vc::PoseEstimate{{0.5, 0.0, 0.1}, {1.0, 2.0, -2000.0}};
  r.warnings = vc::compose_warnings(*r.direction);

  const auto j = va::to_json(r);
  EXPECT_EQ(j["status"], "face_found");
  EXPECT_EQ(j["head_direction"]["looking_down"], true);
  EXPECT_EQ(j["head_direction"]["looking_straight"], false);
  EXPECT_DOUBLE_EQ(j["head_direction"]["pitch"].get<double>(), 0.5);
  EXPECT_DOUBLE_EQ(j["head_direction"]["roll"].get<double>(), 0.1);
  ASSERT_EQ(j["pose"]["rotation"].size(), 3u);
  EXPECT_DOUBLE_EQ(j["pose"]["rotation"][0][0].get<double>(), 0.5);
  EXPECT_DOUBLE_EQ(j["pose"]["translation"][2][0].get<double>(), -2000.0);
  ASSERT_EQ(j["warnings"].size(), 1u);
  EXPECT_EQ(j["warnings"][0], "Student is looking DOWN - possible cheating detected");
  EXPECT_FALSE(j.contains("session_id"));
}

TEST(ResponseJson, FaceNotFoundAnalysis) {
  vc::AnalysisResult r;
  r.status = vc::AnalysisStatus::FaceNotFound;
  r.warnings = {vc::kNoFaceWarning};
  r.session_id = "exam-7";

  const auto j = va::to_json(r);
  EXPECT_EQ(j["status"], "face_not_found");
  EXPECT_TRUE(j["head_direction"].is_null());
  EXPECT_FALSE(j.contains("pose"));
  EXPECT_EQ(j["warnings"][0], "No face detected in frame");
  EXPECT_EQ(j["session_id"], "exam-7");
}

TEST(ResponseJson, AttentionWithFace) {
  vc::AttentionReport report;
  report.direction = vc::classify_direction({0.0, -0.5, 0.0});
  report.verdict = vc::evaluate_attention(report.direction);

  const auto j = va::to_json(report);
  EXPECT_EQ(j["attention"], false);
  EXPECT_EQ(j["reason"], "looking_right");
  EXPECT_EQ(j["severity"], "high");
  EXPECT_EQ(j["message"], "Student is looking right");
  EXPECT_EQ(j["direction"]["looking_right"], true);
}

TEST(ResponseJson, AttentionWithoutFaceOmitsDirection) {
  vc::AttentionReport report;
  report.verdict = vc::evaluate_attention(std::nullopt);

  const auto j = va::to_json(report);
  EXPECT_EQ(j["attention"], false);
  EXPECT_EQ(j["reason"], "no_face");
  EXPECT_EQ(j["severity"], "high");
  EXPECT_EQ(j["message"], "No face detected");
  EXPECT_FALSE(j.contains("direction"));
}

TEST(ResponseJson, PeopleCount) {
  const auto j = va::to_json(vigil::vision::PeopleCount{3});
  EXPECT_EQ(j, nlohmann::json({{"people", 3}}));
}
