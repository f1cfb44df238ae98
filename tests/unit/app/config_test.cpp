#include <vigil/app/config.hpp>
#include <vigil/app/log.hpp>
#include <vigil/core/error.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace va = vigil::app;
namespace vc = vigil::core;

namespace {

std::string write_config(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream f(path);
  f << content;
  return path.string();
}

}  // namespace

TEST(Config, Defaults) {
  const auto c = va::default_config();
  EXPECT_EQ(c.backend_type, va::InferenceBackendType::Mock);
  EXPECT_FLOAT_EQ(c.face_confidence_threshold, 0.9f);
  EXPECT_EQ(c.face_input_width, 300u);
  EXPECT_EQ(c.face_input_height, 300u);
  EXPECT_EQ(c.landmark_input_size, 128u);
  EXPECT_FLOAT_EQ(c.people_confidence_threshold, 0.5f);
  EXPECT_EQ(c.person_class_id, 1);
  EXPECT_DOUBLE_EQ(c.pitch_threshold, 0.3);
  EXPECT_DOUBLE_EQ(c.yaw_threshold, 0.4);
  EXPECT_EQ(c.num_workers, 0u);
  EXPECT_EQ(c.log_level, va::log::Level::Info);
  EXPECT_TRUE(va::validate_config(c).has_value());
}

TEST(Config, MissingFileGivesDefaults) {
  const auto c = va::load_config("/nonexistent/vigil.conf");
  EXPECT_EQ(c.backend_type, va::InferenceBackendType::Mock);
  EXPECT_TRUE(c.face_model_path.empty());
}

TEST(Config, ParsesKeysCommentsAndWhitespace) {
  const auto path = write_config("vigil_config_test.conf",
                                 "# analyzer\n"
                                 "\n"
                                 "backend_type = onnx\n"
                                 "face_model_path=models/face.onnx\n"
                                 "landmark_model_path = models/marks.onnx \n"
                                 "model_points_path=assets/model.txt\n"
                                 "pitch_threshold=0.25\n"
                                 "yaw_threshold=0.5\n"
                                 "num_workers=4\n"
                                 "person_class_id=2\n"
                                 "log_level=debug\n"
                                 "unknown_key=ignored\n");
  const auto c = va::load_config(path);
  std::filesystem::remove(path);
  EXPECT_EQ(c.backend_type, va::InferenceBackendType::Onnx);
  EXPECT_EQ(c.face_model_path, "models/face.onnx");
  EXPECT_EQ(c.landmark_model_path, "models/marks.onnx");
  EXPECT_EQ(c.model_points_path, "assets/model.txt");
  EXPECT_DOUBLE_EQ(c.pitch_threshold, 0.25);
  EXPECT_DOUBLE_EQ(c.yaw_threshold, 0.5);
  EXPECT_EQ(c.num_workers, 4u);
  EXPECT_EQ(c.person_class_id, 2);
  EXPECT_EQ(c.log_level, va::log::Level::Debug);
  EXPECT_TRUE(va::validate_config(c).has_value());
}

TEST(Config, MalformedNumberThrows) {
  const auto path = write_config("vigil_config_bad.conf", "pitch_threshold=steep\n");
  EXPECT_THROW((void)va::load_config(path), std::invalid_argument);
  std::filesystem::remove(path);
}

TEST(Config, OnnxWithoutModelsIsInvalid) {
  auto c = va::default_config();
  c.backend_type = va::InferenceBackendType::Onnx;
  auto valid = va::validate_config(c);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), vc::AnalysisError::InvalidConfig);
}

TEST(Config, OutOfRangeValuesAreInvalid) {
  auto c = va::default_config();
  c.face_confidence_threshold = 1.5f;
  EXPECT_FALSE(va::validate_config(c).has_value());

  c = va::default_config();
  c.yaw_threshold = -0.1;
  EXPECT_FALSE(va::validate_config(c).has_value());

  c = va::default_config();
  c.landmark_input_size = 0;
  EXPECT_FALSE(va::validate_config(c).has_value());
}
