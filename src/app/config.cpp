#include <vigil/app/config.hpp>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace vigil::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::uint32_t parse_u32(const std::string& value) {
  return static_cast<std::uint32_t>(std::stoul(value));
}

}  // namespace

AnalyzerConfig default_config() {
  return AnalyzerConfig{};
}

AnalyzerConfig load_config(const std::string& path) {
  AnalyzerConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "backend_type") {
      if (value == "onnx") c.backend_type = InferenceBackendType::Onnx;
      else if (value == "mock") c.backend_type = InferenceBackendType::Mock;
      else throw std::invalid_argument("unknown backend_type: " + value);
    }
    else if (key == "face_model_path") c.face_model_path = value;
    else if (key == "landmark_model_path") c.landmark_model_path = value;
    else if (key == "model_points_path") c.model_points_path = value;
    else if (key == "people_model_path") c.people_model_path = value;
    else if (key == "face_confidence_threshold") c.face_confidence_threshold = std::stof(value);
    else if (key == "face_input_width") c.face_input_width = parse_u32(value);
    else if (key == "face_input_height") c.face_input_height = parse_u32(value);
    else if (key == "landmark_input_size") c.landmark_input_size = parse_u32(value);
    else if (key == "people_confidence_threshold") c.people_confidence_threshold = std::stof(value);
    else if (key == "person_class_id") c.person_class_id = std::stoll(value);
    else if (key == "pitch_threshold") c.pitch_threshold = std::stod(value);
    else if (key == "yaw_threshold") c.yaw_threshold = std::stod(value);
    else if (key == "num_workers") c.num_workers = static_cast<std::size_t>(std::stoul(value));
    else if (key == "log_level") {
      auto level = log::parse_level(value);
      if (!level) throw std::invalid_argument("unknown log_level: " + value);
      c.log_level = *level;
    }
  }
  return c;
}

std::expected<void, vigil::core::AnalysisError> validate_config(const AnalyzerConfig& c) {
  using vigil::core::AnalysisError;

  const auto in_unit_range = [](float v) { return v >= 0.f && v <= 1.f; };
  if (!in_unit_range(c.face_confidence_threshold) ||
      !in_unit_range(c.people_confidence_threshold)) {
    return std::unexpected(AnalysisError::InvalidConfig);
  }
  // NaN fails both comparisons.
  if (!(c.pitch_threshold >= 0.0) || !(c.yaw_threshold >= 0.0)) {
    return std::unexpected(AnalysisError::InvalidConfig);
  }
  if (c.face_input_width == 0 || c.face_input_height == 0 || c.landmark_input_size == 0) {
    return std::unexpected(AnalysisError::InvalidConfig);
  }
  if (c.backend_type == InferenceBackendType::Onnx &&
      (c.face_model_path.empty() || c.landmark_model_path.empty() ||
       c.model_points_path.empty())) {
    return std::unexpected(AnalysisError::InvalidConfig);
  }
  return {};
}

}  // namespace vigil::app
