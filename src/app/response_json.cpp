#include <vigil/app/response_json.hpp>
#include <string>

namespace vigil::app {

namespace {

nlohmann::json column(double a, double b, double c) {
  using nlohmann::json;
  return json::array({json::array({a}), json::array({b}), json::array({c})});
}

void add_session(nlohmann::json& j, const std::optional<std::string>& session_id) {
  if (session_id) j["session_id"] = *session_id;
}

}  // namespace

nlohmann::json to_json(const vigil::core::DirectionVerdict& d) {
  return nlohmann::json{
      {"looking_up", d.looking_up},
      {"looking_down", d.looking_down},
      {"looking_left", d.looking_left},
      {"looking_right", d.looking_right},
      {"looking_straight", d.looking_straight},
      {"pitch", d.pitch},
      {"yaw", d.yaw},
      {"roll", d.roll},
  };
}

nlohmann::json to_json(const vigil::core::AnalysisResult& result) {
  nlohmann::json j;
  j["status"] = std::string(vigil::core::to_string(result.status));
  j["head_direction"] = result.direction ? to_json(*result.direction) : nlohmann::json(nullptr);
  if (result.pose) {
    const auto& r = result.pose->rotation;
    const auto& t = result.pose->translation;
    j["pose"] = {
        {"rotation", column(r.pitch, r.yaw, r.roll)},
        {"translation", column(t.x, t.y, t.z)},
    };
  }
  j["warnings"] = result.warnings;
  add_session(j, result.session_id);
  return j;
}

nlohmann::json to_json(const vigil::core::AttentionReport& report) {
  const auto& v = report.verdict;
  nlohmann::json j;
  j["attention"] = v.is_attentive;
  j["reason"] = std::string(vigil::core::to_string(v.reason));
  if (report.direction) j["direction"] = to_json(*report.direction);
  j["severity"] = std::string(vigil::core::to_string(v.severity));
  j["message"] = v.message;
  add_session(j, report.session_id);
  return j;
}

nlohmann::json to_json(const vigil::vision::PeopleCount& count) {
  return nlohmann::json{{"people", count.people}};
}

}  // namespace vigil::app
