#pragma once

#include <vigil/core/analysis_result.hpp>
#include <vigil/core/direction.hpp>
#include <vigil/vision/people_counter.hpp>
#include <nlohmann/json.hpp>

namespace vigil::app {

/// {looking_up, looking_down, looking_left, looking_right, looking_straight, pitch, yaw, roll}
[[nodiscard]] nlohmann::json to_json(const vigil::core::DirectionVerdict& direction);

/// {status, head_direction (null without a face), pose {rotation, translation} (face only), warnings}.
/// Rotation and translation are 3x1 column vectors: [[a], [b], [c]].
[[nodiscard]] nlohmann::json to_json(const vigil::core::AnalysisResult& result);

/// {attention, reason, direction (face only), severity, message}
[[nodiscard]] nlohmann::json to_json(const vigil::core::AttentionReport& report);

/// {people}
[[nodiscard]] nlohmann::json to_json(const vigil::vision::PeopleCount& count);

}  // namespace vigil::app
