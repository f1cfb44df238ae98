#pragma once

#include <vigil/core/direction.hpp>
#include <string>
#include <vector>

namespace vigil::core {

inline constexpr const char* kLookingAtScreenWarning = "Student is looking at screen - OK";
inline constexpr const char* kNoFaceWarning = "No face detected in frame";

/// Emits one warning per triggered flag in the order up, down, left, right,
/// or exactly kLookingAtScreenWarning when none is set. Unlike
/// evaluate_attention(), a diagonal gaze yields two warnings.
[[nodiscard]] std::vector<std::string> compose_warnings(const DirectionVerdict& direction);

}  // namespace vigil::core
