#include <vigil/core/warnings.hpp>

namespace vigil::core {

std::vector<std::string> compose_warnings(const DirectionVerdict& direction) {
  std::vector<std::string> warnings;

  if (direction.looking_up) {
    warnings.emplace_back("Student is looking UP - possible cheating detected");
  }
  if (direction.looking_down) {
    warnings.emplace_back("Student is looking DOWN - possible cheating detected");
  }
  if (direction.looking_left) {
    warnings.emplace_back("Student is looking LEFT - possible cheating detected");
  }
  if (direction.looking_right) {
    warnings.emplace_back("Student is looking RIGHT - possible cheating detected");
  }

  if (warnings.empty()) {
    warnings.emplace_back(kLookingAtScreenWarning);
  }
  return warnings;
}

}  // namespace vigil::core
