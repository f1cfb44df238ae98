#include <vigil/core/attention.hpp>
#include <algorithm>
#include <string>

namespace vigil::core {

namespace {

std::string describe(AttentionReason reason) {
  std::string words(to_string(reason));
  std::replace(words.begin(), words.end(), '_', ' ');
  return "Student is " + words;
}

}  // namespace

AttentionVerdict evaluate_attention(const std::optional<DirectionVerdict>& direction) {
  AttentionVerdict v;
  if (!direction.has_value()) {
    v.is_attentive = false;
    v.reason = AttentionReason::NoFace;
    v.severity = Severity::High;
    v.message = "No face detected";
    return v;
  }

  v.is_attentive = direction->looking_straight;
  v.reason = AttentionReason::Attentive;
  v.severity = Severity::None;

  if (direction->looking_up) {
    v.reason = AttentionReason::LookingUp;
    v.severity = Severity::Medium;
  } else if (direction->looking_down) {
    v.reason = AttentionReason::LookingDown;
    v.severity = Severity::Medium;
  } else if (direction->looking_left) {
    v.reason = AttentionReason::LookingLeft;
    v.severity = Severity::High;
  } else if (direction->looking_right) {
    v.reason = AttentionReason::LookingRight;
    v.severity = Severity::High;
  }

  v.message = v.is_attentive ? std::string("Student is attentive") : describe(v.reason);
  return v;
}

std::string_view to_string(AttentionReason reason) noexcept {
  switch (reason) {
    case AttentionReason::Attentive:
      return "attentive";
    case AttentionReason::LookingUp:
      return "looking_up";
    case AttentionReason::LookingDown:
      return "looking_down";
    case AttentionReason::LookingLeft:
      return "looking_left";
    case AttentionReason::LookingRight:
      return "looking_right";
    case AttentionReason::NoFace:
      return "no_face";
    default:
      return "unknown";
  }
}

std::string_view to_string(Severity severity) noexcept {
  switch (severity) {
    case Severity::None:
      return "none";
    case Severity::Medium:
      return "medium";
    case Severity::High:
      return "high";
    default:
      return "unknown";
  }
}

}  // namespace vigil::core
