#pragma once

#include <vigil/core/direction.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vigil::core {

/// Why a frame was (not) judged attentive.
enum class AttentionReason : std::uint8_t {
  Attentive,
  LookingUp,
  LookingDown,
  LookingLeft,
  LookingRight,
  NoFace,
};

/// Ordinal risk level: None < Medium < High.
enum class Severity : std::uint8_t {
  None = 0,
  Medium = 1,
  High = 2,
};

/// Single-reason attention decision for one frame.
struct AttentionVerdict {
  bool is_attentive{false};
  AttentionReason reason{AttentionReason::NoFace};
  Severity severity{Severity::High};
  std::string message;
};

/// First-match evaluation: up, down, left, right. Vertical deviation is
/// medium severity, horizontal deviation high; nullopt (no face) is high.
[[nodiscard]] AttentionVerdict evaluate_attention(
    const std::optional<DirectionVerdict>& direction);

/// Wire names: attentive, looking_up, looking_down, looking_left, looking_right, no_face.
[[nodiscard]] std::string_view to_string(AttentionReason reason) noexcept;

/// Wire names: none, medium, high.
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

}  // namespace vigil::core
