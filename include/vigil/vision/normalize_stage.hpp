#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/core/frame_stage.hpp>
#include <array>
#include <expected>

namespace vigil::vision {

/// Converts an 8-bit 3-channel frame to Float32Planar (HWC):
/// out = (pixel - mean[c]) * scale.
class NormalizeStage : public vigil::core::IFrameStage {
 public:
  NormalizeStage(float mean, float scale);
  NormalizeStage(std::array<float, 3> channel_mean, float scale);

  [[nodiscard]] std::expected<vigil::core::Frame, vigil::core::AnalysisError>
  process(const vigil::core::Frame& input) const override;

 private:
  std::array<float, 3> mean_;
  float scale_;
};

}  // namespace vigil::vision
