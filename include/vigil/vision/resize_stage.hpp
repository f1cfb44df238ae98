#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/core/frame_stage.hpp>
#include <cstdint>
#include <expected>

namespace vigil::vision {

/// Resizes input frame to a fixed size (model input size).
class ResizeStage : public vigil::core::IFrameStage {
 public:
  ResizeStage(std::uint32_t target_width, std::uint32_t target_height);

  [[nodiscard]] std::expected<vigil::core::Frame, vigil::core::AnalysisError>
  process(const vigil::core::Frame& input) const override;

 private:
  std::uint32_t target_width_;
  std::uint32_t target_height_;
};

}  // namespace vigil::vision
