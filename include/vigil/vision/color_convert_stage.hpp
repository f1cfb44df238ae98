#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/core/frame_stage.hpp>
#include <expected>

namespace vigil::vision {

/// Converts between 8-bit pixel formats (e.g. RGB -> BGR for Caffe-trained detectors).
class ColorConvertStage : public vigil::core::IFrameStage {
 public:
  explicit ColorConvertStage(vigil::core::PixelFormat output_format);

  [[nodiscard]] std::expected<vigil::core::Frame, vigil::core::AnalysisError>
  process(const vigil::core::Frame& input) const override;

 private:
  vigil::core::PixelFormat output_format_;
};

/// Free-function form of ColorConvertStage.
[[nodiscard]] std::expected<vigil::core::Frame, vigil::core::AnalysisError> convert_color(
    const vigil::core::Frame& input, vigil::core::PixelFormat output_format);

}  // namespace vigil::vision
