#include <vigil/vision/color_convert_stage.hpp>
#include "frame_cv_utils.hpp"
#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <opencv2/imgproc.hpp>

namespace vigil::vision {

ColorConvertStage::ColorConvertStage(vigil::core::PixelFormat output_format)
    : output_format_(output_format) {}

std::expected<vigil::core::Frame, vigil::core::AnalysisError>
ColorConvertStage::process(const vigil::core::Frame& input) const {
  return convert_color(input, output_format_);
}

std::expected<vigil::core::Frame, vigil::core::AnalysisError> convert_color(
    const vigil::core::Frame& input, vigil::core::PixelFormat output_format) {
  using namespace vigil::core;

  if (input.empty()) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }

  if (input.format() == output_format) {
    return input;
  }

  int code = -1;
  const PixelFormat in = input.format();
  if ((in == PixelFormat::BGR8 && output_format == PixelFormat::RGB8) ||
      (in == PixelFormat::RGB8 && output_format == PixelFormat::BGR8)) {
    code = cv::COLOR_BGR2RGB;  // channel swap is symmetric
  } else if (in == PixelFormat::Grayscale8 &&
             (output_format == PixelFormat::RGB8 || output_format == PixelFormat::BGR8)) {
    code = cv::COLOR_GRAY2BGR;
  } else if (in == PixelFormat::RGB8 && output_format == PixelFormat::Grayscale8) {
    code = cv::COLOR_RGB2GRAY;
  } else if (in == PixelFormat::BGR8 && output_format == PixelFormat::Grayscale8) {
    code = cv::COLOR_BGR2GRAY;
  }

  if (code < 0) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }

  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return detail::mat_to_frame(mat_out, output_format);
}

}  // namespace vigil::vision
