#include <vigil/vision/normalize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace vigil::vision {

NormalizeStage::NormalizeStage(float mean, float scale)
    : mean_{mean, mean, mean}, scale_(scale) {}

NormalizeStage::NormalizeStage(std::array<float, 3> channel_mean, float scale)
    : mean_(channel_mean), scale_(scale) {}

std::expected<vigil::core::Frame, vigil::core::AnalysisError>
NormalizeStage::process(const vigil::core::Frame& input) const {
  using namespace vigil::core;

  if (input.empty()) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }
  if (input.format() != PixelFormat::RGB8 && input.format() != PixelFormat::BGR8) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }

  cv::Mat mat_float;
  mat_in->convertTo(mat_float, CV_32FC3);
  cv::subtract(mat_float, cv::Scalar(mean_[0], mean_[1], mean_[2]), mat_float);
  mat_float *= scale_;

  return detail::mat_to_frame(mat_float, PixelFormat::Float32Planar);
}

}  // namespace vigil::vision
