#include <vigil/vision/resize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <opencv2/imgproc.hpp>

namespace vigil::vision {

ResizeStage::ResizeStage(std::uint32_t target_width,
                         std::uint32_t target_height)
    : target_width_(target_width), target_height_(target_height) {}

std::expected<vigil::core::Frame, vigil::core::AnalysisError>
ResizeStage::process(const vigil::core::Frame& input) const {
  using vigil::core::AnalysisError;

  if (input.empty() || target_width_ == 0 || target_height_ == 0) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }

  if (input.width() == target_width_ && input.height() == target_height_) {
    return input;
  }

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(static_cast<int>(target_width_),
                      static_cast<int>(target_height_)),
             0, 0, cv::INTER_LINEAR);

  return detail::mat_to_frame(mat_out, input.format());
}

}  // namespace vigil::vision
