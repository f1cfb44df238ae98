#pragma once

#include <vigil/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace vigil::vision::detail {

/// Convert Frame to cv::Mat (non-owning view). Returns nullopt if format unsupported.
std::optional<cv::Mat> frame_to_mat(const vigil::core::Frame& frame);

/// Convert cv::Mat to Frame (copy; handles non-continuous ROIs).
vigil::core::Frame mat_to_frame(const cv::Mat& mat, vigil::core::PixelFormat format);

}  // namespace vigil::vision::detail
