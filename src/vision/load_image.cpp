#include <vigil/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <vigil/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace vigil::vision {

namespace {

std::optional<vigil::core::Frame> bgr_to_frame(const cv::Mat& bgr) {
  if (bgr.empty() || bgr.channels() != 3) return std::nullopt;
  cv::Mat rgb;
  cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
  return detail::mat_to_frame(rgb, vigil::core::PixelFormat::RGB8);
}

}  // namespace

std::optional<vigil::core::Frame> load_frame_from_image(const std::string& path) {
  return bgr_to_frame(cv::imread(path, cv::IMREAD_COLOR));
}

std::optional<vigil::core::Frame> decode_frame(std::span<const std::byte> encoded) {
  if (encoded.empty()) return std::nullopt;
  // imdecode only reads the buffer; the const_cast is for the cv::Mat header.
  const cv::Mat raw(1, static_cast<int>(encoded.size()), CV_8UC1,
                    const_cast<std::byte*>(encoded.data()));
  try {
    return bgr_to_frame(cv::imdecode(raw, cv::IMREAD_COLOR));
  } catch (const cv::Exception&) {
    return std::nullopt;
  }
}

}  // namespace vigil::vision
