#include "frame_cv_utils.hpp"
#include <vigil/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace vigil::vision::detail {

namespace vc = vigil::core;

std::optional<cv::Mat> frame_to_mat(const vc::Frame& frame) {
  if (frame.empty() || frame.height() == 0) return std::nullopt;
  if (frame.size_bytes() < vc::Frame::min_bytes(frame.width(), frame.height(), frame.format())) {
    return std::nullopt;
  }

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* data = const_cast<std::byte*>(frame.data().data());
  const std::size_t step = frame.width() * vc::Frame::bytes_per_pixel(frame.format());

  switch (frame.format()) {
    case vc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case vc::PixelFormat::RGB8:
    case vc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case vc::PixelFormat::Float32Planar:
      return cv::Mat(h, w, CV_32FC3, data, step);
    case vc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

vc::Frame mat_to_frame(const cv::Mat& mat, vc::PixelFormat format) {
  if (mat.empty()) return vc::Frame();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(contiguous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(contiguous.rows);
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return vc::Frame(w, h, format, std::move(buffer));
}

}  // namespace vigil::vision::detail
