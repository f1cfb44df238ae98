#include <vigil/core/face.hpp>
#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace vigil::core {

LandmarkSet rescale_landmarks(const LandmarkSet& marks, const FaceBox& box) {
  const auto scale = static_cast<float>(box.width());
  LandmarkSet out;
  out.reserve(marks.size());
  for (const auto& m : marks) {
    out.push_back({m.x * scale + static_cast<float>(box.x1),
                   m.y * scale + static_cast<float>(box.y1)});
  }
  return out;
}

std::expected<Frame, AnalysisError> crop_frame(const Frame& frame, const FaceBox& box) {
  if (frame.empty() || frame.format() == PixelFormat::Float32Planar) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }
  const std::size_t bpp = Frame::bytes_per_pixel(frame.format());
  if (bpp == 0 || frame.size_bytes() < Frame::min_bytes(frame.width(), frame.height(),
                                                        frame.format())) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }
  if (box.width() <= 0 || box.height() <= 0 || box.x1 < 0 || box.y1 < 0 ||
      box.x2 > static_cast<int>(frame.width()) ||
      box.y2 > static_cast<int>(frame.height())) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }

  const std::size_t src_step = static_cast<std::size_t>(frame.width()) * bpp;
  const std::size_t row_bytes = static_cast<std::size_t>(box.width()) * bpp;
  std::vector<std::byte> buffer(row_bytes * static_cast<std::size_t>(box.height()));

  const auto src = frame.data();
  for (int y = box.y1; y < box.y2; ++y) {
    const std::size_t src_offset =
        static_cast<std::size_t>(y) * src_step + static_cast<std::size_t>(box.x1) * bpp;
    const std::size_t dst_offset = static_cast<std::size_t>(y - box.y1) * row_bytes;
    std::copy_n(src.begin() + static_cast<std::ptrdiff_t>(src_offset), row_bytes,
                buffer.begin() + static_cast<std::ptrdiff_t>(dst_offset));
  }
  return Frame(static_cast<std::uint32_t>(box.width()),
               static_cast<std::uint32_t>(box.height()), frame.format(),
               std::move(buffer));
}

}  // namespace vigil::core
