#include <vigil/core/frame.hpp>
#include <cstddef>

namespace vigil::core {

std::size_t Frame::bytes_per_pixel(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::Float32Planar:
      return 3 * sizeof(float);
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * bytes_per_pixel(format);
}

}  // namespace vigil::core
