#include <vigil/vision/face_box.hpp>
#include <cstdlib>

namespace vigil::vision {

using vigil::core::FaceBox;

FaceBox move_box(const FaceBox& box, int dx, int dy) noexcept {
  return {box.x1 + dx, box.y1 + dy, box.x2 + dx, box.y2 + dy};
}

FaceBox square_box(const FaceBox& box) noexcept {
  FaceBox out = box;
  const int diff = box.height() - box.width();
  const int delta = std::abs(diff) / 2;

  if (diff > 0) {
    out.x1 -= delta;
    out.x2 += delta;
    if (diff % 2 == 1) out.x2 += 1;
  } else if (diff < 0) {
    out.y1 -= delta;
    out.y2 += delta;
    if (-diff % 2 == 1) out.y2 += 1;
  }
  return out;
}

bool box_in_image(const FaceBox& box, std::uint32_t width, std::uint32_t height) noexcept {
  return box.x1 >= 0 && box.y1 >= 0 &&
         box.x2 <= static_cast<int>(width) && box.y2 <= static_cast<int>(height);
}

std::optional<FaceBox> refine_face_box(const FaceBox& raw,
                                       std::uint32_t width,
                                       std::uint32_t height) {
  const int offset_y = std::abs(raw.height()) / 10;
  const FaceBox squared = square_box(move_box(raw, 0, offset_y));
  if (squared.width() <= 0 || !box_in_image(squared, width, height)) {
    return std::nullopt;
  }
  return squared;
}

}  // namespace vigil::vision
