#pragma once

#include <vigil/core/face.hpp>
#include <cstdint>
#include <optional>

namespace vigil::vision {

/// Shifts a box by (dx, dy) pixels.
[[nodiscard]] vigil::core::FaceBox move_box(const vigil::core::FaceBox& box, int dx, int dy) noexcept;

/// Expands the shorter side symmetrically so the box becomes square; an odd
/// difference puts the extra pixel on the right / bottom edge.
[[nodiscard]] vigil::core::FaceBox square_box(const vigil::core::FaceBox& box) noexcept;

/// True if the box lies fully inside a width x height image.
[[nodiscard]] bool box_in_image(const vigil::core::FaceBox& box,
                                std::uint32_t width,
                                std::uint32_t height) noexcept;

/// Detector box -> landmark crop: move down by 10% of the height (detector boxes
/// sit high on the face), make square, and reject if it leaves the image.
[[nodiscard]] std::optional<vigil::core::FaceBox> refine_face_box(
    const vigil::core::FaceBox& raw, std::uint32_t width, std::uint32_t height);

}  // namespace vigil::vision
