#pragma once

#include <vigil/core/frame.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace vigil::vision {

/// Load an image file into an RGB8 Frame. Returns nullopt on failure.
std::optional<vigil::core::Frame> load_frame_from_image(const std::string& path);

/// Decode an encoded image (JPEG, PNG, ...) held in memory into an RGB8 Frame.
/// Returns nullopt if the bytes are not a decodable image.
std::optional<vigil::core::Frame> decode_frame(std::span<const std::byte> encoded);

}  // namespace vigil::vision
