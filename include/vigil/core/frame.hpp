#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace vigil::core {

/// Channel layout of a Frame's bytes. Decoded camera images arrive as RGB8;
/// the face SSD converts to BGR8; model inputs are Float32Planar.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  Float32Planar,  // HWC float, 3 channels; model input after NormalizeStage
};

/// One image flowing through the engine: the student's camera frame handed to
/// FrameAnalysisPipeline, the face crop cut from it by crop_frame() for the
/// landmark detector, or a preprocessed tensor for a detection backend.
///
/// Rows are tightly packed (stride = width * bytes_per_pixel). The frame owns its
/// pixels; data() returns non-owning views. Collaborators only read frames, so one
/// Frame may be analysed from several threads at once.
class Frame {
 public:
  /// Empty frame; every pipeline entry point rejects it with InvalidFrame.
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  /// 1 for Grayscale8, 3 for RGB8/BGR8, 12 for Float32Planar, 0 for Unknown.
  [[nodiscard]] static std::size_t bytes_per_pixel(PixelFormat format) noexcept;

  /// Bytes a width x height image of this format needs; a shorter buffer is a
  /// truncated frame and is rejected by crop_frame() and the model backends.
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace vigil::core
