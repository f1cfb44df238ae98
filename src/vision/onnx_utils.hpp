#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <onnxruntime_cxx_api.h>
#include <cstdint>
#include <expected>
#include <vector>

namespace vigil::vision::detail {

/// Spatial size and layout of a model's 3-channel image input.
struct ImageInputShape {
  std::uint32_t height{0};
  std::uint32_t width{0};
  bool nchw{true};
  bool uint8{false};  // element type is uint8 rather than float
};

/// Reads input 0 as [1,3,H,W] or [1,H,W,3] of float or uint8. Throws std::runtime_error otherwise.
ImageInputShape read_image_input_shape(const Ort::Session& session);

/// Frame must be Float32Planar with the model's spatial size.
std::expected<void, vigil::core::AnalysisError> validate_image_input(
    const vigil::core::Frame& input, const ImageInputShape& shape);

Ort::MemoryInfo cpu_memory_info();

/// Wraps an HWC float frame as a model input tensor. For NCHW models the data is
/// transposed into nchw_scratch, which must outlive the returned tensor.
Ort::Value make_image_tensor(const vigil::core::Frame& input,
                             const ImageInputShape& shape,
                             const Ort::MemoryInfo& mem_info,
                             std::vector<float>& nchw_scratch);

/// Wraps HWC bytes (already 0-255) as a uint8 model input tensor, reordering them
/// in place to NCHW when the model expects it. hwc_pixels must outlive the tensor.
Ort::Value make_u8_image_tensor(std::vector<std::uint8_t>& hwc_pixels,
                                const ImageInputShape& shape,
                                const Ort::MemoryInfo& mem_info);

/// All-zero Float32Planar frame of the model input size (warmup input).
vigil::core::Frame make_zero_input(const ImageInputShape& shape);

}  // namespace vigil::vision::detail
