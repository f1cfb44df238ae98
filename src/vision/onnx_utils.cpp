#include "onnx_utils.hpp"
#include <array>
#include <cstddef>
#include <stdexcept>

namespace vigil::vision::detail {

namespace {

constexpr std::int64_t kNumChannels = 3;

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void hwc_to_nchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      nchw[0 * hw + y * w + x] = hwc[src_idx + 0];
      nchw[1 * hw + y * w + x] = hwc[src_idx + 1];
      nchw[2 * hw + y * w + x] = hwc[src_idx + 2];
    }
  }
}

}  // namespace

ImageInputShape read_image_input_shape(const Ort::Session& session) {
  Ort::TypeInfo input_type = session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  const std::vector<std::int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("ONNX model: expected 4D image input");
  }

  ImageInputShape shape;
  if (dims[1] == kNumChannels) {
    shape.nchw = true;
    shape.height = static_cast<std::uint32_t>(dims[2]);
    shape.width = static_cast<std::uint32_t>(dims[3]);
  } else if (dims[3] == kNumChannels) {
    shape.nchw = false;
    shape.height = static_cast<std::uint32_t>(dims[1]);
    shape.width = static_cast<std::uint32_t>(dims[2]);
  } else {
    throw std::runtime_error("ONNX model: expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (dims[1] <= 0 || dims[2] <= 0 || dims[3] <= 0) {
    throw std::runtime_error("ONNX model: dynamic spatial input size is not supported");
  }
  const auto type = shape_info.GetElementType();
  if (type == ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8) {
    shape.uint8 = true;
  } else if (type != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
    throw std::runtime_error("ONNX model: image input must be float or uint8");
  }
  return shape;
}

std::expected<void, vigil::core::AnalysisError> validate_image_input(
    const vigil::core::Frame& input, const ImageInputShape& shape) {
  using vigil::core::AnalysisError;
  using vigil::core::PixelFormat;

  if (input.empty()) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }
  if (input.format() != PixelFormat::Float32Planar) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }
  if (input.width() != shape.width || input.height() != shape.height) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }
  if (input.size_bytes() <
      vigil::core::Frame::min_bytes(shape.width, shape.height, PixelFormat::Float32Planar)) {
    return std::unexpected(AnalysisError::InvalidFrame);
  }
  return {};
}

Ort::MemoryInfo cpu_memory_info() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

Ort::Value make_image_tensor(const vigil::core::Frame& input,
                             const ImageInputShape& shape,
                             const Ort::MemoryInfo& mem_info,
                             std::vector<float>& nchw_scratch) {
  const std::uint32_t h = input.height();
  const std::uint32_t w = input.width();
  const float* src = reinterpret_cast<const float*>(input.data().data());
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;

  if (shape.nchw) {
    nchw_scratch.resize(num_floats);
    hwc_to_nchw(src, h, w, nchw_scratch.data());
    const std::array<std::int64_t, 4> dims{1, kNumChannels,
                                           static_cast<std::int64_t>(h),
                                           static_cast<std::int64_t>(w)};
    return Ort::Value::CreateTensor<float>(mem_info, nchw_scratch.data(), num_floats,
                                           dims.data(), dims.size());
  }

  const std::array<std::int64_t, 4> dims{1, static_cast<std::int64_t>(h),
                                         static_cast<std::int64_t>(w), kNumChannels};
  return Ort::Value::CreateTensor<float>(mem_info, const_cast<float*>(src), num_floats,
                                         dims.data(), dims.size());
}

Ort::Value make_u8_image_tensor(std::vector<std::uint8_t>& hwc_pixels,
                                const ImageInputShape& shape,
                                const Ort::MemoryInfo& mem_info) {
  const std::uint32_t h = shape.height;
  const std::uint32_t w = shape.width;
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  const std::size_t num_values = static_cast<std::size_t>(kNumChannels) * hw;
  if (hwc_pixels.size() != num_values) {
    throw std::invalid_argument("make_u8_image_tensor: pixel count does not match model input");
  }

  if (shape.nchw) {
    std::vector<std::uint8_t> nchw(num_values);
    for (std::size_t i = 0; i < hw; ++i) {
      for (std::size_t c = 0; c < static_cast<std::size_t>(kNumChannels); ++c) {
        nchw[c * hw + i] = hwc_pixels[i * kNumChannels + c];
      }
    }
    hwc_pixels.swap(nchw);
    const std::array<std::int64_t, 4> dims{1, kNumChannels, static_cast<std::int64_t>(h),
                                           static_cast<std::int64_t>(w)};
    return Ort::Value::CreateTensor<std::uint8_t>(mem_info, hwc_pixels.data(), num_values,
                                                  dims.data(), dims.size());
  }

  const std::array<std::int64_t, 4> dims{1, static_cast<std::int64_t>(h),
                                         static_cast<std::int64_t>(w), kNumChannels};
  return Ort::Value::CreateTensor<std::uint8_t>(mem_info, hwc_pixels.data(), num_values,
                                                dims.data(), dims.size());
}

vigil::core::Frame make_zero_input(const ImageInputShape& shape) {
  const std::size_t num_bytes = vigil::core::Frame::min_bytes(
      shape.width, shape.height, vigil::core::PixelFormat::Float32Planar);
  std::vector<std::byte> buffer(num_bytes, std::byte{0});
  return vigil::core::Frame(shape.width, shape.height,
                            vigil::core::PixelFormat::Float32Planar, std::move(buffer));
}

}  // namespace vigil::vision::detail
