#include <vigil/core/frame.hpp>
#include <vigil/vision/load_image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <filesystem>
#include <vector>

namespace vv = vigil::vision;
namespace vc = vigil::core;

namespace {

// 4x2 BGR image whose pixels are pure blue.
cv::Mat blue_image() {
  return cv::Mat(2, 4, CV_8UC3, cv::Scalar(255, 0, 0));
}

}  // namespace

TEST(DecodeFrame, DecodesPngAsRgb) {
  std::vector<uchar> encoded;
  ASSERT_TRUE(cv::imencode(".png", blue_image(), encoded));
  std::vector<std::byte> bytes(encoded.size());
  for (std::size_t i = 0; i < encoded.size(); ++i) bytes[i] = static_cast<std::byte>(encoded[i]);

  auto frame = vv::decode_frame(bytes);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->width(), 4u);
  EXPECT_EQ(frame->height(), 2u);
  EXPECT_EQ(frame->format(), vc::PixelFormat::RGB8);
  // Blue ends up in the third channel.
  EXPECT_EQ(frame->data()[0], std::byte{0});
  EXPECT_EQ(frame->data()[2], std::byte{255});
}

TEST(DecodeFrame, GarbageIsNullopt) {
  const std::vector<std::byte> garbage(16, std::byte{7});
  EXPECT_FALSE(vv::decode_frame(garbage).has_value());
  EXPECT_FALSE(vv::decode_frame({}).has_value());
}

TEST(LoadFrameFromImage, ReadsFileAsRgb) {
  const auto path = std::filesystem::temp_directory_path() / "vigil_load_image_test.png";
  ASSERT_TRUE(cv::imwrite(path.string(), blue_image()));
  auto frame = vv::load_frame_from_image(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->format(), vc::PixelFormat::RGB8);
  EXPECT_EQ(frame->data()[2], std::byte{255});
}

TEST(LoadFrameFromImage, MissingFileIsNullopt) {
  EXPECT_FALSE(vv::load_frame_from_image("/nonexistent/vigil_image.png").has_value());
}
