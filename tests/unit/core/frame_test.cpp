#include <vigil/core/frame.hpp>
#include <gtest/gtest.h>
#include <utility>
#include <vector>

namespace vc = vigil::core;

TEST(Frame, DefaultEmpty) {
  vc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_EQ(f.format(), vc::PixelFormat::Unknown);
  EXPECT_TRUE(f.empty());
  EXPECT_EQ(f.size_bytes(), 0u);
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(64 * 48 * 3);
  vc::Frame f(64, 48, vc::PixelFormat::BGR8, std::move(buf));
  EXPECT_EQ(f.width(), 64u);
  EXPECT_EQ(f.height(), 48u);
  EXPECT_EQ(f.format(), vc::PixelFormat::BGR8);
  EXPECT_FALSE(f.empty());
  EXPECT_EQ(f.data().size(), 64u * 48 * 3);
}

TEST(Frame, BytesPerPixel) {
  EXPECT_EQ(vc::Frame::bytes_per_pixel(vc::PixelFormat::Unknown), 0u);
  EXPECT_EQ(vc::Frame::bytes_per_pixel(vc::PixelFormat::Grayscale8), 1u);
  EXPECT_EQ(vc::Frame::bytes_per_pixel(vc::PixelFormat::RGB8), 3u);
  EXPECT_EQ(vc::Frame::bytes_per_pixel(vc::PixelFormat::Float32Planar), 12u);
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(vc::Frame::min_bytes(10, 10, vc::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(vc::Frame::min_bytes(10, 10, vc::PixelFormat::RGB8), 300u);
  EXPECT_EQ(vc::Frame::min_bytes(10, 10, vc::PixelFormat::Float32Planar), 10u * 10 * 3 * 4);
}

TEST(Frame, MutableDataWritesThrough) {
  vc::Frame f(2, 1, vc::PixelFormat::Grayscale8, std::vector<std::byte>(2));
  f.data()[1] = std::byte{42};
  EXPECT_EQ(std::as_const(f).data()[1], std::byte{42});
}
