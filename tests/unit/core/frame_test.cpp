#include <transita/core/frame.hpp>
#include "test_frames.hpp"
#include <gtest/gtest.h>
#include <array>
#include <vector>

namespace tc = transita::core;

TEST(Frame, DefaultEmpty) {
  tc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_FALSE(f.valid());
  EXPECT_EQ(f.size_bytes(), 0u);
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 80 * 3);
  tc::Frame f(100, 80, tc::PixelFormat::BGR8, std::move(buf));
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 80u);
  EXPECT_EQ(f.format(), tc::PixelFormat::BGR8);
  EXPECT_EQ(f.channels(), 3u);
  EXPECT_TRUE(f.valid());
  EXPECT_EQ(f.data().size(), 100u * 80 * 3);
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(tc::Frame::min_bytes(10, 10, tc::PixelFormat::RGB8), 300u);
  EXPECT_EQ(tc::Frame::min_bytes(10, 10, tc::PixelFormat::BGRA8), 400u);
  EXPECT_EQ(tc::Frame::min_bytes(10, 10, tc::PixelFormat::Unknown), 0u);
}

TEST(Frame, ShortBufferIsInvalid) {
  tc::Frame f(10, 10, tc::PixelFormat::RGB8, std::vector<std::byte>(299));
  EXPECT_FALSE(f.valid());
}

TEST(Frame, UnknownFormatIsInvalid) {
  tc::Frame f(10, 10, tc::PixelFormat::Unknown, std::vector<std::byte>(300));
  EXPECT_FALSE(f.valid());
}

TEST(Frame, FilledSetsEveryPixel) {
  const auto f = transita::test::solid(4, 3, 10, 20, 30);
  ASSERT_TRUE(f.valid());
  EXPECT_DOUBLE_EQ(transita::test::fraction_of_color(f, 10, 20, 30), 1.0);
}

TEST(Frame, FilledDefaultsAlphaToOpaque) {
  const std::array<std::uint8_t, 3> values{1, 2, 3};
  const auto f = tc::Frame::filled(2, 2, tc::PixelFormat::RGBA8, values);
  const auto p = transita::test::pixel(f, 1, 1);
  EXPECT_EQ(p[0], 1);
  EXPECT_EQ(p[2], 3);
  EXPECT_EQ(p[3], 255);
}

TEST(Frame, FilledUnknownFormatIsEmpty) {
  const std::array<std::uint8_t, 3> values{1, 2, 3};
  EXPECT_TRUE(tc::Frame::filled(2, 2, tc::PixelFormat::Unknown, values).empty());
}

TEST(Frame, SameGeometry) {
  const auto a = transita::test::solid(8, 8, 0, 0, 0);
  const auto b = transita::test::solid(8, 8, 255, 255, 255);
  const auto c = transita::test::solid(8, 9, 0, 0, 0);
  const auto d = transita::test::solid(8, 8, 0, 0, 0, tc::PixelFormat::BGR8);
  EXPECT_TRUE(tc::same_geometry(a, b));
  EXPECT_FALSE(tc::same_geometry(a, c));
  EXPECT_FALSE(tc::same_geometry(a, d));
}
