#include <transita/transitions/crossfade_transition.hpp>
#include "test_frames.hpp"
#include <gtest/gtest.h>
#include <string>

namespace tc = transita::core;
namespace tt = transita::transitions;
using transita::test::max_abs_diff;
using transita::test::pixel;
using transita::test::solid;

namespace {

tc::ParamMap mode(const std::string& m) {
  return {{"transition_mode", m}};
}

}  // namespace

TEST(CrossfadeTransition, EndpointsMatchInputs) {
  tt::CrossfadeTransition t;
  const auto red = solid(32, 24, 255, 0, 0);
  const auto blue = solid(32, 24, 0, 0, 255);
  auto first = t.apply(red, blue, 0, 5, 30, {});
  auto last = t.apply(red, blue, 4, 5, 30, {});
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(max_abs_diff(*first, red), 0);
  EXPECT_EQ(max_abs_diff(*last, blue), 0);
}

TEST(CrossfadeTransition, MidpointIsEvenMix) {
  tt::CrossfadeTransition t;
  auto mid = t.apply(solid(32, 24, 255, 0, 0), solid(32, 24, 0, 0, 255), 2, 5, 30, {});
  ASSERT_TRUE(mid.has_value());
  const auto p = pixel(*mid, 10, 10);
  EXPECT_NEAR(p[0], 127.5, 1.0);
  EXPECT_EQ(p[1], 0);
  EXPECT_NEAR(p[2], 127.5, 1.0);
}

TEST(CrossfadeTransition, FadeThroughBlackAndWhite) {
  tt::CrossfadeTransition t;
  const auto a = solid(16, 16, 200, 100, 50);
  const auto b = solid(16, 16, 10, 20, 30);
  auto black = t.apply(a, b, 2, 5, 30, mode("fade_to_black"));
  auto white = t.apply(a, b, 2, 5, 30, mode("fade_to_white"));
  ASSERT_TRUE(black.has_value());
  ASSERT_TRUE(white.has_value());
  EXPECT_DOUBLE_EQ(transita::test::fraction_of_color(*black, 0, 0, 0), 1.0);
  EXPECT_DOUBLE_EQ(transita::test::fraction_of_color(*white, 255, 255, 255), 1.0);

  // Quarter way: halfway between frame1 and black.
  auto quarter = t.apply(a, b, 1, 5, 30, mode("fade_to_black"));
  ASSERT_TRUE(quarter.has_value());
  EXPECT_NEAR(pixel(*quarter, 0, 0)[0], 100, 1);
}

TEST(CrossfadeTransition, FadeToCustomColor) {
  tt::CrossfadeTransition t;
  tc::ParamMap params{{"transition_mode", std::string("fade_to_custom")},
                      {"background_color", std::string("#336699")}};
  auto mid = t.apply(solid(16, 16, 0, 0, 0), solid(16, 16, 255, 255, 255), 2, 5, 30, params);
  ASSERT_TRUE(mid.has_value());
  EXPECT_DOUBLE_EQ(transita::test::fraction_of_color(*mid, 0x33, 0x66, 0x99), 1.0);
}

TEST(CrossfadeTransition, CustomColorRespectsBgrOrder) {
  tt::CrossfadeTransition t;
  tc::ParamMap params{{"transition_mode", std::string("fade_to_custom")},
                      {"background_color", std::string("red")}};
  const auto a = solid(8, 8, 0, 0, 0, tc::PixelFormat::BGR8);
  auto mid = t.apply(a, a, 2, 5, 30, params);
  ASSERT_TRUE(mid.has_value());
  const auto p = pixel(*mid, 0, 0);  // B, G, R
  EXPECT_EQ(p[0], 0);
  EXPECT_EQ(p[2], 255);
}

TEST(CrossfadeTransition, InvalidCustomColorRejected) {
  tt::CrossfadeTransition t;
  tc::ParamMap params{{"transition_mode", std::string("fade_to_custom")},
                      {"background_color", std::string("not-a-color")}};
  auto out = t.apply(solid(8, 8, 0, 0, 0), solid(8, 8, 0, 0, 0), 0, 5, 30, params);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), tc::TransitionError::InvalidConfig);
}

TEST(CrossfadeTransition, AdditiveSaturates) {
  tt::CrossfadeTransition t;
  auto out = t.apply(solid(8, 8, 200, 200, 200), solid(8, 8, 100, 100, 100), 4, 5, 30,
                     mode("additive_dissolve"));
  ASSERT_TRUE(out.has_value());
  EXPECT_DOUBLE_EQ(transita::test::fraction_of_color(*out, 255, 255, 255), 1.0);
}

TEST(CrossfadeTransition, ChromaticDissolveEndpoints) {
  tt::CrossfadeTransition t;
  const auto a = transita::test::gradient(64, 32);
  const auto b = solid(64, 32, 9, 9, 9);
  auto first = t.apply(a, b, 0, 5, 30, mode("chromatic_dissolve"));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(max_abs_diff(*first, a), 0);

  // At the end the red channel of frame2 is shifted left by 10 px (zero fill).
  auto last = t.apply(a, b, 4, 5, 30, mode("chromatic_dissolve"));
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(pixel(*last, 10, 5)[0], 9);
  EXPECT_EQ(pixel(*last, 60, 5)[0], 0);
  EXPECT_EQ(pixel(*last, 60, 5)[1], 9);  // green unshifted
  EXPECT_EQ(pixel(*last, 5, 5)[2], 0);   // blue shifted right
}

TEST(CrossfadeTransition, ChromaticShiftFollowsColorNotBufferOrder) {
  tt::CrossfadeTransition t;
  // p = 0.5: red moves 5 px left, blue 5 px right, in either channel order.
  for (const auto format : {tc::PixelFormat::RGB8, tc::PixelFormat::BGR8}) {
    const bool bgr = format == tc::PixelFormat::BGR8;
    const std::size_t red = bgr ? 2 : 0;
    const std::size_t blue = bgr ? 0 : 2;
    const auto a = solid(64, 32, 0, 0, 0, format);
    const auto b = solid(64, 32, 200, 200, 200, format);
    auto mid = t.apply(a, b, 2, 5, 30, mode("chromatic_dissolve"));
    ASSERT_TRUE(mid.has_value());
    const auto left = pixel(*mid, 2, 5);
    const auto right = pixel(*mid, 62, 5);
    EXPECT_EQ(left[red], 100) << (bgr ? "BGR8" : "RGB8");
    EXPECT_EQ(right[red], 0) << (bgr ? "BGR8" : "RGB8");
    EXPECT_EQ(left[blue], 0) << (bgr ? "BGR8" : "RGB8");
    EXPECT_EQ(right[blue], 100) << (bgr ? "BGR8" : "RGB8");
    EXPECT_EQ(left[1], 100);
    EXPECT_EQ(right[1], 100);
  }
}

TEST(CrossfadeTransition, AlphaChannelIsBlended) {
  tt::CrossfadeTransition t;
  const auto a = solid(8, 8, 255, 0, 0, tc::PixelFormat::RGBA8);
  const auto b = solid(8, 8, 0, 0, 255, tc::PixelFormat::RGBA8);
  auto mid = t.apply(a, b, 1, 3, 30, {});
  ASSERT_TRUE(mid.has_value());
  EXPECT_EQ(mid->format(), tc::PixelFormat::RGBA8);
  EXPECT_EQ(pixel(*mid, 4, 4)[3], 255);
}

TEST(CrossfadeTransition, UnknownModeRejected) {
  tt::CrossfadeTransition t;
  auto out = t.apply(solid(8, 8, 0, 0, 0), solid(8, 8, 0, 0, 0), 0, 5, 30, mode("sparkle"));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), tc::TransitionError::InvalidConfig);
}

TEST(CrossfadeTransition, InputChecks) {
  tt::CrossfadeTransition t;
  auto empty = t.apply(tc::Frame(), solid(8, 8, 0, 0, 0), 0, 5, 30, {});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), tc::TransitionError::InvalidFrame);

  auto mismatch = t.apply(solid(8, 8, 0, 0, 0), solid(9, 8, 0, 0, 0), 0, 5, 30, {});
  ASSERT_FALSE(mismatch.has_value());
  EXPECT_EQ(mismatch.error(), tc::TransitionError::FrameDimensionMismatch);
}
