#include <transita/transitions/warp_transition.hpp>
#include "test_frames.hpp"
#include <gtest/gtest.h>
#include <string>

namespace tc = transita::core;
namespace tt = transita::transitions;
using transita::test::gradient;
using transita::test::max_abs_diff;
using transita::test::pixel;
using transita::test::solid;

namespace {

const char* const kWarpTypes[] = {"swirl", "squeeze_h", "squeeze_v", "liquid", "wave"};

}  // namespace

TEST(WarpTransition, EndpointsMatchInputs) {
  tt::WarpTransition t;
  const auto a = gradient(64, 48);
  const auto b = solid(64, 48, 10, 200, 30);
  for (const char* type : kWarpTypes) {
    tc::ParamMap params{{"warp_type", std::string(type)}};
    auto first = t.apply(a, b, 0, 9, 30, params);
    auto last = t.apply(a, b, 8, 9, 30, params);
    ASSERT_TRUE(first.has_value()) << type;
    ASSERT_TRUE(last.has_value()) << type;
    EXPECT_EQ(max_abs_diff(*first, a), 0) << type;
    EXPECT_EQ(max_abs_diff(*last, b), 0) << type;
  }
}

TEST(WarpTransition, NoDarkeningBetweenSolidFrames) {
  tt::WarpTransition t;
  const auto red = solid(48, 32, 255, 0, 0);
  const auto blue = solid(48, 32, 0, 0, 255);
  for (const char* type : kWarpTypes) {
    tc::ParamMap params{{"warp_type", std::string(type)}, {"warp_intensity", 2.0}};
    for (std::uint32_t i = 0; i < 9; ++i) {
      auto out = t.apply(red, blue, i, 9, 30, params);
      ASSERT_TRUE(out.has_value()) << type;
      const auto p = pixel(*out, 5, 5);
      // Weights sum to one: red + blue stays at full intensity.
      EXPECT_NEAR(p[0] + p[2], 255, 2) << type << " frame " << i;
      EXPECT_EQ(p[1], 0);
    }
  }
}

TEST(WarpTransition, MidpointUsesSmoothstepWeights) {
  tt::WarpTransition t;
  auto out = t.apply(solid(48, 32, 255, 0, 0), solid(48, 32, 0, 0, 255), 4, 9, 30, {});
  ASSERT_TRUE(out.has_value());
  const auto p = pixel(*out, 20, 20);
  EXPECT_NEAR(p[0], 127.5, 1.0);
  EXPECT_NEAR(p[2], 127.5, 1.0);
}

TEST(WarpTransition, SwirlDisplacesInterior) {
  tt::WarpTransition t;
  const auto f = gradient(96, 96);
  tc::ParamMap params{{"warp_type", std::string("swirl")}, {"warp_intensity", 2.0},
                      {"scale_recovery", false}};
  auto out = t.apply(f, f, 4, 9, 30, params);
  ASSERT_TRUE(out.has_value());
  EXPECT_GT(max_abs_diff(*out, f), 0);
}
