#include <transita/transitions/explosion_transition.hpp>
#include "transition_support.hpp"
#include "vision/frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <random>

namespace transita::transitions {

namespace {

constexpr double kMaxDisplacementPx = 20.0;

std::uint64_t field_seed(std::int64_t seed, std::uint32_t frame_index) {
  if (seed < 0) {
    return (static_cast<std::uint64_t>(std::random_device{}()) << 32) | std::random_device{}();
  }
  // splitmix-style mix so neighbouring frames get unrelated fields
  std::uint64_t z = static_cast<std::uint64_t>(seed) * 0x9E3779B97F4A7C15ull + frame_index;
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
  return z ^ (z >> 31);
}

}  // namespace

core::ParameterSchema ExplosionTransition::get_params() const {
  return {
      core::float_param("explosion_strength", 1.0, 0.5, 2.0, "Scatter distance multiplier"),
      core::int_param("seed", -1, -1, 2147483647,
                      "Seed for the displacement field (-1 = nondeterministic)"),
  };
}

std::expected<core::Frame, core::TransitionError> ExplosionTransition::apply(
    const core::Frame& frame1,
    const core::Frame& frame2,
    std::uint32_t frame_index,
    std::uint32_t total_frames,
    std::uint32_t /*fps*/,
    const core::ParamMap& params) const {
  auto in = detail::prepare_inputs(*this, frame1, frame2, frame_index, total_frames, params);
  if (!in) {
    return std::unexpected(in.error());
  }

  const double p = in->progress;
  const double strength = in->params.get_float("explosion_strength");
  const bool scatter = p < 0.5;
  const cv::Mat& source = scatter ? in->frame1 : in->frame2;
  const double sigma = (scatter ? p * 2.0 : 1.0 - (p - 0.5) * 2.0) * strength *
                       kMaxDisplacementPx;
  if (sigma <= 0.0) {
    return detail::to_frame(source, in->format);
  }

  cv::RNG rng(field_seed(in->params.get_int("seed"), frame_index));
  cv::Mat noise_x(source.size(), CV_32FC1);
  cv::Mat noise_y(source.size(), CV_32FC1);
  rng.fill(noise_x, cv::RNG::NORMAL, 0.0, sigma);
  rng.fill(noise_y, cv::RNG::NORMAL, 0.0, sigma);

  cv::Mat map_x(source.size(), CV_32FC1);
  cv::Mat map_y(source.size(), CV_32FC1);
  for (int y = 0; y < source.rows; ++y) {
    const auto* nx = noise_x.ptr<float>(y);
    const auto* ny = noise_y.ptr<float>(y);
    auto* mx = map_x.ptr<float>(y);
    auto* my = map_y.ptr<float>(y);
    for (int x = 0; x < source.cols; ++x) {
      mx[x] = static_cast<float>(x) + nx[x];
      my[x] = static_cast<float>(y) + ny[x];
    }
  }

  cv::Mat out;
  cv::remap(source, out, map_x, map_y, cv::INTER_NEAREST, cv::BORDER_CONSTANT,
            vision::detail::to_scalar({0, 0, 0}, in->format));
  return detail::to_frame(out, in->format);
}

}  // namespace transita::transitions
