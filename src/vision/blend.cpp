#include <transita/vision/blend.hpp>
#include "frame_cv_utils.hpp"
#include <transita/core/transition.hpp>
#include <opencv2/core.hpp>
#include <algorithm>

namespace transita::vision {

double smoothstep(double t) noexcept {
  t = std::clamp(t, 0.0, 1.0);
  return t * t * (3.0 - 2.0 * t);
}

BlendWeights linear_weights(double progress) noexcept {
  const double p = std::clamp(progress, 0.0, 1.0);
  return {1.0 - p, p};
}

BlendWeights smoothstep_weights(double progress) noexcept {
  const double second = smoothstep(progress);
  return {1.0 - second, second};
}

std::expected<core::Frame, core::TransitionError> blend_frames(
    const core::Frame& a, const core::Frame& b, BlendWeights weights) {
  auto valid = core::check_input_frames(a, b);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto mat_a = detail::frame_to_mat(a);
  auto mat_b = detail::frame_to_mat(b);
  if (!mat_a || !mat_b) {
    return std::unexpected(core::TransitionError::InvalidFrame);
  }

  cv::Mat out;
  cv::addWeighted(*mat_a, weights.first, *mat_b, weights.second, 0.0, out);
  return detail::mat_to_frame(out, a.format());
}

}  // namespace transita::vision
