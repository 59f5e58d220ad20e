#include <transita/transitions/flip3d_transition.hpp>
#include "transition_support.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>

namespace transita::transitions {

namespace {

constexpr double kMinExtent = 0.2;
constexpr double kKeystone = 0.15;

/// Fraction of the frame still visible at \p angle degrees (1 = flat).
double flip_extent(double angle) {
  const double extent = angle <= 90.0 ? 1.0 - (angle / 90.0) * 0.8
                                      : ((angle - 90.0) / 90.0) * 0.8;
  return std::max(extent, kMinExtent);
}

}  // namespace

core::ParameterSchema Flip3dTransition::get_params() const {
  return {
      core::enum_param("flip_direction", "horizontal",
                       {"horizontal", "vertical", "diagonal"}, "Flip axis"),
      core::float_param("perspective_strength", 1.0, 0.5, 2.0, "Keystone strength"),
  };
}

std::expected<core::Frame, core::TransitionError> Flip3dTransition::apply(
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
  const double angle = p * 180.0;
  const bool first_half = angle <= 90.0;
  const cv::Mat& source = first_half ? in->frame1 : in->frame2;
  if (p <= 0.0 || p >= 0.95) {
    return detail::to_frame(source, in->format);
  }

  const std::string& direction = in->params.get_string("flip_direction");
  const double strength = in->params.get_float("perspective_strength");
  const auto w = static_cast<float>(source.cols);
  const auto h = static_cast<float>(source.rows);

  double ex = 1.0;
  double ey = 1.0;
  if (direction == "vertical") {
    ey = flip_extent(angle);
  } else if (direction == "diagonal") {
    const double e = std::abs(std::cos(angle * std::numbers::pi / 180.0)) * 0.7 + 0.3;
    ex = e;
    ey = e;
  } else {
    ex = flip_extent(angle);
  }

  // Visible quad: top-left, top-right, bottom-right, bottom-left.
  const float left = static_cast<float>(w * (1.0 - ex) / 2.0);
  const float right = static_cast<float>(w * (1.0 + ex) / 2.0);
  const float top = static_cast<float>(h * (1.0 - ey) / 2.0);
  const float bottom = static_cast<float>(h * (1.0 + ey) / 2.0);
  std::array<cv::Point2f, 4> dst{cv::Point2f(left, top), cv::Point2f(right, top),
                                 cv::Point2f(right, bottom), cv::Point2f(left, bottom)};

  // The edge turning away from the viewer gets shorter: the right (or bottom)
  // edge while closing, the left (or top) edge while opening.
  if (direction == "vertical") {
    const auto k = static_cast<float>(0.5 * (1.0 - ey) * kKeystone * strength * w);
    if (first_half) {
      dst[3].x += k;
      dst[2].x -= k;
    } else {
      dst[0].x += k;
      dst[1].x -= k;
    }
  } else {
    const double e = std::min(ex, ey);
    const auto k = static_cast<float>(0.5 * (1.0 - e) * kKeystone * strength * h);
    if (first_half) {
      dst[1].y += k;
      dst[2].y -= k;
    } else {
      dst[0].y += k;
      dst[3].y -= k;
    }
  }

  const std::array<cv::Point2f, 4> src{cv::Point2f(0, 0), cv::Point2f(w, 0),
                                       cv::Point2f(w, h), cv::Point2f(0, h)};
  const cv::Mat m = cv::getPerspectiveTransform(src.data(), dst.data());
  cv::Mat out;
  cv::warpPerspective(source, out, m, source.size(), cv::INTER_LINEAR, cv::BORDER_REPLICATE);
  return detail::to_frame(out, in->format);
}

}  // namespace transita::transitions
