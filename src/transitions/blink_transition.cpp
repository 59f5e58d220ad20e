#include <transita/transitions/blink_transition.hpp>
#include "transition_support.hpp"
#include "vision/frame_cv_utils.hpp"
#include <transita/vision/color.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace transita::transitions {

namespace {

constexpr double kMaxFeather = 0.1;  // of the frame height

/// Coverage in [0,1] of both eyelids, CV_32FC1.
cv::Mat eyelid_mask(int width, int height, double closure, double curve, double feather) {
  cv::Mat mask(height, width, CV_32FC1);
  const double half = height / 2.0;
  const double feather_px = feather * kMaxFeather * height;

  std::vector<double> edge(static_cast<std::size_t>(width));
  for (int x = 0; x < width; ++x) {
    const double u = width > 1 ? 2.0 * x / (width - 1) - 1.0 : 0.0;
    // Parabola: deepest at the center, exactly closure * half at the sides.
    edge[static_cast<std::size_t>(x)] =
        closure * half * (1.0 + curve) - curve * closure * half * u * u;
  }

  const auto cover = [feather_px](double depth, double edge_y) {
    if (feather_px <= 0.0) return depth < edge_y ? 1.0 : 0.0;
    return std::clamp((edge_y - depth) / feather_px, 0.0, 1.0);
  };

  for (int y = 0; y < height; ++y) {
    auto* row = mask.ptr<float>(y);
    const double from_bottom = height - 1 - y;
    for (int x = 0; x < width; ++x) {
      const double e = edge[static_cast<std::size_t>(x)];
      row[x] = static_cast<float>(std::max(cover(y, e), cover(from_bottom, e)));
    }
  }
  return mask;
}

cv::Scalar mask_scalar(const std::string& name, core::PixelFormat format) {
  // Enum choices are all valid color names.
  return vision::detail::to_scalar(vision::parse_color(name).value_or(vision::Rgb{}), format);
}

}  // namespace

double blink_closure(std::uint32_t frame_index, std::uint32_t total_frames,
                     double speed) noexcept {
  if (total_frames <= 1) return 0.0;
  const std::uint32_t mid = total_frames / 2;
  double c = 0.0;
  if (frame_index < mid) {
    c = std::pow(static_cast<double>(frame_index) / mid, speed);
  } else {
    const double denom = static_cast<double>(total_frames - 1 - mid);
    if (denom > 0.0 && frame_index < total_frames) {
      c = std::pow(static_cast<double>(total_frames - 1 - frame_index) / denom, speed);
    }
  }
  return std::clamp(c, 0.0, 1.0);
}

core::ParameterSchema BlinkTransition::get_params() const {
  return {
      core::float_param("blink_speed", 1.0, 0.3, 3.0, "Closure curve exponent"),
      core::float_param("blur_intensity", 0.8, 0.0, 2.0, "Blur while the eye is closing"),
      core::float_param("eyelid_curve", 0.3, 0.0, 1.0, "Eyelid edge curvature"),
      core::float_param("edge_feather", 0.2, 0.0, 1.0, "Eyelid edge softness"),
      core::enum_param("mask_color", "black", {"black", "white", "gray"}, "Eyelid color"),
  };
}

std::expected<core::Frame, core::TransitionError> BlinkTransition::apply(
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

  const bool first = total_frames <= 1 || frame_index < total_frames / 2;
  const cv::Mat& source = first ? in->frame1 : in->frame2;
  const double closure = blink_closure(frame_index, total_frames,
                                       in->params.get_float("blink_speed"));
  if (closure <= 0.0) {
    return detail::to_frame(source, in->format);
  }

  cv::Mat frame = source;
  const double blur = in->params.get_float("blur_intensity");
  if (closure > 0.1 && blur > 0.0) {
    int k = static_cast<int>(5.0 + blur * closure * 15.0);
    if (k % 2 == 0) ++k;
    cv::GaussianBlur(source, frame, cv::Size(k, k), 0.0);
  }

  const cv::Mat m = eyelid_mask(source.cols, source.rows, closure,
                                in->params.get_float("eyelid_curve"),
                                in->params.get_float("edge_feather"));
  std::vector<cv::Mat> planes(static_cast<std::size_t>(source.channels()), m);
  cv::Mat coverage;
  cv::merge(planes, coverage);

  cv::Mat frame_f;
  frame.convertTo(frame_f, CV_32F);
  const cv::Mat color_f(source.size(), frame_f.type(),
                        mask_scalar(in->params.get_string("mask_color"), in->format));
  cv::Mat inverse;
  cv::subtract(cv::Scalar::all(1.0), coverage, inverse);
  const cv::Mat blended_f = frame_f.mul(inverse) + color_f.mul(coverage);

  cv::Mat out;
  blended_f.convertTo(out, source.type());  // rounds and saturates
  return detail::to_frame(out, in->format);
}

}  // namespace transita::transitions
