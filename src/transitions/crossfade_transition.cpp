#include <transita/transitions/crossfade_transition.hpp>
#include "transition_support.hpp"
#include "vision/frame_cv_utils.hpp"
#include <transita/vision/color.hpp>
#include <spdlog/spdlog.h>
#include <opencv2/core.hpp>
#include <cstdlib>
#include <vector>

namespace transita::transitions {

namespace {

cv::Mat fade_through_color(const cv::Mat& f1, const cv::Mat& f2, double p,
                           const cv::Scalar& color) {
  const cv::Mat solid(f1.size(), f1.type(), color);
  cv::Mat out;
  if (p < 0.5) {
    const double alpha = p * 2.0;
    cv::addWeighted(f1, 1.0 - alpha, solid, alpha, 0.0, out);
  } else {
    const double alpha = (p - 0.5) * 2.0;
    cv::addWeighted(solid, 1.0 - alpha, f2, alpha, 0.0, out);
  }
  return out;
}

cv::Mat additive(const cv::Mat& f1, const cv::Mat& f2, double p) {
  cv::Mat out;
  cv::addWeighted(f1, 1.0, f2, p, 0.0, out);  // saturating
  return out;
}

/// Horizontal integer shift with zero fill.
cv::Mat shift_horizontal(const cv::Mat& channel, int offset) {
  if (offset == 0) return channel;
  cv::Mat shifted = cv::Mat::zeros(channel.size(), channel.type());
  const int w = channel.cols;
  if (std::abs(offset) >= w) return shifted;
  if (offset > 0) {
    channel(cv::Rect(0, 0, w - offset, channel.rows))
        .copyTo(shifted(cv::Rect(offset, 0, w - offset, channel.rows)));
  } else {
    channel(cv::Rect(-offset, 0, w + offset, channel.rows))
        .copyTo(shifted(cv::Rect(0, 0, w + offset, channel.rows)));
  }
  return shifted;
}

/// Red moves left and blue moves right whatever the buffer order.
cv::Mat chromatic(const cv::Mat& f1, const cv::Mat& f2, double p, core::PixelFormat format) {
  const bool bgr_order =
      format == core::PixelFormat::BGR8 || format == core::PixelFormat::BGRA8;
  std::vector<cv::Mat> ch1;
  std::vector<cv::Mat> ch2;
  cv::split(f1, ch1);
  cv::split(f2, ch2);

  std::vector<cv::Mat> out(ch1.size());
  for (std::size_t i = 0; i < ch1.size(); ++i) {
    // Alpha (4th channel) is blended without a shift.
    // rgb_index: 0 red, 1 green, 2 blue.
    const int rgb_index = bgr_order && i < 3 ? 2 - static_cast<int>(i) : static_cast<int>(i);
    const int offset = i < 3 ? static_cast<int>((rgb_index - 1) * p * 10.0) : 0;
    cv::addWeighted(ch1[i], 1.0 - p, shift_horizontal(ch2[i], offset), p, 0.0, out[i]);
  }
  cv::Mat merged;
  cv::merge(out, merged);
  return merged;
}

}  // namespace

core::ParameterSchema CrossfadeTransition::get_params() const {
  return {
      core::enum_param("transition_mode", "crossfade",
                       {"crossfade", "fade_to_black", "fade_to_white",
                        "fade_to_custom", "additive_dissolve", "chromatic_dissolve"},
                       "Dissolve mode"),
      core::string_param("background_color", "#000000",
                         "Color used by fade_to_custom (#RRGGBB or a color name)"),
  };
}

std::expected<void, core::TransitionError> CrossfadeTransition::validate_params(
    const core::ParamSet& params) const {
  const std::string& color = params.get_string("background_color");
  if (!vision::parse_color(color)) {
    spdlog::error("invalid background_color '{}'", color);
    return std::unexpected(core::TransitionError::InvalidConfig);
  }
  return {};
}

std::expected<core::Frame, core::TransitionError> CrossfadeTransition::apply(
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

  const std::string& mode = in->params.get_string("transition_mode");
  const double p = in->progress;

  cv::Mat out;
  if (mode == "fade_to_black") {
    out = fade_through_color(in->frame1, in->frame2, p,
                             vision::detail::to_scalar({0, 0, 0}, in->format));
  } else if (mode == "fade_to_white") {
    out = fade_through_color(in->frame1, in->frame2, p,
                             vision::detail::to_scalar({255, 255, 255}, in->format));
  } else if (mode == "fade_to_custom") {
    // validate_params() already ran in prepare_inputs.
    const auto color = vision::parse_color(in->params.get_string("background_color"));
    out = fade_through_color(in->frame1, in->frame2, p,
                             vision::detail::to_scalar(color.value_or(vision::Rgb{}), in->format));
  } else if (mode == "additive_dissolve") {
    out = additive(in->frame1, in->frame2, p);
  } else if (mode == "chromatic_dissolve") {
    out = chromatic(in->frame1, in->frame2, p, in->format);
  } else {
    cv::addWeighted(in->frame1, 1.0 - p, in->frame2, p, 0.0, out);
  }
  return detail::to_frame(out, in->format);
}

}  // namespace transita::transitions
