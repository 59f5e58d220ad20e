#include <transita/transitions/warp_transition.hpp>
#include "transition_support.hpp"
#include <transita/vision/blend.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace transita::transitions {

namespace {

constexpr double kPi = std::numbers::pi;

/// Field parameters for one of the two frames.
struct FieldState {
  double intensity{0.0};
  double time{0.0};
  double ramp{0.0};       // 0 = no displacement, 1 = full
  double direction{1.0};  // swirl rotation sign
};

/// Source coordinate for output pixel (x, y).
cv::Point2f displace(const std::string& type, const FieldState& s, float x, float y,
                     int width, int height) {
  const double w = width;
  const double h = height;
  if (type == "swirl") {
    const double cx = w / 2.0;
    const double cy = h / 2.0;
    const double max_radius = std::sqrt(cx * cx + cy * cy);
    const double dx = x - cx;
    const double dy = y - cy;
    const double dist = std::sqrt(dx * dx + dy * dy);
    if (dist <= 0.0) return {x, y};
    double influence = std::clamp(1.0 - dist / max_radius, 0.0, 1.0);
    influence = influence * influence * (3.0 - 2.0 * influence);
    const double twist = (dist / max_radius) * s.intensity * 2.0 * kPi * influence *
                         s.ramp * s.direction;
    const double c = std::cos(twist);
    const double sn = std::sin(twist);
    return {static_cast<float>(cx + dx * c - dy * sn),
            static_cast<float>(cy + dx * sn + dy * c)};
  }
  if (type == "squeeze_h") {
    const double amount = s.intensity * s.ramp * 58.0;
    return {static_cast<float>(x + std::sin((x - w / 2.0) / w * kPi * 3.0) * amount), y};
  }
  if (type == "squeeze_v") {
    const double amount = s.intensity * s.ramp * 58.0;
    return {x, static_cast<float>(y + std::sin((y - h / 2.0) / h * kPi * 3.0) * amount)};
  }
  if (type == "liquid") {
    const double a = s.intensity * s.ramp * 30.0;
    const double ox = std::sin(x * 0.02 + s.time) * a +
                      std::sin(x * 0.03 + s.time * 1.3) * a * 0.4;
    const double oy = std::cos(y * 0.02 + s.time * 0.7) * a * 0.8 +
                      std::cos(y * 0.03 + s.time * 0.5) * a * 0.3;
    return {static_cast<float>(x + ox), static_cast<float>(y + oy)};
  }
  if (type == "wave") {
    const double a = s.intensity * s.ramp * 40.0;
    const double ox = std::sin(y * 0.02 + s.time * 0.8) * a * 0.4;
    const double oy = std::sin(x * 0.03 + s.time) * a +
                      std::sin(x * 0.05 + s.time * 1.5) * a * 0.6;
    return {static_cast<float>(x + ox), static_cast<float>(y + oy)};
  }
  return {x, y};
}

cv::Mat warp_frame(const cv::Mat& src, const std::string& type, const FieldState& s) {
  if (s.ramp <= 0.0) return src;
  const int w = src.cols;
  const int h = src.rows;
  cv::Mat map_x(h, w, CV_32FC1);
  cv::Mat map_y(h, w, CV_32FC1);
  const float max_x = static_cast<float>(w - 1);
  const float max_y = static_cast<float>(h - 1);
  for (int y = 0; y < h; ++y) {
    auto* mx = map_x.ptr<float>(y);
    auto* my = map_y.ptr<float>(y);
    for (int x = 0; x < w; ++x) {
      const cv::Point2f p = displace(type, s, static_cast<float>(x), static_cast<float>(y), w, h);
      mx[x] = std::clamp(p.x, 0.0f, max_x);
      my[x] = std::clamp(p.y, 0.0f, max_y);
    }
  }
  cv::Mat out;
  cv::remap(src, out, map_x, map_y, cv::INTER_CUBIC, cv::BORDER_REPLICATE);
  return out;
}

/// Center crop at 1/zoom, resized back to full size.
cv::Mat scale_recovery(const cv::Mat& src, double progress, double max_scale) {
  const double zoom = max_scale - progress * (max_scale - 1.0);
  if (std::abs(zoom - 1.0) < 0.01) return src;
  const int crop_w = std::clamp(static_cast<int>(src.cols / zoom), 1, src.cols);
  const int crop_h = std::clamp(static_cast<int>(src.rows / zoom), 1, src.rows);
  const cv::Rect roi((src.cols - crop_w) / 2, (src.rows - crop_h) / 2, crop_w, crop_h);
  cv::Mat out;
  cv::resize(src(roi), out, src.size(), 0, 0, cv::INTER_LINEAR);
  return out;
}

}  // namespace

core::ParameterSchema WarpTransition::get_params() const {
  return {
      core::enum_param("warp_type", "swirl",
                       {"swirl", "squeeze_h", "squeeze_v", "liquid", "wave"}, "Warp type"),
      core::float_param("warp_intensity", 0.5, 0.1, 2.0, "Displacement strength"),
      core::float_param("warp_speed", 1.0, 0.1, 3.0, "Field animation speed"),
      core::float_param("max_scale", 1.3, 1.0, 3.0, "Initial zoom of the incoming frame"),
      core::bool_param("scale_recovery", true, "Zoom the incoming frame back to 1x"),
  };
}

std::expected<core::Frame, core::TransitionError> WarpTransition::apply(
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
  const std::string& type = in->params.get_string("warp_type");
  const double intensity = in->params.get_float("warp_intensity");
  const double time = p * in->params.get_float("warp_speed") * 2.0 * kPi;

  const cv::Mat out1 = warp_frame(in->frame1, type, {intensity, time, p, 1.0});
  cv::Mat out2 = warp_frame(in->frame2, type, {intensity, time, 1.0 - p, -1.0});
  if (in->params.get_bool("scale_recovery")) {
    out2 = scale_recovery(out2, p, in->params.get_float("max_scale"));
  }

  const vision::BlendWeights weights = vision::smoothstep_weights(p);
  cv::Mat out;
  cv::addWeighted(out1, weights.first, out2, weights.second, 0.0, out);
  return detail::to_frame(out, in->format);
}

}  // namespace transita::transitions
