#include <transita/transitions/shake_transition.hpp>
#include "transition_support.hpp"
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <numbers>
#include <random>

namespace transita::transitions {

namespace {

constexpr double kShakeHz = 6.0;
constexpr double kTranslatePx = 10.0;
constexpr double kRotateDeg = 5.0;
constexpr double kZoom = 0.1;

struct Jitter {
  double dx{0.0};
  double dy{0.0};
  double angle{0.0};
  double scale{1.0};
};

Jitter random_jitter(double intensity, std::int64_t seed, std::uint32_t frame_index) {
  std::mt19937 rng;
  if (seed >= 0) {
    std::seed_seq seq{static_cast<std::uint32_t>(seed & 0xffffffff),
                      static_cast<std::uint32_t>(seed >> 32), frame_index};
    rng.seed(seq);
  } else {
    rng.seed(std::random_device{}());
  }
  std::normal_distribution<double> normal(0.0, 1.0);
  Jitter j;
  j.dx = normal(rng) * intensity * kTranslatePx;
  j.dy = normal(rng) * intensity * kTranslatePx;
  j.angle = normal(rng) * intensity * kRotateDeg;
  j.scale = 1.0 + normal(rng) * intensity * kZoom;
  return j;
}

Jitter oscillating_jitter(const std::string& type, double intensity,
                          std::uint32_t frame_index, std::uint32_t fps) {
  const double t = fps > 0 ? static_cast<double>(frame_index) / fps : 0.0;
  const double wave = std::sin(2.0 * std::numbers::pi * kShakeHz * t);
  Jitter j;
  if (type == "horizontal") {
    j.dx = wave * intensity * kTranslatePx;
  } else if (type == "vertical") {
    j.dy = wave * intensity * kTranslatePx;
  } else if (type == "rotation") {
    j.angle = wave * intensity * kRotateDeg;
  } else if (type == "zoom") {
    j.scale = 1.0 + wave * intensity * kZoom;
  }
  return j;
}

}  // namespace

core::ParameterSchema ShakeTransition::get_params() const {
  return {
      core::enum_param("shake_type", "random",
                       {"random", "horizontal", "vertical", "rotation", "zoom"},
                       "Shake type"),
      core::float_param("shake_intensity", 1.0, 0.1, 3.0, "Shake amplitude multiplier"),
      core::int_param("seed", -1, -1, 2147483647,
                      "Seed for random mode (-1 = nondeterministic)"),
  };
}

std::expected<core::Frame, core::TransitionError> ShakeTransition::apply(
    const core::Frame& frame1,
    const core::Frame& frame2,
    std::uint32_t frame_index,
    std::uint32_t total_frames,
    std::uint32_t fps,
    const core::ParamMap& params) const {
  auto in = detail::prepare_inputs(*this, frame1, frame2, frame_index, total_frames, params);
  if (!in) {
    return std::unexpected(in.error());
  }

  const std::string& type = in->params.get_string("shake_type");
  const double intensity = in->params.get_float("shake_intensity");
  const Jitter j = type == "random"
                       ? random_jitter(intensity, in->params.get_int("seed"), frame_index)
                       : oscillating_jitter(type, intensity, frame_index, fps);

  const cv::Mat& source = in->progress < 0.5 ? in->frame1 : in->frame2;
  const cv::Point2f center(static_cast<float>(source.cols / 2),
                           static_cast<float>(source.rows / 2));
  cv::Mat m = cv::getRotationMatrix2D(center, j.angle, j.scale);
  m.at<double>(0, 2) += j.dx;
  m.at<double>(1, 2) += j.dy;

  cv::Mat out;
  cv::warpAffine(source, out, m, source.size(), cv::INTER_LINEAR, cv::BORDER_REPLICATE);
  return detail::to_frame(out, in->format);
}

}  // namespace transita::transitions
