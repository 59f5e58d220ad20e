#include <transita/transitions/page_turn_transition.hpp>
#include "transition_support.hpp"
#include "vision/frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>

namespace transita::transitions {

namespace {

constexpr double kCurlFactor = 0.08;
constexpr double kShadowLevel = 50.0;

int right_fold(double progress, int width) {
  return std::clamp(static_cast<int>(width * (1.0 - progress)), 0, width);
}

/// Right-to-left turn; the other directions are mapped onto this one.
cv::Mat turn_right(const cv::Mat& f1, const cv::Mat& f2, double p, double curl_strength,
                   double shadow_intensity, const cv::Scalar& shadow_color) {
  const int w = f1.cols;
  const int h = f1.rows;
  const int fold = right_fold(p, w);
  const double theta = p * std::numbers::pi;  // 0..180 degrees

  cv::Mat result = f2.clone();
  if (fold > 0) {
    f1(cv::Rect(0, 0, fold, h)).copyTo(result(cv::Rect(0, 0, fold, h)));
  }

  // Shadow on the uncovered area, strongest at the fold.
  const double lift = std::sin(theta);
  if (shadow_intensity > 0.0 && lift > 0.0 && fold < w) {
    const int shadow_width = std::clamp(static_cast<int>(30.0 * (1.0 - p) + 5.0), 5, 50);
    for (int d = 0; d < shadow_width && fold + d < w; ++d) {
      const double a = shadow_intensity * (1.0 - static_cast<double>(d) / shadow_width) * lift;
      cv::Mat column = result.col(fold + d);
      const cv::Mat shade(column.size(), column.type(), shadow_color);
      cv::addWeighted(column, 1.0 - a, shade, a, 0.0, column);
    }
  }

  // Lifted flap: frame1 beyond the fold, reflected over it.
  const double flap_width = (w - fold) * std::cos(theta / 2.0);
  const double curl = std::min(lift * curl_strength * kCurlFactor * h, h * 0.45);
  if (fold < w && flap_width >= 1.0) {
    const auto fx = static_cast<float>(fold);
    const auto far = static_cast<float>(fold - flap_width);
    const auto c = static_cast<float>(curl);
    const auto fh = static_cast<float>(h);
    const std::array<cv::Point2f, 4> src{cv::Point2f(fx, 0), cv::Point2f(static_cast<float>(w), 0),
                                         cv::Point2f(static_cast<float>(w), fh),
                                         cv::Point2f(fx, fh)};
    const std::array<cv::Point2f, 4> dst{cv::Point2f(fx, 0), cv::Point2f(far, c),
                                         cv::Point2f(far, fh - c), cv::Point2f(fx, fh)};
    const cv::Mat m = cv::getPerspectiveTransform(src.data(), dst.data());
    cv::Mat flap;
    cv::warpPerspective(f1, flap, m, f1.size(), cv::INTER_LINEAR, cv::BORDER_REPLICATE);

    cv::Mat mask = cv::Mat::zeros(f1.size(), CV_8UC1);
    const std::array<cv::Point, 4> poly{cv::Point(fold, 0), cv::Point(cvRound(far), cvRound(c)),
                                        cv::Point(cvRound(far), cvRound(fh - c)),
                                        cv::Point(fold, h)};
    cv::fillConvexPoly(mask, poly.data(), static_cast<int>(poly.size()), cv::Scalar(255));
    flap.copyTo(result, mask);
  }
  return result;
}

}  // namespace

int page_turn_fold_position(std::string_view direction, double progress, int width,
                            int height) noexcept {
  const double p = std::clamp(progress, 0.0, 1.0);
  if (direction == "left") return width - right_fold(p, width);
  if (direction == "up") return height - right_fold(p, height);
  if (direction == "down") return right_fold(p, height);
  return right_fold(p, width);
}

core::ParameterSchema PageTurnTransition::get_params() const {
  return {
      core::enum_param("direction", "right", {"right", "left", "up", "down"},
                       "Edge that lifts first"),
      core::float_param("curl_strength", 1.0, 0.5, 2.0, "Curl of the lifted page"),
      core::float_param("shadow_intensity", 0.5, 0.0, 1.0, "Shadow next to the fold"),
  };
}

std::expected<core::Frame, core::TransitionError> PageTurnTransition::apply(
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

  const std::string& direction = in->params.get_string("direction");
  const double curl = in->params.get_float("curl_strength");
  const double shadow = in->params.get_float("shadow_intensity");
  const cv::Scalar shadow_color = vision::detail::to_scalar(
      {static_cast<std::uint8_t>(kShadowLevel), static_cast<std::uint8_t>(kShadowLevel),
       static_cast<std::uint8_t>(kShadowLevel)},
      in->format);

  // Map the requested direction onto a right turn and back.
  const auto to_canonical = [&direction](const cv::Mat& m) {
    cv::Mat out;
    if (direction == "left") {
      cv::flip(m, out, 1);
    } else if (direction == "up") {
      cv::Mat t;
      cv::transpose(m, t);
      cv::flip(t, out, 1);
    } else if (direction == "down") {
      cv::transpose(m, out);
    } else {
      out = m;
    }
    return out;
  };
  const auto from_canonical = [&direction](const cv::Mat& m) {
    cv::Mat out;
    if (direction == "left") {
      cv::flip(m, out, 1);
    } else if (direction == "up") {
      cv::Mat t;
      cv::flip(m, t, 1);
      cv::transpose(t, out);
    } else if (direction == "down") {
      cv::transpose(m, out);
    } else {
      out = m;
    }
    return out;
  };

  const cv::Mat turned = turn_right(to_canonical(in->frame1), to_canonical(in->frame2),
                                    in->progress, curl, shadow, shadow_color);
  return detail::to_frame(from_canonical(turned), in->format);
}

}  // namespace transita::transitions
