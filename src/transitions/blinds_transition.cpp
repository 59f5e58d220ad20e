#include <transita/transitions/blinds_transition.hpp>
#include "transition_support.hpp"
#include <opencv2/core.hpp>
#include <algorithm>

namespace transita::transitions {

namespace {

bool strip_open(double progress, int slats, int index) {
  return progress * slats > index;
}

/// Strip index for a band along one axis; the last strip takes the remainder.
int axis_strip(int pos, int length, int slats) {
  const int strip = std::max(length / slats, 1);
  return std::min(pos / strip, slats - 1);
}

}  // namespace

core::ParameterSchema BlindsTransition::get_params() const {
  return {
      core::enum_param("direction", "horizontal", {"horizontal", "vertical", "diagonal"},
                       "Strip orientation"),
      core::int_param("slat_count", 10, 5, 20, "Number of strips"),
  };
}

std::expected<core::Frame, core::TransitionError> BlindsTransition::apply(
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
  const int slats = static_cast<int>(in->params.get_int("slat_count"));
  const std::string& direction = in->params.get_string("direction");
  const int w = in->frame1.cols;
  const int h = in->frame1.rows;

  cv::Mat mask = cv::Mat::zeros(h, w, CV_8UC1);
  if (direction == "diagonal") {
    const double span = static_cast<double>(w + h);
    for (int y = 0; y < h; ++y) {
      auto* row = mask.ptr<std::uint8_t>(y);
      for (int x = 0; x < w; ++x) {
        const int index = static_cast<int>((x + y) / span * slats);
        row[x] = strip_open(p, slats, index) ? 255 : 0;
      }
    }
  } else if (direction == "vertical") {
    for (int x = 0; x < w; ++x) {
      if (strip_open(p, slats, axis_strip(x, w, slats))) mask.col(x).setTo(255);
    }
  } else {
    for (int y = 0; y < h; ++y) {
      if (strip_open(p, slats, axis_strip(y, h, slats))) mask.row(y).setTo(255);
    }
  }

  cv::Mat out = in->frame1.clone();
  in->frame2.copyTo(out, mask);
  return detail::to_frame(out, in->format);
}

}  // namespace transita::transitions
