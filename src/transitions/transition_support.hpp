#pragma once

#include <transita/core/error.hpp>
#include <transita/core/frame.hpp>
#include <transita/core/parameter.hpp>
#include <transita/core/transition.hpp>
#include <opencv2/core/mat.hpp>
#include <cstdint>
#include <expected>

namespace transita::transitions::detail {

/// Validated inputs of one apply() call, as cv::Mat views over the frames.
struct PreparedInputs {
  cv::Mat frame1;
  cv::Mat frame2;
  core::ParamSet params;
  core::PixelFormat format{core::PixelFormat::Unknown};
  double progress{0.0};
};

/// Input-frame check, parameter resolution against transition.get_params(),
/// and progress computation shared by every algorithm.
std::expected<PreparedInputs, core::TransitionError> prepare_inputs(
    const core::ITransition& transition,
    const core::Frame& frame1,
    const core::Frame& frame2,
    std::uint32_t frame_index,
    std::uint32_t total_frames,
    const core::ParamMap& params);

/// Copies \p mat into a new Frame of \p format.
core::Frame to_frame(const cv::Mat& mat, core::PixelFormat format);

}  // namespace transita::transitions::detail
