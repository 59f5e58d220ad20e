#pragma once

#include <transita/core/frame.hpp>
#include <transita/vision/color.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace transita::vision::detail {

/// Wrap a Frame as a cv::Mat header over its buffer (no copy). The Mat must be
/// treated as read-only. Returns nullopt if the frame is invalid.
std::optional<cv::Mat> frame_to_mat(const transita::core::Frame& frame);

/// Copy a CV_8UC3 / CV_8UC4 cv::Mat into a new Frame.
transita::core::Frame mat_to_frame(const cv::Mat& mat,
                                   transita::core::PixelFormat format);

/// Color as a cv::Scalar in the channel order of \p format (alpha = 255).
cv::Scalar to_scalar(const Rgb& color, transita::core::PixelFormat format);

}  // namespace transita::vision::detail
