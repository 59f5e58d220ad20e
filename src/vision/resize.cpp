#include <transita/vision/resize.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <vector>

namespace transita::vision {

std::expected<core::Frame, core::TransitionError> resize_frame(
    const core::Frame& input, std::uint32_t target_width, std::uint32_t target_height) {
  using namespace transita::core;

  if (target_width == 0 || target_height == 0) {
    return std::unexpected(TransitionError::InvalidConfig);
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(TransitionError::InvalidFrame);
  }

  if (input.width() == target_width && input.height() == target_height) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return Frame(input.width(), input.height(), input.format(), std::move(buf));
  }

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(static_cast<int>(target_width),
                      static_cast<int>(target_height)),
             0, 0, cv::INTER_LINEAR);

  return detail::mat_to_frame(mat_out, input.format());
}

}  // namespace transita::vision
