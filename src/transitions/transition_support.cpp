#include "transition_support.hpp"
#include "vision/frame_cv_utils.hpp"
#include <transita/core/transition_request.hpp>

namespace transita::transitions::detail {

std::expected<PreparedInputs, core::TransitionError> prepare_inputs(
    const core::ITransition& transition,
    const core::Frame& frame1,
    const core::Frame& frame2,
    std::uint32_t frame_index,
    std::uint32_t total_frames,
    const core::ParamMap& params) {
  auto valid = core::check_input_frames(frame1, frame2);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto resolved = core::resolve_transition_params(transition, params);
  if (!resolved) {
    return std::unexpected(resolved.error());
  }
  auto mat1 = vision::detail::frame_to_mat(frame1);
  auto mat2 = vision::detail::frame_to_mat(frame2);
  if (!mat1 || !mat2) {
    return std::unexpected(core::TransitionError::InvalidFrame);
  }

  PreparedInputs in;
  in.frame1 = *mat1;
  in.frame2 = *mat2;
  in.params = std::move(*resolved);
  in.format = frame1.format();
  in.progress = core::progress_at(frame_index, total_frames);
  return in;
}

core::Frame to_frame(const cv::Mat& mat, core::PixelFormat format) {
  return vision::detail::mat_to_frame(mat, format);
}

}  // namespace transita::transitions::detail
