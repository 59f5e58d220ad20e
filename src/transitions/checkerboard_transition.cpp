#include <transita/transitions/checkerboard_transition.hpp>
#include "transition_support.hpp"
#include <opencv2/core.hpp>

namespace transita::transitions {

core::ParameterSchema CheckerboardTransition::get_params() const {
  return {
      core::int_param("grid_size", 8, 4, 16, "Cells per row and column"),
  };
}

std::expected<core::Frame, core::TransitionError> CheckerboardTransition::apply(
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

  const int grid = static_cast<int>(in->params.get_int("grid_size"));
  const int w = in->frame1.cols;
  const int h = in->frame1.rows;
  const int cell_w = w / grid;
  const int cell_h = h / grid;
  const int cells_to_show = static_cast<int>(in->progress * grid * grid);

  cv::Mat out = in->frame1.clone();
  int sequence = 0;
  for (int row = 0; row < grid; ++row) {
    for (int col = 0; col < grid; ++col) {
      if ((row + col) % 2 != 0) continue;
      if (sequence++ >= cells_to_show) continue;
      // Last row/column extend to the frame edge.
      const int x0 = col * cell_w;
      const int y0 = row * cell_h;
      const int x1 = col == grid - 1 ? w : x0 + cell_w;
      const int y1 = row == grid - 1 ? h : y0 + cell_h;
      const cv::Rect cell(x0, y0, x1 - x0, y1 - y0);
      if (cell.area() > 0) in->frame2(cell).copyTo(out(cell));
    }
  }
  return detail::to_frame(out, in->format);
}

}  // namespace transita::transitions
