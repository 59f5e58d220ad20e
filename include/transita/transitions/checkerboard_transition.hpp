#pragma once

#include <transita/core/transition.hpp>

namespace transita::transitions {

/// Checkerboard reveal on a grid_size x grid_size grid. Cells with an even
/// (row + col) switch to frame2 one at a time in row-major order while
/// int(progress * grid_size^2) exceeds their sequence number. Cells with an
/// odd (row + col) always show frame1, so the last frame is a half-revealed
/// board.
class CheckerboardTransition : public core::ITransition {
 public:
  [[nodiscard]] core::ParameterSchema get_params() const override;

  [[nodiscard]] std::expected<core::Frame, core::TransitionError> apply(
      const core::Frame& frame1,
      const core::Frame& frame2,
      std::uint32_t frame_index,
      std::uint32_t total_frames,
      std::uint32_t fps,
      const core::ParamMap& params) const override;
};

}  // namespace transita::transitions
