#pragma once

#include <transita/core/transition.hpp>

namespace transita::transitions {

/// Displacement-field warp between two frames.
///
/// Both frames are remapped through a field selected by warp_type (swirl,
/// squeeze_h, squeeze_v, liquid, wave). The outgoing frame's displacement
/// grows with progress, the incoming frame's fades with it (swirl turns the
/// opposite way). With scale_recovery the incoming frame also zooms from
/// max_scale back to 1. The two are composited with smoothstep weights that
/// sum to 1.
class WarpTransition : public core::ITransition {
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
