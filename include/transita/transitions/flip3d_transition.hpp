#pragma once

#include <transita/core/transition.hpp>

namespace transita::transitions {

/// Card flip. The flip angle is 180 * progress; up to 90 degrees frame1 is
/// shown, past it frame2. The visible extent narrows to 0.2 at 90 degrees
/// and recovers, along the width (horizontal), the height (vertical) or both
/// (diagonal). The receding edge gets a keystone scaled by
/// perspective_strength. Progress >= 0.95 shows frame2 flat.
class Flip3dTransition : public core::ITransition {
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
