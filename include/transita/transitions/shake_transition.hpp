#pragma once

#include <transita/core/transition.hpp>

namespace transita::transitions {

/// Camera-shake cut. Shows frame1 while progress < 0.5 and frame2 afterwards,
/// each through an affine jitter (rotation about the center, scale,
/// translation) with edge-replicate borders.
///
/// shake_type horizontal / vertical / rotation / zoom oscillate at 6 Hz in
/// time t = frame_index / fps. shake_type random draws from a normal
/// distribution; seed >= 0 makes the draw a function of (seed, frame_index).
class ShakeTransition : public core::ITransition {
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
