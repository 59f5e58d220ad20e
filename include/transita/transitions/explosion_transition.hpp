#pragma once

#include <transita/core/transition.hpp>

namespace transita::transitions {

/// Scatter/gather transition. For progress < 0.5 frame1 is scattered by a
/// gaussian per-pixel displacement of sigma 2p * strength * 20 px; afterwards
/// frame2 gathers with sigma (1 - 2(p - 0.5)) * strength * 20 px. Samples that
/// land outside the frame are black. seed >= 0 fixes the field per frame.
class ExplosionTransition : public core::ITransition {
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
