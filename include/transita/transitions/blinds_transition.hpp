#pragma once

#include <transita/core/transition.hpp>

namespace transita::transitions {

/// Venetian blinds: slat_count strips (rows, columns or diagonal bands) flip
/// from frame1 to frame2 one after another; strip i shows frame2 once
/// progress * slat_count > i. The last strip runs to the frame edge.
class BlindsTransition : public core::ITransition {
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
