#pragma once

#include <transita/core/transition.hpp>

namespace transita::transitions {

/// Eye blink. Upper and lower eyelids with a curved, feathered edge close
/// over frame1 and open on frame2; the cut happens at frame total_frames / 2.
/// The first and last frames are fully open and return the inputs unchanged.
class BlinkTransition : public core::ITransition {
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

/// Eyelid closure in [0,1] at \p frame_index: rises as (i / mid)^speed up to
/// mid = total_frames / 2, then falls as ((N-1-i) / (N-1-mid))^speed.
[[nodiscard]] double blink_closure(std::uint32_t frame_index, std::uint32_t total_frames,
                                   double speed) noexcept;

}  // namespace transita::transitions
