#pragma once

#include <transita/core/transition.hpp>

namespace transita::transitions {

/// Dissolve family. transition_mode:
///   crossfade           (1-p) * f1 + p * f2
///   fade_to_black/white f1 -> color for p < 0.5, color -> f2 afterwards
///   fade_to_custom      same, through background_color
///   additive_dissolve   clip(f1 + p * f2)
///   chromatic_dissolve  color channels of f2 shifted horizontally by
///                       (c - 1) * p * 10 px, then crossfaded
class CrossfadeTransition : public core::ITransition {
 public:
  [[nodiscard]] core::ParameterSchema get_params() const override;

  [[nodiscard]] std::expected<core::Frame, core::TransitionError> apply(
      const core::Frame& frame1,
      const core::Frame& frame2,
      std::uint32_t frame_index,
      std::uint32_t total_frames,
      std::uint32_t fps,
      const core::ParamMap& params) const override;

  /// background_color must parse as a color.
  [[nodiscard]] std::expected<void, core::TransitionError> validate_params(
      const core::ParamSet& params) const override;
};

}  // namespace transita::transitions
