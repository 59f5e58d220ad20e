#pragma once

#include <transita/core/transition.hpp>
#include <string_view>

namespace transita::transitions {

/// Page turn. The part of frame1 beyond a moving fold line lifts off and is
/// drawn as a flap reflected over the fold, its far edge shortened by the
/// curl. The area it uncovers shows frame2 with a shadow next to the fold.
///
/// direction right turns the right edge toward the left; left, up and down
/// are the mirrored and transposed versions.
class PageTurnTransition : public core::ITransition {
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

/// Fold line position in pixels: a column for right/left, a row for up/down.
/// For right it is int(width * (1 - progress)).
[[nodiscard]] int page_turn_fold_position(std::string_view direction, double progress,
                                          int width, int height) noexcept;

}  // namespace transita::transitions
