#pragma once

#include <transita/core/error.hpp>
#include <transita/core/frame.hpp>
#include <expected>

namespace transita::vision {

/// Weights applied to the outgoing (first) and incoming (second) frame.
/// Every weight function here returns weights that sum to exactly 1, so a
/// composite of two opaque frames is never darkened toward black.
struct BlendWeights {
  double first{1.0};
  double second{0.0};
};

/// Hermite smoothstep 3t^2 - 2t^3 on t clamped to [0,1].
[[nodiscard]] double smoothstep(double t) noexcept;

/// first = 1 - p, second = p (p clamped to [0,1]).
[[nodiscard]] BlendWeights linear_weights(double progress) noexcept;

/// second = smoothstep(p), first = 1 - second.
[[nodiscard]] BlendWeights smoothstep_weights(double progress) noexcept;

/// Per-channel weighted sum a * w.first + b * w.second, rounded and saturated.
/// Frames must share geometry (FrameDimensionMismatch otherwise).
[[nodiscard]] std::expected<core::Frame, core::TransitionError> blend_frames(
    const core::Frame& a, const core::Frame& b, BlendWeights weights);

}  // namespace transita::vision
