#pragma once

#include <transita/core/error.hpp>
#include <transita/core/parameter.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace transita::core {

/// Accepted request bounds (inclusive).
inline constexpr std::uint32_t kMinTotalFrames = 1;
inline constexpr std::uint32_t kMaxTotalFrames = 300;
inline constexpr std::uint32_t kMinFps = 15;
inline constexpr std::uint32_t kMaxFps = 60;
inline constexpr std::uint32_t kMinWidth = 320;
inline constexpr std::uint32_t kMaxWidth = 3840;
inline constexpr std::uint32_t kMinHeight = 240;
inline constexpr std::uint32_t kMaxHeight = 2160;

/// One transition job: which effect, output geometry and effect parameters.
struct TransitionRequest {
  std::string effect{"crossfade"};
  std::uint32_t total_frames{30};
  std::uint32_t fps{30};
  std::uint32_t width{640};
  std::uint32_t height{640};
  ParamMap params;
};

/// Checks total_frames, fps, width and height against the bounds above.
/// Does not look at effect-specific params (see resolve_params).
[[nodiscard]] std::expected<void, TransitionError> validate_request(
    const TransitionRequest& request);

/// Normalized progress of frame \p frame_index: index / (total - 1), or 0 for
/// single-frame transitions.
[[nodiscard]] double progress_at(std::uint32_t frame_index,
                                 std::uint32_t total_frames) noexcept;

}  // namespace transita::core
