#include <transita/core/transition_request.hpp>
#include <spdlog/spdlog.h>

namespace transita::core {

std::expected<void, TransitionError> validate_request(
    const TransitionRequest& request) {
  if (request.total_frames < kMinTotalFrames || request.total_frames > kMaxTotalFrames) {
    spdlog::error("total_frames must be in [{}, {}], got {}", kMinTotalFrames,
                  kMaxTotalFrames, request.total_frames);
    return std::unexpected(TransitionError::InvalidConfig);
  }
  if (request.fps < kMinFps || request.fps > kMaxFps) {
    spdlog::error("fps must be in [{}, {}], got {}", kMinFps, kMaxFps, request.fps);
    return std::unexpected(TransitionError::InvalidConfig);
  }
  if (request.width < kMinWidth || request.width > kMaxWidth) {
    spdlog::error("width must be in [{}, {}], got {}", kMinWidth, kMaxWidth,
                  request.width);
    return std::unexpected(TransitionError::InvalidConfig);
  }
  if (request.height < kMinHeight || request.height > kMaxHeight) {
    spdlog::error("height must be in [{}, {}], got {}", kMinHeight, kMaxHeight,
                  request.height);
    return std::unexpected(TransitionError::InvalidConfig);
  }
  return {};
}

double progress_at(std::uint32_t frame_index, std::uint32_t total_frames) noexcept {
  if (total_frames <= 1) return 0.0;
  const double p = static_cast<double>(frame_index) /
                   static_cast<double>(total_frames - 1);
  return p > 1.0 ? 1.0 : p;
}

}  // namespace transita::core
