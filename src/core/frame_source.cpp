#include <transita/core/frame_source.hpp>
#include <algorithm>

namespace transita::core {

std::size_t IFrameSource::index_at(double progress, std::size_t count) noexcept {
  if (count <= 1) return 0;
  const double p = std::clamp(progress, 0.0, 1.0);
  const auto index = static_cast<std::size_t>(p * static_cast<double>(count - 1));
  return std::min(index, count - 1);
}

std::expected<std::unique_ptr<InMemoryFrameSource>, TransitionError>
InMemoryFrameSource::create(std::vector<Frame> frames) {
  if (frames.empty()) {
    return std::unexpected(TransitionError::MediaLoadFailed);
  }
  for (const auto& f : frames) {
    if (!f.valid()) {
      return std::unexpected(TransitionError::MediaLoadFailed);
    }
  }
  return std::make_unique<InMemoryFrameSource>(PrivateTag{}, std::move(frames));
}

}  // namespace transita::core
