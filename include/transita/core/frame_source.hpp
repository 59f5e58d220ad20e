#pragma once

#include <transita/core/error.hpp>
#include <transita/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <vector>

namespace transita::core {

/// Finite, ordered, restartable sequence of frames (a decoded image or video).
/// Sampled by normalized progress; a still image is a length-1 source.
/// Implementations guarantee size() >= 1 and are read-only once built, so
/// concurrent sampling is safe.
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  [[nodiscard]] virtual std::size_t size() const noexcept = 0;

  /// Frame at \p index; index must be < size().
  [[nodiscard]] virtual const Frame& frame(std::size_t index) const = 0;

  /// Frame for progress in [0,1]: index min(floor(p * (n-1)), n-1).
  [[nodiscard]] const Frame& at(double progress) const {
    return frame(index_at(progress, size()));
  }

  [[nodiscard]] static std::size_t index_at(double progress,
                                            std::size_t count) noexcept;
};

/// Frame source over frames already decoded into memory.
class InMemoryFrameSource : public IFrameSource {
  struct PrivateTag {};

 public:
  /// Fails with MediaLoadFailed when \p frames is empty or holds an invalid frame.
  [[nodiscard]] static std::expected<std::unique_ptr<InMemoryFrameSource>, TransitionError>
  create(std::vector<Frame> frames);

  [[nodiscard]] std::size_t size() const noexcept override { return frames_.size(); }
  [[nodiscard]] const Frame& frame(std::size_t index) const override {
    return frames_[index];
  }

  /// Callable only through create(), which validates the frames.
  InMemoryFrameSource(PrivateTag /*tag*/, std::vector<Frame> frames)
      : frames_(std::move(frames)) {}

 private:
  std::vector<Frame> frames_;
};

}  // namespace transita::core
