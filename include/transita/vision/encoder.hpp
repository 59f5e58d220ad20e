#pragma once

#include <transita/core/error.hpp>
#include <transita/core/output_sequence.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace transita::vision {

/// Writes a finished sequence to a media file.
class IEncoder {
 public:
  virtual ~IEncoder() = default;

  /// Encodes \p sequence at \p fps into \p destination; returns the written path.
  /// EncodeFailed on any error; the encoder may leave a partial file behind,
  /// which the caller owns and removes.
  [[nodiscard]] virtual std::expected<std::filesystem::path, core::TransitionError> write(
      const core::OutputSequence& sequence,
      std::uint32_t fps,
      std::uint32_t width,
      std::uint32_t height,
      const std::filesystem::path& destination) = 0;
};

/// cv::VideoWriter encoder. Tries FourCC codecs in order mp4v, DIVX, XVID,
/// MJPG, I420 and uses the first one the backend opens. Frames are converted
/// to BGR before writing.
class OpenCvVideoEncoder : public IEncoder {
 public:
  [[nodiscard]] std::expected<std::filesystem::path, core::TransitionError> write(
      const core::OutputSequence& sequence,
      std::uint32_t fps,
      std::uint32_t width,
      std::uint32_t height,
      const std::filesystem::path& destination) override;
};

}  // namespace transita::vision
