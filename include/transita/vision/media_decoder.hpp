#pragma once

#include <transita/core/error.hpp>
#include <transita/core/frame_source.hpp>
#include <expected>
#include <filesystem>
#include <memory>

namespace transita::vision {

/// Turns a media file into a frame source. Decoding is blocking I/O.
class IMediaDecoder {
 public:
  virtual ~IMediaDecoder() = default;

  /// MediaLoadFailed when the file is missing, a directory, or undecodable.
  [[nodiscard]] virtual std::expected<std::unique_ptr<core::IFrameSource>,
                                      core::TransitionError>
  open(const std::filesystem::path& path) = 0;
};

/// OpenCV decoder: still images via cv::imread (length-1 source), everything
/// else via cv::VideoCapture (all frames decoded up front). Frames are BGR8.
class OpenCvMediaDecoder : public IMediaDecoder {
 public:
  [[nodiscard]] std::expected<std::unique_ptr<core::IFrameSource>,
                              core::TransitionError>
  open(const std::filesystem::path& path) override;

  /// True for extensions decoded as still images (.png .jpg .jpeg .bmp .webp .tif .tiff).
  [[nodiscard]] static bool is_image_path(const std::filesystem::path& path);
};

}  // namespace transita::vision
