#include <transita/vision/media_decoder.hpp>
#include "frame_cv_utils.hpp"
#include <spdlog/spdlog.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace transita::vision {

namespace {

std::expected<std::unique_ptr<core::IFrameSource>, core::TransitionError> to_source(
    std::vector<core::Frame> frames) {
  auto source = core::InMemoryFrameSource::create(std::move(frames));
  if (!source) {
    return std::unexpected(source.error());
  }
  return std::unique_ptr<core::IFrameSource>(std::move(*source));
}

std::expected<std::unique_ptr<core::IFrameSource>, core::TransitionError> decode_image(
    const std::filesystem::path& path) {
  cv::Mat mat = cv::imread(path.string(), cv::IMREAD_COLOR);
  if (mat.empty()) {
    spdlog::error("failed to decode image {}", path.string());
    return std::unexpected(core::TransitionError::MediaLoadFailed);
  }
  std::vector<core::Frame> frames;
  frames.push_back(detail::mat_to_frame(mat, core::PixelFormat::BGR8));
  return to_source(std::move(frames));
}

std::expected<std::unique_ptr<core::IFrameSource>, core::TransitionError> decode_video(
    const std::filesystem::path& path) {
  cv::VideoCapture capture(path.string());
  if (!capture.isOpened()) {
    spdlog::error("failed to open video {}", path.string());
    return std::unexpected(core::TransitionError::MediaLoadFailed);
  }

  std::vector<core::Frame> frames;
  cv::Mat mat;
  while (capture.read(mat)) {
    if (mat.empty()) break;
    if (mat.type() != CV_8UC3) continue;
    frames.push_back(detail::mat_to_frame(mat, core::PixelFormat::BGR8));
  }
  capture.release();

  if (frames.empty()) {
    spdlog::error("no frames could be read from {}", path.string());
    return std::unexpected(core::TransitionError::MediaLoadFailed);
  }
  spdlog::debug("decoded {} frames from {}", frames.size(), path.string());
  return to_source(std::move(frames));
}

}  // namespace

bool OpenCvMediaDecoder::is_image_path(const std::filesystem::path& path) {
  static constexpr std::array<std::string_view, 7> kImageExtensions = {
      ".png", ".jpg", ".jpeg", ".bmp", ".webp", ".tif", ".tiff"};
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) !=
         kImageExtensions.end();
}

std::expected<std::unique_ptr<core::IFrameSource>, core::TransitionError>
OpenCvMediaDecoder::open(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    spdlog::error("media file does not exist: {}", path.string());
    return std::unexpected(core::TransitionError::MediaLoadFailed);
  }
  if (std::filesystem::is_directory(path, ec)) {
    spdlog::error("media path is a directory, not a file: {}", path.string());
    return std::unexpected(core::TransitionError::MediaLoadFailed);
  }
  return is_image_path(path) ? decode_image(path) : decode_video(path);
}

}  // namespace transita::vision
