#include <transita/vision/encoder.hpp>
#include "frame_cv_utils.hpp"
#include <spdlog/spdlog.h>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <array>

namespace transita::vision {

namespace {

struct Codec {
  std::array<char, 4> fourcc;
  const char* description;
};

constexpr std::array<Codec, 5> kPreferredCodecs = {{
    {{'m', 'p', '4', 'v'}, "MPEG-4 Part 2"},
    {{'D', 'I', 'V', 'X'}, "DivX"},
    {{'X', 'V', 'I', 'D'}, "XviD"},
    {{'M', 'J', 'P', 'G'}, "Motion JPEG"},
    {{'I', '4', '2', '0'}, "raw YUV"},
}};

bool to_bgr(const core::Frame& frame, cv::Mat& out) {
  auto mat = detail::frame_to_mat(frame);
  if (!mat) return false;
  switch (frame.format()) {
    case core::PixelFormat::BGR8:
      out = *mat;
      return true;
    case core::PixelFormat::RGB8:
      cv::cvtColor(*mat, out, cv::COLOR_RGB2BGR);
      return true;
    case core::PixelFormat::RGBA8:
      cv::cvtColor(*mat, out, cv::COLOR_RGBA2BGR);
      return true;
    case core::PixelFormat::BGRA8:
      cv::cvtColor(*mat, out, cv::COLOR_BGRA2BGR);
      return true;
    case core::PixelFormat::Unknown:
    default:
      return false;
  }
}

}  // namespace

std::expected<std::filesystem::path, core::TransitionError> OpenCvVideoEncoder::write(
    const core::OutputSequence& sequence,
    std::uint32_t fps,
    std::uint32_t width,
    std::uint32_t height,
    const std::filesystem::path& destination) {
  if (sequence.frames.empty() || fps == 0) {
    return std::unexpected(core::TransitionError::EncodeFailed);
  }

  const cv::Size size(static_cast<int>(width), static_cast<int>(height));
  cv::VideoWriter writer;
  for (const auto& codec : kPreferredCodecs) {
    const int fourcc = cv::VideoWriter::fourcc(codec.fourcc[0], codec.fourcc[1],
                                               codec.fourcc[2], codec.fourcc[3]);
    if (writer.open(destination.string(), fourcc, static_cast<double>(fps), size)) {
      spdlog::debug("encoding {} with codec {}", destination.string(), codec.description);
      break;
    }
  }
  if (!writer.isOpened()) {
    spdlog::error("no video codec could open {}", destination.string());
    return std::unexpected(core::TransitionError::EncodeFailed);
  }

  cv::Mat bgr;
  for (const auto& frame : sequence.frames) {
    if (frame.width() != width || frame.height() != height || !to_bgr(frame, bgr)) {
      spdlog::error("frame does not match encoder geometry {}x{}", width, height);
      writer.release();
      return std::unexpected(core::TransitionError::EncodeFailed);
    }
    writer.write(bgr);
  }
  writer.release();
  return destination;
}

}  // namespace transita::vision
