#include "frame_cv_utils.hpp"
#include <transita/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace transita::vision::detail {

namespace tc = transita::core;

std::optional<cv::Mat> frame_to_mat(const tc::Frame& frame) {
  if (!frame.valid()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = static_cast<std::size_t>(w) * frame.channels();
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case tc::PixelFormat::RGB8:
    case tc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case tc::PixelFormat::RGBA8:
    case tc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case tc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

tc::Frame mat_to_frame(const cv::Mat& mat, tc::PixelFormat format) {
  if (mat.empty()) return tc::Frame();

  const cv::Mat continuous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(continuous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(continuous.rows);
  const std::size_t len = continuous.total() * continuous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), continuous.ptr(), len);
  return tc::Frame(w, h, format, std::move(buffer));
}

cv::Scalar to_scalar(const Rgb& color, tc::PixelFormat format) {
  const auto v = channel_values(color, format);
  return cv::Scalar(v[0], v[1], v[2], v[3]);
}

}  // namespace transita::vision::detail
