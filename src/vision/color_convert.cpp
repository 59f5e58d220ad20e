#include <transita/vision/color_convert.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <vector>

namespace transita::vision {

namespace {

int conversion_code(core::PixelFormat from, core::PixelFormat to) {
  using core::PixelFormat;
  switch (from) {
    case PixelFormat::RGB8:
      if (to == PixelFormat::BGR8) return cv::COLOR_RGB2BGR;
      if (to == PixelFormat::RGBA8) return cv::COLOR_RGB2RGBA;
      if (to == PixelFormat::BGRA8) return cv::COLOR_RGB2BGRA;
      break;
    case PixelFormat::BGR8:
      if (to == PixelFormat::RGB8) return cv::COLOR_BGR2RGB;
      if (to == PixelFormat::RGBA8) return cv::COLOR_BGR2RGBA;
      if (to == PixelFormat::BGRA8) return cv::COLOR_BGR2BGRA;
      break;
    case PixelFormat::RGBA8:
      if (to == PixelFormat::RGB8) return cv::COLOR_RGBA2RGB;
      if (to == PixelFormat::BGR8) return cv::COLOR_RGBA2BGR;
      if (to == PixelFormat::BGRA8) return cv::COLOR_RGBA2BGRA;
      break;
    case PixelFormat::BGRA8:
      if (to == PixelFormat::RGB8) return cv::COLOR_BGRA2RGB;
      if (to == PixelFormat::BGR8) return cv::COLOR_BGRA2BGR;
      if (to == PixelFormat::RGBA8) return cv::COLOR_BGRA2RGBA;
      break;
    case PixelFormat::Unknown:
      break;
  }
  return -1;
}

}  // namespace

std::expected<core::Frame, core::TransitionError> convert_format(
    const core::Frame& input, core::PixelFormat output_format) {
  using namespace transita::core;

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in || output_format == PixelFormat::Unknown) {
    return std::unexpected(TransitionError::InvalidFrame);
  }

  if (input.format() == output_format) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return Frame(input.width(), input.height(), output_format, std::move(buf));
  }

  const int code = conversion_code(input.format(), output_format);
  if (code < 0) {
    return std::unexpected(TransitionError::InvalidFrame);
  }
  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return detail::mat_to_frame(mat_out, output_format);
}

}  // namespace transita::vision
