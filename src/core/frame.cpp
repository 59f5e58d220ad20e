#include <transita/core/frame.hpp>
#include <cstddef>

namespace transita::core {

std::uint32_t channel_count(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool Frame::valid() const noexcept {
  if (empty() || width_ == 0 || height_ == 0) return false;
  if (channel_count(format_) == 0) return false;
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * channel_count(format);
}

Frame Frame::filled(std::uint32_t width,
                    std::uint32_t height,
                    PixelFormat format,
                    std::span<const std::uint8_t> channel_values) {
  const std::uint32_t channels = channel_count(format);
  if (channels == 0) return Frame();
  std::vector<std::byte> buffer(min_bytes(width, height, format));
  for (std::size_t i = 0; i < buffer.size(); ++i) {
    const std::size_t c = i % channels;
    const std::uint8_t v = c < channel_values.size() ? channel_values[c] : 255;
    buffer[i] = static_cast<std::byte>(v);
  }
  return Frame(width, height, format, std::move(buffer));
}

bool same_geometry(const Frame& a, const Frame& b) noexcept {
  return a.width() == b.width() && a.height() == b.height() &&
         a.format() == b.format();
}

}  // namespace transita::core
