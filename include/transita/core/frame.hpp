#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace transita::core {

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. Use data() for std::span views (non-owning).
/// Thread-safety: distinct Frame instances are independent. A Frame stored in an
/// OutputSequence is never written again, so concurrent readers are safe.

/// Pixel layout, 8 bits per channel, interleaved.
enum class PixelFormat : std::uint8_t {
  Unknown,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Channel count for a format (0 for Unknown).
[[nodiscard]] std::uint32_t channel_count(PixelFormat format) noexcept;

/// Single image or video frame: dimensions, format, and owned buffer.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept {
    return channel_count(format_);
  }

  /// Mutable view of the buffer (owned).
  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when the frame is non-empty, has a known format and a buffer large
  /// enough for its dimensions.
  [[nodiscard]] bool valid() const noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

  /// Frame filled with one color given as channel values in buffer order.
  /// Missing channels (e.g. alpha when only 3 values are given) are set to 255.
  [[nodiscard]] static Frame filled(std::uint32_t width,
                                    std::uint32_t height,
                                    PixelFormat format,
                                    std::span<const std::uint8_t> channel_values);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

/// Same width, height and format.
[[nodiscard]] bool same_geometry(const Frame& a, const Frame& b) noexcept;

}  // namespace transita::core
