#include <transita/vision/color.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace transita::vision {

namespace {

std::optional<std::uint8_t> hex_byte(std::string_view s) {
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, 16);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return static_cast<std::uint8_t>(value);
}

}  // namespace

std::optional<Rgb> parse_color(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "black") return Rgb{0, 0, 0};
  if (lower == "white") return Rgb{255, 255, 255};
  if (lower == "gray" || lower == "grey") return Rgb{128, 128, 128};
  if (lower == "red") return Rgb{255, 0, 0};
  if (lower == "green") return Rgb{0, 255, 0};
  if (lower == "blue") return Rgb{0, 0, 255};

  std::string_view hex(lower);
  if (!hex.empty() && hex.front() == '#') hex.remove_prefix(1);
  if (hex.size() != 6) return std::nullopt;

  const auto r = hex_byte(hex.substr(0, 2));
  const auto g = hex_byte(hex.substr(2, 2));
  const auto b = hex_byte(hex.substr(4, 2));
  if (!r || !g || !b) return std::nullopt;
  return Rgb{*r, *g, *b};
}

std::array<std::uint8_t, 4> channel_values(const Rgb& color,
                                           core::PixelFormat format) noexcept {
  switch (format) {
    case core::PixelFormat::BGR8:
    case core::PixelFormat::BGRA8:
      return {color.b, color.g, color.r, 255};
    case core::PixelFormat::RGB8:
    case core::PixelFormat::RGBA8:
    case core::PixelFormat::Unknown:
    default:
      return {color.r, color.g, color.b, 255};
  }
}

}  // namespace transita::vision
