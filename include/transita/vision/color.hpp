#pragma once

#include <transita/core/frame.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace transita::vision {

struct Rgb {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  friend bool operator==(const Rgb&, const Rgb&) = default;
};

/// Parses "#RRGGBB", "RRGGBB" or a name (black, white, gray/grey, red, green,
/// blue; case-insensitive). Returns nullopt for anything else.
[[nodiscard]] std::optional<Rgb> parse_color(std::string_view text);

/// Channel values in the buffer order of \p format; the 4th value is alpha (255).
[[nodiscard]] std::array<std::uint8_t, 4> channel_values(const Rgb& color,
                                                         core::PixelFormat format) noexcept;

}  // namespace transita::vision
