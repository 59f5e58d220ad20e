#pragma once

#include <transita/core/error.hpp>
#include <transita/core/frame.hpp>
#include <expected>

namespace transita::vision {

/// Converts between RGB8, BGR8, RGBA8 and BGRA8 (channel reorder, alpha added
/// as 255 or dropped). Copies when the format already matches. InvalidFrame
/// for an empty or Unknown-format input or an Unknown target.
[[nodiscard]] std::expected<core::Frame, core::TransitionError> convert_format(
    const core::Frame& input, core::PixelFormat output_format);

}  // namespace transita::vision
