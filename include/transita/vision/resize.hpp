#pragma once

#include <transita/core/error.hpp>
#include <transita/core/frame.hpp>
#include <cstdint>
#include <expected>

namespace transita::vision {

/// Resizes a frame to \p target_width x \p target_height (bilinear); copies
/// when the size already matches. InvalidFrame for empty/unsupported input.
[[nodiscard]] std::expected<core::Frame, core::TransitionError> resize_frame(
    const core::Frame& input, std::uint32_t target_width, std::uint32_t target_height);

}  // namespace transita::vision
