#pragma once

#include <transita/core/error.hpp>
#include <transita/core/transition_registry.hpp>
#include <expected>
#include <string_view>

namespace transita::transitions {

inline constexpr std::string_view kCategoryBasic = "Basic";
inline constexpr std::string_view kCategoryEffects = "Effects";
inline constexpr std::string_view kCategory3d = "3D";

/// Registers every effect shipped with the library:
///   Basic:   crossfade, checkerboard, blink
///   Effects: shake, warp, explosion, page_turn
///   3D:      flip3d, blinds
/// Fails with DuplicateRegistration if any name is already taken.
[[nodiscard]] std::expected<void, core::TransitionError> register_builtin_transitions(
    core::TransitionRegistry& registry);

}  // namespace transita::transitions
