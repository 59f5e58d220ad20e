#pragma once

#include <string_view>

namespace transita::core {

/// Error codes for every recoverable failure; used with std::expected.
enum class TransitionError {
  None = 0,
  InvalidConfig,           // request or effect parameter out of range / unknown
  UnknownEffect,           // effect name not registered
  DuplicateRegistration,   // same effect name registered twice
  MediaLoadFailed,         // source missing or cannot be decoded
  FrameDimensionMismatch,  // frame geometry differs from what the contract requires
  InvalidFrame,            // empty frame or unsupported pixel format
  EncodeFailed,
  Cancelled,
};

/// Stable name for logs and CLI output.
[[nodiscard]] std::string_view to_string(TransitionError error) noexcept;

}  // namespace transita::core
