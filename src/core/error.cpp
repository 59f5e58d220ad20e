#include <transita/core/error.hpp>

namespace transita::core {

std::string_view to_string(TransitionError error) noexcept {
  switch (error) {
    case TransitionError::None:
      return "None";
    case TransitionError::InvalidConfig:
      return "InvalidConfig";
    case TransitionError::UnknownEffect:
      return "UnknownEffect";
    case TransitionError::DuplicateRegistration:
      return "DuplicateRegistration";
    case TransitionError::MediaLoadFailed:
      return "MediaLoadFailed";
    case TransitionError::FrameDimensionMismatch:
      return "FrameDimensionMismatch";
    case TransitionError::InvalidFrame:
      return "InvalidFrame";
    case TransitionError::EncodeFailed:
      return "EncodeFailed";
    case TransitionError::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace transita::core
