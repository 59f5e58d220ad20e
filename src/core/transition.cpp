#include <transita/core/transition.hpp>

namespace transita::core {

std::expected<void, TransitionError> check_input_frames(const Frame& frame1,
                                                        const Frame& frame2) {
  if (!frame1.valid() || !frame2.valid()) {
    return std::unexpected(TransitionError::InvalidFrame);
  }
  if (!same_geometry(frame1, frame2)) {
    return std::unexpected(TransitionError::FrameDimensionMismatch);
  }
  return {};
}

std::expected<ParamSet, TransitionError> resolve_transition_params(
    const ITransition& transition, const ParamMap& params) {
  auto resolved = resolve_params(transition.get_params(), params);
  if (!resolved) {
    return std::unexpected(resolved.error());
  }
  auto valid = transition.validate_params(*resolved);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  return resolved;
}

}  // namespace transita::core
