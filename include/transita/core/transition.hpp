#pragma once

#include <transita/core/error.hpp>
#include <transita/core/frame.hpp>
#include <transita/core/parameter.hpp>
#include <cstdint>
#include <expected>

namespace transita::core {

/// Abstract transition algorithm: two frames at one progress -> one frame.
///
/// Contract for implementations:
/// - apply() is a pure function of its arguments (const, no I/O, no member
///   state); effects that draw random numbers say so and take a `seed`.
/// - frame1 and frame2 arrive already resized to the output geometry and must
///   share width, height and format; the result has exactly that geometry.
/// - progress = frame_index / (total_frames - 1), or 0 when total_frames == 1.
/// - params are resolved against get_params() inside apply().
class ITransition {
 public:
  virtual ~ITransition() = default;

  /// Parameter schema; side-effect free.
  [[nodiscard]] virtual ParameterSchema get_params() const = 0;

  [[nodiscard]] virtual std::expected<Frame, TransitionError> apply(
      const Frame& frame1,
      const Frame& frame2,
      std::uint32_t frame_index,
      std::uint32_t total_frames,
      std::uint32_t fps,
      const ParamMap& params) const = 0;

  /// Optional: checks that a schema cannot express (e.g. color syntax).
  /// Called with already-resolved params. Default: accept.
  [[nodiscard]] virtual std::expected<void, TransitionError> validate_params(
      const ParamSet& /*params*/) const {
    return {};
  }
};

/// resolve_params() against transition.get_params() followed by
/// transition.validate_params(). InvalidConfig on failure.
[[nodiscard]] std::expected<ParamSet, TransitionError> resolve_transition_params(
    const ITransition& transition, const ParamMap& params);

/// Shared input check for apply(): both frames valid (InvalidFrame) and of the
/// same geometry (FrameDimensionMismatch).
[[nodiscard]] std::expected<void, TransitionError> check_input_frames(
    const Frame& frame1, const Frame& frame2);

}  // namespace transita::core
