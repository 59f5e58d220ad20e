#include <transita/transitions/builtin_transitions.hpp>
#include <transita/transitions/blink_transition.hpp>
#include <transita/transitions/blinds_transition.hpp>
#include <transita/transitions/checkerboard_transition.hpp>
#include <transita/transitions/crossfade_transition.hpp>
#include <transita/transitions/explosion_transition.hpp>
#include <transita/transitions/flip3d_transition.hpp>
#include <transita/transitions/page_turn_transition.hpp>
#include <transita/transitions/shake_transition.hpp>
#include <transita/transitions/warp_transition.hpp>
#include <spdlog/spdlog.h>
#include <iterator>
#include <memory>
#include <string>

namespace transita::transitions {

namespace {

template <typename T>
core::TransitionConstructor make_constructor() {
  return [] { return std::make_unique<T>(); };
}

}  // namespace

std::expected<void, core::TransitionError> register_builtin_transitions(
    core::TransitionRegistry& registry) {
  struct Builtin {
    const char* name;
    core::TransitionConstructor constructor;
    std::string_view category;
  };
  const Builtin builtins[] = {
      {"crossfade", make_constructor<CrossfadeTransition>(), kCategoryBasic},
      {"checkerboard", make_constructor<CheckerboardTransition>(), kCategoryBasic},
      {"blink", make_constructor<BlinkTransition>(), kCategoryBasic},
      {"shake", make_constructor<ShakeTransition>(), kCategoryEffects},
      {"warp", make_constructor<WarpTransition>(), kCategoryEffects},
      {"explosion", make_constructor<ExplosionTransition>(), kCategoryEffects},
      {"page_turn", make_constructor<PageTurnTransition>(), kCategoryEffects},
      {"flip3d", make_constructor<Flip3dTransition>(), kCategory3d},
      {"blinds", make_constructor<BlindsTransition>(), kCategory3d},
  };
  for (const auto& b : builtins) {
    auto r = registry.register_transition(b.name, b.constructor, std::string(b.category));
    if (!r) {
      return std::unexpected(r.error());
    }
  }
  spdlog::debug("registered {} builtin transitions", std::size(builtins));
  return {};
}

}  // namespace transita::transitions
