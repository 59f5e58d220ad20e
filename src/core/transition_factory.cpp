#include <transita/core/transition_factory.hpp>
#include <spdlog/spdlog.h>

namespace transita::core {

std::expected<std::unique_ptr<ITransition>, TransitionError> TransitionFactory::create(
    std::string_view name) const {
  auto constructor = registry_.lookup(name);
  if (!constructor) {
    spdlog::error("unknown transition effect '{}'", name);
    return std::unexpected(constructor.error());
  }
  auto instance = (*constructor)();
  if (!instance) {
    return std::unexpected(TransitionError::InvalidConfig);
  }
  return instance;
}

std::expected<ParameterSchema, TransitionError> TransitionFactory::get_parameter_schema(
    std::string_view name) const {
  auto instance = create(name);
  if (!instance) {
    return std::unexpected(instance.error());
  }
  return (*instance)->get_params();
}

std::expected<EffectDescriptor, TransitionError> TransitionFactory::describe(
    std::string_view name) const {
  auto category = registry_.category_of(name);
  if (!category) {
    return std::unexpected(category.error());
  }
  auto schema = get_parameter_schema(name);
  if (!schema) {
    return std::unexpected(schema.error());
  }
  return EffectDescriptor{std::string(name), std::move(*category), std::move(*schema)};
}

std::vector<EffectDescriptor> TransitionFactory::describe_all() const {
  std::vector<EffectDescriptor> out;
  for (const auto& name : registry_.list_all()) {
    auto descriptor = describe(name);
    if (descriptor) {
      out.push_back(std::move(*descriptor));
    } else {
      spdlog::warn("could not describe transition '{}': {}", name,
                   to_string(descriptor.error()));
    }
  }
  return out;
}

}  // namespace transita::core
