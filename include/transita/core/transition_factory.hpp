#pragma once

#include <transita/core/error.hpp>
#include <transita/core/parameter.hpp>
#include <transita/core/transition.hpp>
#include <transita/core/transition_registry.hpp>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace transita::core {

/// What a presentation layer needs to show one effect.
struct EffectDescriptor {
  std::string name;
  std::string category;
  ParameterSchema schema;
};

/// Thin layer over a registry: instance creation and schema introspection.
/// Holds a reference; the registry must outlive the factory.
class TransitionFactory {
 public:
  explicit TransitionFactory(const TransitionRegistry& registry)
      : registry_(registry) {}

  [[nodiscard]] std::expected<std::unique_ptr<ITransition>, TransitionError> create(
      std::string_view name) const;

  [[nodiscard]] std::expected<ParameterSchema, TransitionError> get_parameter_schema(
      std::string_view name) const;

  [[nodiscard]] std::expected<EffectDescriptor, TransitionError> describe(
      std::string_view name) const;

  /// Descriptors of every registered effect, sorted by name.
  [[nodiscard]] std::vector<EffectDescriptor> describe_all() const;

  [[nodiscard]] std::vector<std::string> list_transitions() const {
    return registry_.list_all();
  }
  [[nodiscard]] std::vector<std::string> list_by_category(std::string_view category) const {
    return registry_.list_by_category(category);
  }
  [[nodiscard]] std::vector<std::string> list_categories() const {
    return registry_.list_categories();
  }

 private:
  const TransitionRegistry& registry_;
};

}  // namespace transita::core
