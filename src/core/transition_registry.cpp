#include <transita/core/transition_registry.hpp>
#include <spdlog/spdlog.h>
#include <set>

namespace transita::core {

std::expected<void, TransitionError> TransitionRegistry::register_transition(
    std::string name, TransitionConstructor constructor, std::string category) {
  if (name.empty() || !constructor) {
    spdlog::error("refusing to register transition with empty name or constructor");
    return std::unexpected(TransitionError::InvalidConfig);
  }
  if (entries_.contains(name)) {
    spdlog::error("transition '{}' is already registered", name);
    return std::unexpected(TransitionError::DuplicateRegistration);
  }
  spdlog::debug("registered transition '{}' in category '{}'", name, category);
  entries_.emplace(std::move(name), Entry{std::move(constructor), std::move(category)});
  return {};
}

std::expected<TransitionConstructor, TransitionError> TransitionRegistry::lookup(
    std::string_view name) const {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    return std::unexpected(TransitionError::UnknownEffect);
  }
  return it->second.constructor;
}

bool TransitionRegistry::contains(std::string_view name) const {
  return entries_.find(name) != entries_.end();
}

std::expected<std::string, TransitionError> TransitionRegistry::category_of(
    std::string_view name) const {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    return std::unexpected(TransitionError::UnknownEffect);
  }
  return it->second.category;
}

std::vector<std::string> TransitionRegistry::list_all() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& [name, entry] : entries_) {
    names.push_back(name);
  }
  return names;
}

std::vector<std::string> TransitionRegistry::list_by_category(
    std::string_view category) const {
  std::vector<std::string> names;
  for (const auto& [name, entry] : entries_) {
    if (entry.category == category) names.push_back(name);
  }
  return names;
}

std::vector<std::string> TransitionRegistry::list_categories() const {
  std::set<std::string> categories;
  for (const auto& [name, entry] : entries_) {
    categories.insert(entry.category);
  }
  return {categories.begin(), categories.end()};
}

}  // namespace transita::core
