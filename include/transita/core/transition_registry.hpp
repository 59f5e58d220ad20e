#pragma once

#include <transita/core/error.hpp>
#include <transita/core/transition.hpp>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace transita::core {

/// Creates a fresh transition instance.
using TransitionConstructor = std::function<std::unique_ptr<ITransition>()>;

/// Catalogue mapping effect name -> constructor + category.
///
/// Lifecycle: build one registry at startup (see
/// transita::transitions::register_builtin_transitions), then treat it as
/// read-only. Concurrent const access needs no locking; registering while
/// other threads read is not supported.
class TransitionRegistry {
 public:
  /// Fails with DuplicateRegistration if \p name exists, InvalidConfig for an
  /// empty name or null constructor.
  [[nodiscard]] std::expected<void, TransitionError> register_transition(
      std::string name, TransitionConstructor constructor, std::string category);

  /// Constructor for \p name, or UnknownEffect.
  [[nodiscard]] std::expected<TransitionConstructor, TransitionError> lookup(
      std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const;

  /// Category for \p name, or UnknownEffect.
  [[nodiscard]] std::expected<std::string, TransitionError> category_of(
      std::string_view name) const;

  /// Names sorted lexicographically.
  [[nodiscard]] std::vector<std::string> list_all() const;
  [[nodiscard]] std::vector<std::string> list_by_category(std::string_view category) const;
  [[nodiscard]] std::vector<std::string> list_categories() const;

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

 private:
  struct Entry {
    TransitionConstructor constructor;
    std::string category;
  };

  std::map<std::string, Entry, std::less<>> entries_;
};

}  // namespace transita::core
