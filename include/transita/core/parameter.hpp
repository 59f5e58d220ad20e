#pragma once

#include <transita/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace transita::core {

/// Declared type of an effect parameter.
enum class ParamType : std::uint8_t {
  Int,
  Float,
  Enum,    // string restricted to ParamSpec::choices
  String,
  Bool,
};

/// Raw or resolved parameter value.
using ParamValue = std::variant<bool, std::int64_t, double, std::string>;

/// One entry of an effect's parameter schema.
struct ParamSpec {
  std::string name;
  ParamType type{ParamType::Float};
  ParamValue default_value;
  std::optional<double> min;
  std::optional<double> max;
  std::vector<std::string> choices;  // Enum only
  std::string description;
};

/// Ordered list of parameters an effect accepts.
using ParameterSchema = std::vector<ParamSpec>;

/// Caller-supplied values keyed by parameter name. Strings are accepted for
/// every type and parsed during resolution (command-line input).
using ParamMap = std::map<std::string, ParamValue, std::less<>>;

[[nodiscard]] ParamSpec int_param(std::string name, std::int64_t default_value,
                                  std::int64_t min, std::int64_t max,
                                  std::string description);
[[nodiscard]] ParamSpec float_param(std::string name, double default_value,
                                    double min, double max,
                                    std::string description);
[[nodiscard]] ParamSpec enum_param(std::string name, std::string default_value,
                                   std::vector<std::string> choices,
                                   std::string description);
[[nodiscard]] ParamSpec string_param(std::string name, std::string default_value,
                                     std::string description);
[[nodiscard]] ParamSpec bool_param(std::string name, bool default_value,
                                   std::string description);

/// Entry named \p name, or nullptr.
[[nodiscard]] const ParamSpec* find_param(const ParameterSchema& schema,
                                          std::string_view name) noexcept;

/// Parameters resolved against a schema: every schema entry present, typed as
/// declared. Getters fall back to a zero value for names outside the schema.
class ParamSet {
 public:
  ParamSet() = default;
  explicit ParamSet(ParamMap values) : values_(std::move(values)) {}

  [[nodiscard]] std::int64_t get_int(std::string_view name) const;
  [[nodiscard]] double get_float(std::string_view name) const;
  [[nodiscard]] bool get_bool(std::string_view name) const;
  /// Enum and String parameters.
  [[nodiscard]] const std::string& get_string(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const {
    return values_.find(name) != values_.end();
  }
  [[nodiscard]] const ParamMap& values() const noexcept { return values_; }

 private:
  [[nodiscard]] const ParamValue* find(std::string_view name) const;

  ParamMap values_;
};

/// Fills defaults and checks types, bounds and enum choices.
/// Unknown names, out-of-range numbers, unknown enum values and unparsable
/// strings fail with TransitionError::InvalidConfig.
[[nodiscard]] std::expected<ParamSet, TransitionError> resolve_params(
    const ParameterSchema& schema, const ParamMap& values);

[[nodiscard]] std::string_view to_string(ParamType type) noexcept;
[[nodiscard]] std::string to_string(const ParamValue& value);

}  // namespace transita::core
