#include <transita/core/parameter.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <sstream>

namespace transita::core {

namespace {

std::string lowercase(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::optional<std::int64_t> parse_int(std::string_view s) {
  std::int64_t v = 0;
  const auto* end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, v);
  if (ec != std::errc() || ptr != end || s.empty()) return std::nullopt;
  return v;
}

std::optional<double> parse_double(std::string_view s) {
  double v = 0.0;
  const auto* end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, v);
  if (ec != std::errc() || ptr != end || s.empty()) return std::nullopt;
  return v;
}

std::optional<bool> parse_bool(std::string_view s) {
  const std::string v = lowercase(s);
  if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  return std::nullopt;
}

constexpr double kInt64Limit = 9223372036854775808.0;  // 2^63

bool in_bounds(const ParamSpec& spec, double v) {
  if (spec.min && v < *spec.min) return false;
  if (spec.max && v > *spec.max) return false;
  return true;
}

std::expected<ParamValue, TransitionError> invalid(const ParamSpec& spec,
                                                   const ParamValue& value,
                                                   std::string_view reason) {
  spdlog::warn("parameter '{}' rejected ({}): {}", spec.name, reason,
               to_string(value));
  return std::unexpected(TransitionError::InvalidConfig);
}

std::expected<ParamValue, TransitionError> coerce(const ParamSpec& spec,
                                                  const ParamValue& value) {
  switch (spec.type) {
    case ParamType::Int: {
      std::optional<std::int64_t> v;
      if (const auto* i = std::get_if<std::int64_t>(&value)) {
        v = *i;
      } else if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d) && std::floor(*d) == *d) {
          // Range check before the cast: doubles beyond int64 do not convert.
          if (!in_bounds(spec, *d) || *d < -kInt64Limit || *d >= kInt64Limit) {
            return invalid(spec, value, "out of range");
          }
          v = static_cast<std::int64_t>(*d);
        }
      } else if (const auto* s = std::get_if<std::string>(&value)) {
        v = parse_int(*s);
      }
      if (!v) return invalid(spec, value, "expected integer");
      if (!in_bounds(spec, static_cast<double>(*v))) return invalid(spec, value, "out of range");
      return ParamValue{*v};
    }
    case ParamType::Float: {
      std::optional<double> v;
      if (const auto* d = std::get_if<double>(&value)) {
        v = *d;
      } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
        v = static_cast<double>(*i);
      } else if (const auto* s = std::get_if<std::string>(&value)) {
        v = parse_double(*s);
      }
      if (!v || !std::isfinite(*v)) return invalid(spec, value, "expected number");
      if (!in_bounds(spec, *v)) return invalid(spec, value, "out of range");
      return ParamValue{*v};
    }
    case ParamType::Bool: {
      std::optional<bool> v;
      if (const auto* b = std::get_if<bool>(&value)) {
        v = *b;
      } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
        if (*i == 0 || *i == 1) v = (*i == 1);
      } else if (const auto* s = std::get_if<std::string>(&value)) {
        v = parse_bool(*s);
      }
      if (!v) return invalid(spec, value, "expected boolean");
      return ParamValue{*v};
    }
    case ParamType::Enum: {
      const auto* s = std::get_if<std::string>(&value);
      if (!s) return invalid(spec, value, "expected one of the choices");
      if (std::find(spec.choices.begin(), spec.choices.end(), *s) == spec.choices.end()) {
        return invalid(spec, value, "unknown choice");
      }
      return ParamValue{*s};
    }
    case ParamType::String: {
      const auto* s = std::get_if<std::string>(&value);
      if (!s) return invalid(spec, value, "expected string");
      return ParamValue{*s};
    }
  }
  return invalid(spec, value, "unsupported type");
}

}  // namespace

ParamSpec int_param(std::string name, std::int64_t default_value,
                    std::int64_t min, std::int64_t max,
                    std::string description) {
  ParamSpec p;
  p.name = std::move(name);
  p.type = ParamType::Int;
  p.default_value = default_value;
  p.min = static_cast<double>(min);
  p.max = static_cast<double>(max);
  p.description = std::move(description);
  return p;
}

ParamSpec float_param(std::string name, double default_value, double min,
                      double max, std::string description) {
  ParamSpec p;
  p.name = std::move(name);
  p.type = ParamType::Float;
  p.default_value = default_value;
  p.min = min;
  p.max = max;
  p.description = std::move(description);
  return p;
}

ParamSpec enum_param(std::string name, std::string default_value,
                     std::vector<std::string> choices,
                     std::string description) {
  ParamSpec p;
  p.name = std::move(name);
  p.type = ParamType::Enum;
  p.default_value = std::move(default_value);
  p.choices = std::move(choices);
  p.description = std::move(description);
  return p;
}

ParamSpec string_param(std::string name, std::string default_value,
                       std::string description) {
  ParamSpec p;
  p.name = std::move(name);
  p.type = ParamType::String;
  p.default_value = std::move(default_value);
  p.description = std::move(description);
  return p;
}

ParamSpec bool_param(std::string name, bool default_value,
                     std::string description) {
  ParamSpec p;
  p.name = std::move(name);
  p.type = ParamType::Bool;
  p.default_value = default_value;
  p.description = std::move(description);
  return p;
}

const ParamSpec* find_param(const ParameterSchema& schema,
                            std::string_view name) noexcept {
  for (const auto& spec : schema) {
    if (spec.name == name) return &spec;
  }
  return nullptr;
}

const ParamValue* ParamSet::find(std::string_view name) const {
  auto it = values_.find(name);
  return it == values_.end() ? nullptr : &it->second;
}

std::int64_t ParamSet::get_int(std::string_view name) const {
  const ParamValue* v = find(name);
  if (!v) return 0;
  if (const auto* i = std::get_if<std::int64_t>(v)) return *i;
  if (const auto* d = std::get_if<double>(v)) return static_cast<std::int64_t>(*d);
  return 0;
}

double ParamSet::get_float(std::string_view name) const {
  const ParamValue* v = find(name);
  if (!v) return 0.0;
  if (const auto* d = std::get_if<double>(v)) return *d;
  if (const auto* i = std::get_if<std::int64_t>(v)) return static_cast<double>(*i);
  return 0.0;
}

bool ParamSet::get_bool(std::string_view name) const {
  const ParamValue* v = find(name);
  if (!v) return false;
  if (const auto* b = std::get_if<bool>(v)) return *b;
  return false;
}

const std::string& ParamSet::get_string(std::string_view name) const {
  static const std::string empty;
  const ParamValue* v = find(name);
  if (!v) return empty;
  if (const auto* s = std::get_if<std::string>(v)) return *s;
  return empty;
}

std::expected<ParamSet, TransitionError> resolve_params(
    const ParameterSchema& schema, const ParamMap& values) {
  for (const auto& [name, value] : values) {
    if (!find_param(schema, name)) {
      spdlog::warn("unknown parameter '{}'", name);
      return std::unexpected(TransitionError::InvalidConfig);
    }
  }

  ParamMap resolved;
  for (const auto& spec : schema) {
    auto it = values.find(spec.name);
    if (it == values.end()) {
      resolved.emplace(spec.name, spec.default_value);
      continue;
    }
    auto v = coerce(spec, it->second);
    if (!v) return std::unexpected(v.error());
    resolved.emplace(spec.name, std::move(*v));
  }
  return ParamSet(std::move(resolved));
}

std::string_view to_string(ParamType type) noexcept {
  switch (type) {
    case ParamType::Int:
      return "int";
    case ParamType::Float:
      return "float";
    case ParamType::Enum:
      return "enum";
    case ParamType::String:
      return "string";
    case ParamType::Bool:
      return "bool";
  }
  return "unknown";
}

std::string to_string(const ParamValue& value) {
  if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
  if (const auto* i = std::get_if<std::int64_t>(&value)) return std::to_string(*i);
  if (const auto* d = std::get_if<double>(&value)) {
    std::ostringstream os;
    os << *d;
    return os.str();
  }
  return std::get<std::string>(value);
}

}  // namespace transita::core
