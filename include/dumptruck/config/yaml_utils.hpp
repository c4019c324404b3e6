#pragma once

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <string>
#include <string_view>

namespace dumptruck {

template <typename T>
concept YamlScalar = requires(const YAML::Node& n) { { n.as<T>() }; };

// Scalar value under `key`, or `fallback` when the key is absent, null or not
// a scalar. A scalar that does not convert throws YAML::BadConversion.
template <YamlScalar T>
[[nodiscard]] auto yaml_scalar_or(const YAML::Node& node, std::string_view key,
                                  T fallback) -> T {
  const auto field = node[std::string(key)];
  if (!field || !field.IsScalar()) {
    return fallback;
  }
  return field.as<T>();
}

[[nodiscard]] inline auto yaml_seconds_or(const YAML::Node& node,
                                          std::string_view key,
                                          std::chrono::seconds fallback)
    -> std::chrono::seconds {
  return std::chrono::seconds(
      yaml_scalar_or<std::chrono::seconds::rep>(node, key, fallback.count()));
}

// Writes `key: value` only when value differs from `baseline`, so emitted
// configs list just what the user changed.
template <typename T, typename U>
void yaml_emit_if_changed(YAML::Emitter& out, std::string_view key,
                          const T& value, const U& baseline) {
  if (value != baseline) {
    out << YAML::Key << std::string(key) << YAML::Value << value;
  }
}

}  // namespace dumptruck
