#pragma once

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>
#include <vector>

namespace sqlrpc {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  if (!node.IsMap()) {
    return default_val;
  }
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return default_val;
  }
  return field.as<T>();
}

// Accepts either a scalar or a sequence of scalars.
[[nodiscard]] inline auto yaml_string_list(const YAML::Node& node,
                                           std::string_view key,
                                           std::vector<std::string> fallback)
    -> std::vector<std::string> {
  if (!node.IsMap()) {
    return fallback;
  }
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return fallback;
  }
  if (field.IsScalar()) {
    return {field.as<std::string>()};
  }
  return field.as<std::vector<std::string>>();
}

}  // namespace sqlrpc
