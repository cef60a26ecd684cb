#pragma once

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace benchdock {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

// Missing or null keys fall back to `default_val`; a present value of the
// wrong type throws YAML::BadConversion, which loaders turn into ParseError.
template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return default_val;
  }
  return field.as<T>();
}

}  // namespace benchdock
