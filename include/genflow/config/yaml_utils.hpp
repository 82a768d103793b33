#pragma once

#include "genflow/util/id.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <string>
#include <string_view>

namespace YAML {

template <typename Tag>
struct convert<genflow::TypedId<Tag>> {
  static auto encode(const genflow::TypedId<Tag>& id) -> Node {
    return Node(std::string(id.value()));
  }
  static auto decode(const Node& node, genflow::TypedId<Tag>& id) -> bool {
    if (!node.IsScalar())
      return false;
    id = genflow::TypedId<Tag>{node.as<std::string>()};
    return true;
  }
};

}  // namespace YAML

namespace genflow {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) {
  { n.as<T>() };
};

template <YamlParsable T>
[[nodiscard]] auto read_field(const YAML::Node& node, std::string_view key,
                              T default_val) -> T {
  if (auto field = node[std::string(key)]) {
    if (field.IsNull())
      return default_val;
    return field.template as<T>();
  }
  return default_val;
}

[[nodiscard]] inline auto read_millis(const YAML::Node& node,
                                      std::string_view key,
                                      std::chrono::milliseconds default_val)
    -> std::chrono::milliseconds {
  return std::chrono::milliseconds{
      read_field<long long>(node, key, default_val.count())};
}

template <typename T>
auto write_field(YAML::Emitter& out, std::string_view key, const T& value)
    -> void {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

}  // namespace genflow
