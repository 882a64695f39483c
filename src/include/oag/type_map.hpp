#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>

namespace oag {

  // cpp_type of a container entry ("collection", "map", "nullable",
  // "indirect") is a template with "{}" standing for the argument type.
  // cpp_header may list several headers separated by spaces.
  struct type_mapping {
    std::string cpp_type;
    std::string cpp_header;
  };

  class type_map {
    std::unordered_map<std::string, type_mapping> entries_;

  public:
    type_map() = default;

    static type_map
    defaults();

    // {"date_time": "my::timestamp"} or
    // {"date_time": {"type": "my::timestamp", "header": "<my/time.hpp>"}}
    static type_map
    load(const nlohmann::json& overrides);

    void
    merge(const type_map& overrides);

    const type_mapping*
    find(const std::string& key) const;

    void
    set(std::string key, type_mapping mapping);

    std::size_t
    size() const;

    bool
    contains(const std::string& key) const;
  };

  // Substitute argument for "{}" in a container template.
  std::string
  instantiate(const std::string& pattern, const std::string& argument);

} // namespace oag
