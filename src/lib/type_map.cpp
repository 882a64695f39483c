#include <oag/resolved_type.hpp>
#include <oag/type_map.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace oag {

  namespace {

    const char* const container_keys[] = {"collection", "map", "nullable",
                                          "indirect"};

  } // namespace

  type_map
  type_map::defaults() {
    type_map map;

    // String types
    map.set(to_string(primitive_kind::string), {"std::string", "<string>"});
    map.set(to_string(primitive_kind::uri), {"std::string", "<string>"});

    // Built-in types (no header needed)
    map.set(to_string(primitive_kind::boolean), {"bool", ""});
    map.set(to_string(primitive_kind::float32), {"float", ""});
    map.set(to_string(primitive_kind::float64), {"double", ""});
    map.set(to_string(primitive_kind::decimal), {"long double", ""});

    // Fixed-width integers
    map.set(to_string(primitive_kind::int32), {"std::int32_t", "<cstdint>"});
    map.set(to_string(primitive_kind::int64), {"std::int64_t", "<cstdint>"});

    // Date/time types
    map.set(to_string(primitive_kind::date_time),
            {"std::chrono::sys_time<std::chrono::milliseconds>", "<chrono>"});
    map.set(to_string(primitive_kind::date),
            {"std::chrono::year_month_day", "<chrono>"});
    map.set(to_string(primitive_kind::time),
            {"std::chrono::hh_mm_ss<std::chrono::milliseconds>", "<chrono>"});
    map.set(to_string(primitive_kind::duration),
            {"std::chrono::milliseconds", "<chrono>"});

    map.set(to_string(primitive_kind::uuid),
            {"std::array<std::uint8_t, 16>", "<array> <cstdint>"});

    // Binary types
    map.set(to_string(primitive_kind::byte_array),
            {"std::vector<std::byte>", "<vector> <cstddef>"});
    map.set(to_string(primitive_kind::binary),
            {"std::vector<std::byte>", "<vector> <cstddef>"});

    map.set(to_string(primitive_kind::opaque), {"std::any", "<any>"});

    // Containers
    map.set("collection", {"std::vector<{}>", "<vector>"});
    map.set("map", {"std::map<std::string, {}>", "<map> <string>"});
    map.set("nullable", {"std::optional<{}>", "<optional>"});
    map.set("indirect", {"std::unique_ptr<{}>", "<memory>"});

    return map;
  }

  type_map
  type_map::load(const nlohmann::json& overrides) {
    if (!overrides.is_object())
      throw std::invalid_argument("type_map::load: expected an object");

    auto known = defaults();
    type_map result;
    for (const auto& [key, value] : overrides.items()) {
      if (!known.contains(key))
        throw std::invalid_argument("type_map::load: unknown type key '" + key +
                                    "'");

      type_mapping mapping;
      if (value.is_string()) {
        mapping.cpp_type = value.get<std::string>();
      } else if (value.is_object()) {
        for (const auto& [field, v] : value.items()) {
          if (!v.is_string())
            throw std::invalid_argument("type_map::load: '" + key + "." +
                                        field + "' must be a string");
          if (field == "type")
            mapping.cpp_type = v.get<std::string>();
          else if (field == "header")
            mapping.cpp_header = v.get<std::string>();
          else
            throw std::invalid_argument("type_map::load: unknown field '" +
                                        field + "' in '" + key + "'");
        }
      } else {
        throw std::invalid_argument("type_map::load: '" + key +
                                    "' must be a string or object");
      }

      if (mapping.cpp_type.empty())
        throw std::invalid_argument("type_map::load: '" + key +
                                    "' has no C++ type");
      for (const char* container : container_keys) {
        if (key == container &&
            mapping.cpp_type.find("{}") == std::string::npos)
          throw std::invalid_argument("type_map::load: '" + key +
                                      "' must contain '{}'");
      }
      result.set(key, std::move(mapping));
    }
    return result;
  }

  void
  type_map::merge(const type_map& overrides) {
    for (const auto& [key, mapping] : overrides.entries_) {
      if (entries_.find(key) == entries_.end()) {
        throw std::invalid_argument(
            "type_map::merge: cannot override unknown type key '" + key + "'");
      }
      entries_[key] = mapping;
    }
  }

  const type_mapping*
  type_map::find(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  void
  type_map::set(std::string key, type_mapping mapping) {
    entries_.insert_or_assign(std::move(key), std::move(mapping));
  }

  std::size_t
  type_map::size() const {
    return entries_.size();
  }

  bool
  type_map::contains(const std::string& key) const {
    return entries_.count(key) != 0;
  }

  std::string
  instantiate(const std::string& pattern, const std::string& argument) {
    auto pos = pattern.find("{}");
    if (pos == std::string::npos) return pattern;
    return pattern.substr(0, pos) + argument + pattern.substr(pos + 2);
  }

} // namespace oag
