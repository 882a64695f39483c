#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace oag {

  enum class schema_kind : std::uint8_t {
    none = 0,
    string = 1 << 0,
    integer = 1 << 1,
    number = 1 << 2,
    boolean = 1 << 3,
    array = 1 << 4,
    object = 1 << 5,
    null = 1 << 6,
  };

  constexpr schema_kind
  operator|(schema_kind a, schema_kind b) {
    return static_cast<schema_kind>(static_cast<std::uint8_t>(a) |
                                    static_cast<std::uint8_t>(b));
  }

  constexpr schema_kind
  operator&(schema_kind a, schema_kind b) {
    return static_cast<schema_kind>(static_cast<std::uint8_t>(a) &
                                    static_cast<std::uint8_t>(b));
  }

  constexpr schema_kind
  operator~(schema_kind a) {
    return static_cast<schema_kind>(~static_cast<std::uint8_t>(a));
  }

  constexpr schema_kind&
  operator|=(schema_kind& a, schema_kind b) {
    a = a | b;
    return a;
  }

  constexpr bool
  has_kind(schema_kind set, schema_kind flag) {
    return (set & flag) == flag && flag != schema_kind::none;
  }

  struct schema_node;

  using schema_ptr = std::shared_ptr<const schema_node>;

  struct schema_property {
    std::string name;
    std::shared_ptr<const schema_node> schema;
  };

  struct schema_discriminator {
    std::string property_name;
    // literal value -> referenced schema name, in document order
    std::vector<std::pair<std::string, std::string>> mapping;

    bool
    operator==(const schema_discriminator&) const = default;
  };

  // One node of the input schema graph. Immutable once the loader has built
  // it; children are shared so that nodes stay cheap to copy.
  struct schema_node {
    std::string ref;
    schema_kind kind = schema_kind::none;
    std::string format;
    std::vector<nlohmann::json> enum_values;
    std::vector<std::string> required;
    std::vector<schema_property> properties;
    schema_ptr items;
    schema_ptr additional_properties;
    std::vector<schema_ptr> all_of;
    std::vector<schema_ptr> one_of;
    std::vector<schema_ptr> any_of;
    std::optional<schema_discriminator> discriminator;
    std::optional<nlohmann::json> default_value;
    std::string description;

    bool
    is_reference() const {
      return !ref.empty();
    }

    // Kind with the null flag removed
    schema_kind
    base_kind() const {
      return kind & ~schema_kind::null;
    }

    bool
    is_nullable() const {
      return has_kind(kind, schema_kind::null);
    }

    bool
    has_non_null_default() const {
      return default_value.has_value() && !default_value->is_null();
    }

    bool
    is_required(const std::string& property) const;

    const schema_property*
    find_property(const std::string& property) const;
  };

  inline schema_ptr
  make_schema(schema_node node) {
    return std::make_shared<const schema_node>(std::move(node));
  }

  inline schema_ptr
  make_ref(std::string target) {
    schema_node node;
    node.ref = std::move(target);
    return make_schema(std::move(node));
  }

} // namespace oag
