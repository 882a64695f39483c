#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace oag {

  enum class primitive_kind {
    string,
    date_time,
    date,
    time,
    duration,
    uuid,
    uri,
    byte_array,
    binary,
    int32,
    int64,
    float32,
    float64,
    decimal,
    boolean,
    opaque,
  };

  std::string
  to_string(primitive_kind kind);

  struct resolved_type;

  using resolved_type_ptr = std::shared_ptr<const resolved_type>;

  struct primitive_type {
    primitive_kind kind = primitive_kind::opaque;
  };

  struct collection_type {
    resolved_type_ptr element;
    bool is_mutable = false;
  };

  struct map_type {
    resolved_type_ptr value;
    bool is_mutable = false;
  };

  struct named_reference {
    std::string name;
  };

  struct nullable_type {
    resolved_type_ptr inner;
  };

  // A target type reference. Values are built fresh by every resolution and
  // share only immutable children.
  struct resolved_type {
    std::variant<primitive_type, collection_type, map_type, named_reference,
                 nullable_type>
        value;

    template <typename T>
    bool
    is() const {
      return std::holds_alternative<T>(value);
    }

    template <typename T>
    const T&
    as() const {
      return std::get<T>(value);
    }

    bool
    is_nullable() const {
      return is<nullable_type>();
    }

    // The type with one nullable wrapper removed.
    const resolved_type&
    unwrapped() const {
      if (auto* n = std::get_if<nullable_type>(&value)) return *n->inner;
      return *this;
    }

    bool
    is_primitive(primitive_kind kind) const {
      auto* p = std::get_if<primitive_type>(&value);
      return p && p->kind == kind;
    }

    bool
    is_opaque() const {
      return is_primitive(primitive_kind::opaque);
    }
  };

  bool
  operator==(const resolved_type& a, const resolved_type& b);

  inline resolved_type
  make_primitive(primitive_kind kind) {
    return {primitive_type{kind}};
  }

  inline resolved_type
  make_opaque() {
    return make_primitive(primitive_kind::opaque);
  }

  inline resolved_type
  make_collection(resolved_type element, bool is_mutable) {
    return {collection_type{
        std::make_shared<const resolved_type>(std::move(element)),
        is_mutable}};
  }

  inline resolved_type
  make_map(resolved_type value, bool is_mutable) {
    return {map_type{std::make_shared<const resolved_type>(std::move(value)),
                     is_mutable}};
  }

  inline resolved_type
  make_reference(std::string name) {
    return {named_reference{std::move(name)}};
  }

  // Wrapping is idempotent: a nullable type is returned unchanged.
  inline resolved_type
  make_nullable(resolved_type inner) {
    if (inner.is_nullable()) return inner;
    return {nullable_type{
        std::make_shared<const resolved_type>(std::move(inner))}};
  }

  // Human-readable form used by diagnostics and tests, e.g.
  // "nullable<collection<int32>>".
  std::string
  describe(const resolved_type& type);

} // namespace oag
