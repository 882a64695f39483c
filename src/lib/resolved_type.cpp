#include <oag/resolved_type.hpp>

#include <type_traits>

namespace oag {

  std::string
  to_string(primitive_kind kind) {
    switch (kind) {
      case primitive_kind::string:
        return "string";
      case primitive_kind::date_time:
        return "date_time";
      case primitive_kind::date:
        return "date";
      case primitive_kind::time:
        return "time";
      case primitive_kind::duration:
        return "duration";
      case primitive_kind::uuid:
        return "uuid";
      case primitive_kind::uri:
        return "uri";
      case primitive_kind::byte_array:
        return "byte_array";
      case primitive_kind::binary:
        return "binary";
      case primitive_kind::int32:
        return "int32";
      case primitive_kind::int64:
        return "int64";
      case primitive_kind::float32:
        return "float32";
      case primitive_kind::float64:
        return "float64";
      case primitive_kind::decimal:
        return "decimal";
      case primitive_kind::boolean:
        return "boolean";
      case primitive_kind::opaque:
        return "opaque";
    }
    return "opaque";
  }

  bool
  operator==(const resolved_type& a, const resolved_type& b) {
    if (a.value.index() != b.value.index()) return false;
    return std::visit(
        [&b](const auto& lhs) -> bool {
          using T = std::decay_t<decltype(lhs)>;
          const auto& rhs = std::get<T>(b.value);
          if constexpr (std::is_same_v<T, primitive_type>) {
            return lhs.kind == rhs.kind;
          } else if constexpr (std::is_same_v<T, collection_type>) {
            return lhs.is_mutable == rhs.is_mutable &&
                   *lhs.element == *rhs.element;
          } else if constexpr (std::is_same_v<T, map_type>) {
            return lhs.is_mutable == rhs.is_mutable && *lhs.value == *rhs.value;
          } else if constexpr (std::is_same_v<T, named_reference>) {
            return lhs.name == rhs.name;
          } else {
            return *lhs.inner == *rhs.inner;
          }
        },
        a.value);
  }

  std::string
  describe(const resolved_type& type) {
    return std::visit(
        [](const auto& t) -> std::string {
          using T = std::decay_t<decltype(t)>;
          if constexpr (std::is_same_v<T, primitive_type>) {
            return to_string(t.kind);
          } else if constexpr (std::is_same_v<T, collection_type>) {
            return std::string(t.is_mutable ? "mutable_" : "") +
                   "collection<" + describe(*t.element) + ">";
          } else if constexpr (std::is_same_v<T, map_type>) {
            return std::string(t.is_mutable ? "mutable_" : "") + "map<" +
                   describe(*t.value) + ">";
          } else if constexpr (std::is_same_v<T, named_reference>) {
            return "ref<" + t.name + ">";
          } else {
            return "nullable<" + describe(*t.inner) + ">";
          }
        },
        type.value);
  }

} // namespace oag
