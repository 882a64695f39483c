#include <oag/declaration.hpp>

#include <algorithm>

namespace oag {

  const aggregate_member*
  aggregate_decl::find_member(const std::string& member_name) const {
    auto it = std::find_if(
        members.begin(), members.end(),
        [&](const aggregate_member& m) { return m.name == member_name; });
    return it == members.end() ? nullptr : &*it;
  }

  const aggregate_member*
  aggregate_decl::find_key(const std::string& key) const {
    auto it =
        std::find_if(members.begin(), members.end(),
                     [&](const aggregate_member& m) { return m.original_key == key; });
    return it == members.end() ? nullptr : &*it;
  }

  const enum_member*
  enumeration_decl::find_value(const nlohmann::json& value) const {
    for (const auto& m : members) {
      if (m.value == value) return &m;
      // 3 and 3.0 name the same integer literal
      if (m.value.is_number() && value.is_number() &&
          m.value.get<double>() == value.get<double>())
        return &m;
    }
    return nullptr;
  }

  std::string
  to_string(declaration_kind kind) {
    switch (kind) {
      case declaration_kind::aggregate:
        return "aggregate";
      case declaration_kind::enumeration:
        return "enumeration";
      case declaration_kind::discriminated_union:
        return "union";
      case declaration_kind::type_alias:
        return "type_alias";
    }
    return "aggregate";
  }

  const std::string&
  declaration_name(const declaration& decl) {
    return std::visit([](const auto& d) -> const std::string& { return d.name; },
                      decl);
  }

  declaration_kind
  kind_of(const declaration& decl) {
    switch (decl.index()) {
      case 0:
        return declaration_kind::aggregate;
      case 1:
        return declaration_kind::enumeration;
      case 2:
        return declaration_kind::discriminated_union;
      default:
        return declaration_kind::type_alias;
    }
  }

} // namespace oag
