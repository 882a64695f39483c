#pragma once

#include <oag/resolved_type.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace oag {

  enum class expression_kind {
    literal,
    construct,
    enum_member,
    empty_collection,
    collection,
    placeholder,
  };

  // A rendered default value, already in target-language syntax.
  struct expression {
    expression_kind kind = expression_kind::literal;
    std::string text;

    bool
    operator==(const expression&) const = default;
  };

  struct aggregate_member {
    std::string name;
    resolved_type type;
    bool mandatory = false;
    std::optional<expression> default_value;
    // Key in the input document, kept for serialization fidelity
    std::string original_key;
    std::string description;
  };

  struct extension_data_member {
    std::string name;
    resolved_type type;
  };

  struct aggregate_decl {
    std::string name;
    std::string base;
    std::vector<aggregate_member> members;
    std::optional<extension_data_member> extension_data;
    std::string description;

    const aggregate_member*
    find_member(const std::string& member_name) const;

    const aggregate_member*
    find_key(const std::string& key) const;
  };

  enum class enum_underlying { string, integer };

  struct enum_member {
    std::string name;
    nlohmann::json value;
  };

  struct enumeration_decl {
    std::string name;
    enum_underlying underlying = enum_underlying::string;
    std::vector<enum_member> members;
    std::string description;

    // Member whose original literal equals value; nullptr when none does.
    const enum_member*
    find_value(const nlohmann::json& value) const;
  };

  struct union_variant {
    std::string name;
    std::optional<std::string> literal;

    bool
    operator==(const union_variant&) const = default;
  };

  struct union_decl {
    std::string name;
    bool open = false;
    std::optional<std::string> discriminator;
    std::vector<union_variant> variants;
    std::string description;
  };

  struct type_alias_decl {
    std::string name;
    resolved_type target;
    std::string description;
  };

  using declaration =
      std::variant<aggregate_decl, enumeration_decl, union_decl,
                   type_alias_decl>;

  enum class declaration_kind {
    aggregate,
    enumeration,
    discriminated_union,
    type_alias,
  };

  std::string
  to_string(declaration_kind kind);

  const std::string&
  declaration_name(const declaration& decl);

  declaration_kind
  kind_of(const declaration& decl);

} // namespace oag
