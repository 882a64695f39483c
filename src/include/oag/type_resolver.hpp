#pragma once

#include <oag/diagnostic.hpp>
#include <oag/generator_options.hpp>
#include <oag/resolved_type.hpp>
#include <oag/schema.hpp>
#include <oag/schema_set.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace oag {

  primitive_kind
  primitive_for(const schema_node& node);

  // Known string format names (case-insensitive), as mapped by primitive_for.
  bool
  is_known_string_format(const std::string& format);

  class type_resolver {
    const schema_set& schemas_;
    const generator_options& options_;
    std::unordered_map<std::string, std::string> schema_names_;
    std::unordered_map<const schema_node*, std::string> inline_names_;
    std::vector<diagnostic>* diagnostics_;

    resolved_type
    resolve_node(const schema_node& node, std::size_t depth) const;

    resolved_type
    resolve_shape(const schema_node& node, std::size_t depth) const;

    void
    report(diagnostic d) const;

  public:
    type_resolver(const schema_set& schemas, const generator_options& options,
                  std::vector<diagnostic>* diagnostics = nullptr);

    // Declared name of a top-level schema.
    void
    bind_schema(const std::string& raw_name, std::string declared_name);

    // Declaration synthesized for a nested node.
    void
    bind_inline(const schema_node& node, std::string declared_name);

    const std::string*
    declared_name(const std::string& raw_name) const;

    const std::string*
    inline_name(const schema_node& node) const;

    // Resolve the type of a member (or top-level schema when required is
    // true). Optional members are wrapped nullable unless they carry a
    // non-null default and default_non_nullable is set.
    resolved_type
    resolve(const schema_node& node, bool required = true) const;
  };

} // namespace oag
