#include <oag/type_resolver.hpp>

#include <algorithm>
#include <cctype>

namespace oag {

  namespace {

    std::string
    lowercase(std::string text) {
      std::transform(text.begin(), text.end(), text.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      });
      return text;
    }

    bool
    is_null_only(const schema_node& node) {
      return node.kind == schema_kind::null && !node.is_reference() &&
             node.properties.empty() && node.all_of.empty() &&
             node.one_of.empty() && node.any_of.empty();
    }

    const std::vector<schema_ptr>&
    alternatives(const schema_node& node) {
      return node.one_of.empty() ? node.any_of : node.one_of;
    }

    primitive_kind
    string_primitive(const std::string& format) {
      auto f = lowercase(format);
      if (f == "date-time") return primitive_kind::date_time;
      if (f == "date") return primitive_kind::date;
      if (f == "time") return primitive_kind::time;
      if (f == "duration") return primitive_kind::duration;
      if (f == "uuid") return primitive_kind::uuid;
      if (f == "uri" || f == "uri-reference" || f == "url")
        return primitive_kind::uri;
      if (f == "byte") return primitive_kind::byte_array;
      if (f == "binary") return primitive_kind::binary;
      return primitive_kind::string;
    }

  } // namespace

  bool
  is_known_string_format(const std::string& format) {
    return string_primitive(format) != primitive_kind::string;
  }

  primitive_kind
  primitive_for(const schema_node& node) {
    switch (node.base_kind()) {
      case schema_kind::string:
        return string_primitive(node.format);
      case schema_kind::integer:
        return lowercase(node.format) == "int64" ? primitive_kind::int64
                                                 : primitive_kind::int32;
      case schema_kind::number: {
        auto f = lowercase(node.format);
        if (f == "float") return primitive_kind::float32;
        if (f == "decimal") return primitive_kind::decimal;
        return primitive_kind::float64;
      }
      case schema_kind::boolean:
        return primitive_kind::boolean;
      default:
        return primitive_kind::opaque;
    }
  }

  type_resolver::type_resolver(const schema_set& schemas,
                               const generator_options& options,
                               std::vector<diagnostic>* diagnostics)
      : schemas_(schemas), options_(options), diagnostics_(diagnostics) {}

  void
  type_resolver::bind_schema(const std::string& raw_name,
                             std::string declared_name) {
    schema_names_[raw_name] = std::move(declared_name);
  }

  void
  type_resolver::bind_inline(const schema_node& node,
                             std::string declared_name) {
    inline_names_.emplace(&node, std::move(declared_name));
  }

  const std::string*
  type_resolver::declared_name(const std::string& raw_name) const {
    auto it = schema_names_.find(raw_name);
    return it == schema_names_.end() ? nullptr : &it->second;
  }

  const std::string*
  type_resolver::inline_name(const schema_node& node) const {
    auto it = inline_names_.find(&node);
    return it == inline_names_.end() ? nullptr : &it->second;
  }

  void
  type_resolver::report(diagnostic d) const {
    if (!diagnostics_) return;
    if (std::find(diagnostics_->begin(), diagnostics_->end(), d) !=
        diagnostics_->end())
      return;
    diagnostics_->push_back(std::move(d));
  }

  resolved_type
  type_resolver::resolve(const schema_node& node, bool required) const {
    auto type = resolve_node(node, 0);
    bool defaulted = options_.default_non_nullable && node.has_non_null_default();
    if (!required && !defaulted) return make_nullable(std::move(type));
    return type;
  }

  resolved_type
  type_resolver::resolve_node(const schema_node& node,
                              std::size_t depth) const {
    auto type = resolve_shape(node, depth);
    if (node.is_nullable()) return make_nullable(std::move(type));
    return type;
  }

  resolved_type
  type_resolver::resolve_shape(const schema_node& node,
                               std::size_t depth) const {
    if (depth > options_.max_composition_depth) {
      report({diagnostic_kind::depth_exceeded,
              node.is_reference() ? node.ref : std::string("(inline)"),
              "type nesting exceeds " +
                  std::to_string(options_.max_composition_depth) +
                  " levels"});
      return make_opaque();
    }

    if (auto* name = inline_name(node)) return make_reference(*name);

    if (node.is_reference()) {
      if (auto* name = declared_name(node.ref)) return make_reference(*name);
      if (schemas_.contains(node.ref)) return make_reference(node.ref);
      report({diagnostic_kind::unresolved_reference, node.ref,
              "no schema named '" + node.ref + "'"});
      return make_opaque();
    }

    if (!node.all_of.empty()) {
      if (node.all_of.size() == 1)
        return resolve_node(*node.all_of.front(), depth + 1);
      auto refs = std::count_if(
          node.all_of.begin(), node.all_of.end(),
          [](const schema_ptr& s) { return s->is_reference(); });
      if (refs == 1) {
        auto it = std::find_if(
            node.all_of.begin(), node.all_of.end(),
            [](const schema_ptr& s) { return s->is_reference(); });
        return resolve_node(**it, depth + 1);
      }
      return make_opaque();
    }

    const auto& members = alternatives(node);
    if (!members.empty()) {
      if (members.size() == 1) return resolve_node(*members.front(), depth + 1);
      std::vector<const schema_node*> present;
      for (const auto& m : members)
        if (!is_null_only(*m)) present.push_back(m.get());
      if (present.size() == 1)
        return make_nullable(resolve_node(*present.front(), depth + 1));
      // no generic encoding for an undeclared union
      return make_opaque();
    }

    switch (node.base_kind()) {
      case schema_kind::array:
        return make_collection(node.items ? resolve_node(*node.items, depth + 1)
                                          : make_opaque(),
                               options_.mutable_collections);
      case schema_kind::object:
      case schema_kind::none:
        if (node.properties.empty() && node.additional_properties)
          return make_map(resolve_node(*node.additional_properties, depth + 1),
                          options_.mutable_maps);
        if (node.base_kind() == schema_kind::none && node.items)
          return make_collection(resolve_node(*node.items, depth + 1),
                                 options_.mutable_collections);
        return make_opaque();
      default:
        return make_primitive(primitive_for(node));
    }
  }

} // namespace oag
