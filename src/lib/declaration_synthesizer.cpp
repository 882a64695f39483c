#include <oag/declaration_synthesizer.hpp>
#include <oag/literal_renderer.hpp>
#include <oag/type_resolver.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <utility>

namespace oag {

  const declaration*
  synthesis_result::find(const std::string& name) const {
    auto it = std::find_if(
        declarations.begin(), declarations.end(),
        [&](const declaration& d) { return declaration_name(d) == name; });
    return it == declarations.end() ? nullptr : &*it;
  }

  namespace {

    struct enum_shape {
      enum_underlying underlying = enum_underlying::string;
      std::vector<nlohmann::json> values;
    };

    struct property_source {
      std::string key;
      schema_ptr schema;
      bool required = false;
    };

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

    std::vector<const schema_node*>
    present_alternatives(const schema_node& node) {
      std::vector<const schema_node*> present;
      for (const auto& m : alternatives(node))
        if (!is_null_only(*m)) present.push_back(m.get());
      return present;
    }

    std::optional<std::int64_t>
    integral(const nlohmann::json& v) {
      if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(INT64_MAX)) return std::nullopt;
        return static_cast<std::int64_t>(u);
      }
      if (v.is_number_integer()) return v.get<std::int64_t>();
      if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            std::fabs(d) < 9007199254740992.0)
          return static_cast<std::int64_t>(d);
      }
      return std::nullopt;
    }

    // Representable literals of an enumeration node; nullopt when the node is
    // not an enumeration at all.
    std::optional<enum_shape>
    enumeration_shape(const schema_node& node) {
      if (node.is_reference() || node.enum_values.empty()) return std::nullopt;

      enum_shape shape;
      switch (node.base_kind()) {
        case schema_kind::string:
          shape.underlying = enum_underlying::string;
          break;
        case schema_kind::integer:
          shape.underlying = enum_underlying::integer;
          break;
        case schema_kind::none: {
          bool all_strings = true;
          bool all_integers = true;
          for (const auto& v : node.enum_values) {
            if (v.is_null()) continue;
            all_strings = all_strings && v.is_string();
            all_integers = all_integers && integral(v).has_value();
          }
          if (all_strings)
            shape.underlying = enum_underlying::string;
          else if (all_integers)
            shape.underlying = enum_underlying::integer;
          else
            return std::nullopt;
          break;
        }
        default:
          return std::nullopt;
      }

      for (const auto& v : node.enum_values) {
        nlohmann::json literal;
        if (shape.underlying == enum_underlying::string && v.is_string())
          literal = v;
        else if (shape.underlying == enum_underlying::integer && integral(v))
          literal = *integral(v);
        else
          continue;
        if (std::find(shape.values.begin(), shape.values.end(), literal) ==
            shape.values.end())
          shape.values.push_back(std::move(literal));
      }
      return shape;
    }

    bool
    is_inline_aggregate(const schema_node& node) {
      if (!node.properties.empty()) return true;
      return !node.all_of.empty() &&
             std::none_of(node.all_of.begin(), node.all_of.end(),
                          [](const schema_ptr& s) { return s->is_reference(); });
    }

    std::string
    member_raw_name(const nlohmann::json& value) {
      if (value.is_string()) return value.get<std::string>();
      return std::to_string(value.get<std::int64_t>());
    }

    // State of one synthesis run.
    class synthesis_run {
      struct entry {
        declaration_kind kind;
        const schema_node* node;
        std::string name;
        std::string raw; // top-level raw name; empty for nested declarations
        std::size_t enum_group = static_cast<std::size_t>(-1);
      };

      struct enum_group {
        std::string key;
        enum_shape shape;
        std::string description;
        std::string name;
        std::vector<const schema_node*> nodes;
      };

      struct pending_property {
        std::string owner;
        std::string key;
        const schema_node* node;
        std::size_t depth;
        bool item;
      };

      const schema_set& schemas_;
      const generator_options& options_;
      name_registry& registry_;
      synthesis_result result_;
      type_resolver resolver_;
      literal_renderer renderer_;

      std::vector<entry> order_;
      std::map<std::string, declaration_kind> shapes_;
      std::map<std::string, std::string> base_of_;
      std::set<std::pair<const schema_node*, std::string>> dropped_edges_;
      std::vector<enum_group> enum_groups_;
      std::map<std::string, std::size_t> enum_keys_;
      std::map<std::string, declaration> built_;
      std::map<std::string, aggregate_decl> aggregates_;

      void
      report(diagnostic_kind kind, std::string subject, std::string message) {
        diagnostic d{kind, std::move(subject), std::move(message)};
        if (std::find(result_.diagnostics.begin(), result_.diagnostics.end(),
                      d) == result_.diagnostics.end())
          result_.diagnostics.push_back(std::move(d));
      }

      const std::string&
      declared(const std::string& raw) const {
        return *resolver_.declared_name(raw);
      }

      declaration_kind
      classify(const std::string& raw, const schema_node& node) {
        if (node.is_reference()) return declaration_kind::type_alias;
        if (auto shape = enumeration_shape(node)) {
          if (!shape->values.empty()) return declaration_kind::enumeration;
          report(diagnostic_kind::empty_enumeration, raw,
                 "no string or integer values; declared as an alias");
          return declaration_kind::type_alias;
        }
        if (!node.all_of.empty()) return declaration_kind::aggregate;
        if (present_alternatives(node).size() >= 2)
          return declaration_kind::discriminated_union;
        if (!node.properties.empty()) return declaration_kind::aggregate;
        auto base = node.base_kind();
        if ((base == schema_kind::object || base == schema_kind::none) &&
            node.additional_properties)
          return declaration_kind::type_alias;
        if (base == schema_kind::object) return declaration_kind::aggregate;
        return declaration_kind::type_alias;
      }

      // Properties an aggregate declares itself: inline allOf components and
      // flattened non-base references first, then its own properties. The
      // first occurrence of a key wins. Walks an explicit path stack so that
      // allOf cycles are reported instead of followed.
      std::vector<property_source>
      collect_properties(const schema_node& root, const std::string& raw,
                         const std::string& subject) {
        std::set<std::string> root_required(root.required.begin(),
                                            root.required.end());
        for (const auto& comp : root.all_of)
          if (!comp->is_reference())
            root_required.insert(comp->required.begin(), comp->required.end());

        const schema_node* base_component = nullptr;
        if (auto it = base_of_.find(raw); !raw.empty() && it != base_of_.end()) {
          for (const auto& comp : root.all_of) {
            if (comp->is_reference() && comp->ref == it->second) {
              base_component = comp.get();
              break;
            }
          }
        }

        struct frame {
          const schema_node* node;
          std::size_t next;
          bool is_ref;
        };
        std::vector<frame> stack{{&root, 0, false}};
        std::vector<std::string> path;
        if (!raw.empty()) path.push_back(raw);

        std::vector<property_source> out;
        std::set<std::string> seen;
        while (!stack.empty()) {
          auto& top = stack.back();
          if (top.next < top.node->all_of.size()) {
            const schema_node& comp = *top.node->all_of[top.next++];
            if (stack.size() == 1 &&
                (&comp == base_component ||
                 dropped_edges_.count({&root, comp.ref})))
              continue;
            if (stack.size() > options_.max_composition_depth) {
              report(diagnostic_kind::depth_exceeded, subject,
                     "allOf nesting exceeds " +
                         std::to_string(options_.max_composition_depth) +
                         " levels");
              continue;
            }
            if (!comp.is_reference()) {
              stack.push_back({&comp, 0, false});
              continue;
            }
            const schema_node* target = schemas_.find(comp.ref);
            if (!target) {
              report(diagnostic_kind::unresolved_reference, comp.ref,
                     "no schema named '" + comp.ref + "'");
              continue;
            }
            if (std::find(path.begin(), path.end(), comp.ref) != path.end()) {
              report(diagnostic_kind::composition_cycle, subject,
                     "allOf revisits '" + comp.ref + "'");
              continue;
            }
            path.push_back(comp.ref);
            stack.push_back({target, 0, true});
            continue;
          }

          for (const auto& p : top.node->properties) {
            if (!p.schema || !seen.insert(p.name).second) continue;
            out.push_back({p.name, p.schema,
                           top.node->is_required(p.name) ||
                               root_required.count(p.name) > 0});
          }
          if (top.is_ref) path.pop_back();
          stack.pop_back();
        }
        return out;
      }

      void
      compute_bases() {
        for (const auto& s : schemas_.schemas()) {
          if (shapes_.at(s.name) != declaration_kind::aggregate) continue;
          for (const auto& comp : s.schema->all_of) {
            if (!comp->is_reference()) continue;
            auto it = shapes_.find(comp->ref);
            if (it != shapes_.end() && it->second == declaration_kind::aggregate) {
              base_of_[s.name] = comp->ref;
              break;
            }
          }
        }

        // Walk every chain in document order; the edge that closes a cycle
        // is dropped.
        for (const auto& s : schemas_.schemas()) {
          std::vector<std::string> path{s.name};
          std::string current = s.name;
          for (;;) {
            auto it = base_of_.find(current);
            if (it == base_of_.end()) break;
            if (std::find(path.begin(), path.end(), it->second) != path.end()) {
              report(diagnostic_kind::composition_cycle, declared(current),
                     "base '" + declared(it->second) +
                         "' closes an inheritance cycle; base dropped");
              dropped_edges_.insert({schemas_.find(current), it->second});
              base_of_.erase(it);
              break;
            }
            path.push_back(it->second);
            current = it->second;
          }
        }
      }

      void
      add_enum_group(const std::string& key, enum_shape shape,
                     const schema_node& node) {
        std::string dedup_key =
            key + '\x1f' +
            (shape.underlying == enum_underlying::integer ? "i" : "s") +
            '\x1f' + nlohmann::json(shape.values).dump();
        auto [it, inserted] = enum_keys_.emplace(dedup_key, enum_groups_.size());
        if (inserted) {
          enum_groups_.push_back(
              {key, std::move(shape), node.description, {}, {}});
          entry e{declaration_kind::enumeration, &node, {}, {}, it->second};
          order_.push_back(std::move(e));
        }
        enum_groups_[it->second].nodes.push_back(&node);
      }

      // Find the nested declarations reachable from one aggregate's
      // properties, in document order.
      void
      discover(const std::string& owner, const std::vector<property_source>& props) {
        std::vector<pending_property> pending;
        auto push_all = [&pending](const std::string& from,
                                   const std::vector<property_source>& list,
                                   std::size_t depth) {
          for (auto it = list.rbegin(); it != list.rend(); ++it)
            pending.push_back({from, it->key, it->schema.get(), depth, false});
        };
        push_all(owner, props, 1);

        while (!pending.empty()) {
          auto work = std::move(pending.back());
          pending.pop_back();
          const schema_node& node = *work.node;
          if (node.is_reference() || resolver_.inline_name(node)) continue;

          if (work.depth > options_.max_composition_depth) {
            report(diagnostic_kind::depth_exceeded, work.owner,
                   "property '" + work.key + "' nests deeper than " +
                       std::to_string(options_.max_composition_depth) +
                       " levels");
            continue;
          }

          if (auto shape = enumeration_shape(node)) {
            if (shape->values.empty()) {
              report(diagnostic_kind::empty_enumeration, work.owner,
                     "property '" + work.key +
                         "' has no string or integer values");
              continue;
            }
            add_enum_group(work.key, std::move(*shape), node);
            continue;
          }

          auto present = present_alternatives(node);
          if (present.size() == 1) {
            pending.push_back(
                {work.owner, work.key, present.front(), work.depth, work.item});
            continue;
          }

          std::string raw = work.owner + "." + work.key;
          if (work.item) raw += ".item";

          if (present.size() >= 2) {
            if (!node.discriminator) continue;
            auto name = registry_.declarations().allocate(raw);
            resolver_.bind_inline(node, name);
            order_.push_back(
                {declaration_kind::discriminated_union, &node, name, {}});
            continue;
          }

          if (node.base_kind() == schema_kind::array && node.items) {
            pending.push_back(
                {work.owner, work.key, node.items.get(), work.depth, true});
            continue;
          }

          if (is_inline_aggregate(node)) {
            auto name = registry_.declarations().allocate(raw);
            resolver_.bind_inline(node, name);
            order_.push_back({declaration_kind::aggregate, &node, name, {}});
            push_all(name, collect_properties(node, {}, name), work.depth + 1);
          }
        }
      }

      enumeration_decl
      build_enumeration(const std::string& name, const enum_shape& shape,
                        const std::string& description) {
        enumeration_decl decl;
        decl.name = name;
        decl.underlying = shape.underlying;
        decl.description = description;

        std::vector<std::string> raws;
        for (const auto& v : shape.values) raws.push_back(member_raw_name(v));
        auto scope = registry_.make_scope("Unknown");
        auto names = scope.allocate(raws);
        for (std::size_t i = 0; i < names.size(); ++i)
          decl.members.push_back({names[i], shape.values[i]});
        return decl;
      }

      union_decl
      build_union(const std::string& name, const schema_node& node) {
        union_decl decl;
        decl.name = name;
        decl.description = node.description;
        decl.open = !node.discriminator;

        std::set<std::string> seen;
        std::set<std::string> mapped;
        if (node.discriminator) {
          decl.discriminator = node.discriminator->property_name;
          for (const auto& [literal, target] : node.discriminator->mapping) {
            mapped.insert(target);
            auto* variant = resolver_.declared_name(target);
            if (!variant) {
              report(diagnostic_kind::unresolved_discriminator_target, name,
                     "mapping '" + literal + "' targets unknown schema '" +
                         target + "'; variant dropped");
              continue;
            }
            if (seen.insert(*variant).second)
              decl.variants.push_back({*variant, literal});
          }
        }

        const auto& members = alternatives(node);
        for (std::size_t i = 0; i < members.size(); ++i) {
          const auto& member = *members[i];
          if (is_null_only(member)) continue;
          if (!member.is_reference()) {
            report(diagnostic_kind::unsupported_union_member, name,
                   "inline member " + std::to_string(i) +
                       " cannot be a variant; dropped");
            continue;
          }
          if (mapped.count(member.ref)) continue;
          auto* variant = resolver_.declared_name(member.ref);
          if (!variant) {
            report(diagnostic_kind::unresolved_reference, member.ref,
                   "no schema named '" + member.ref + "'");
            continue;
          }
          if (!seen.insert(*variant).second) continue;
          if (node.discriminator)
            decl.variants.push_back({*variant, member.ref});
          else
            decl.variants.push_back({*variant, std::nullopt});
        }
        return decl;
      }

      aggregate_decl
      build_aggregate(const std::string& name, const schema_node& node,
                      const std::string& raw) {
        aggregate_decl decl;
        decl.name = name;
        decl.description = node.description;

        auto scope = registry_.make_scope("Unknown", name);
        std::set<std::string> inherited_keys;
        if (auto it = base_of_.find(raw); !raw.empty() && it != base_of_.end()) {
          decl.base = declared(it->second);
          // the base and its own ancestors are already built
          for (auto* ancestor = &aggregates_.at(decl.base); ancestor;) {
            for (const auto& m : ancestor->members) {
              scope.reserve(m.name, m.original_key);
              inherited_keys.insert(m.original_key);
            }
            if (ancestor->extension_data)
              scope.reserve(ancestor->extension_data->name,
                            "AdditionalProperties");
            ancestor = ancestor->base.empty() ? nullptr
                                              : &aggregates_.at(ancestor->base);
          }
        }

        auto props = collect_properties(node, raw, name);
        std::vector<const property_source*> own;
        std::vector<std::string> raws;
        for (const auto& p : props) {
          if (inherited_keys.count(p.key)) continue;
          own.push_back(&p);
          raws.push_back(p.key);
        }
        auto names = scope.allocate(raws);

        for (std::size_t i = 0; i < own.size(); ++i) {
          const auto& p = *own[i];
          aggregate_member m;
          m.name = names[i];
          m.original_key = p.key;
          m.mandatory = p.required;
          m.type = resolver_.resolve(*p.schema, p.required);
          m.description = p.schema->description;
          if (p.schema->has_non_null_default()) {
            auto rendered =
                renderer_.render(*p.schema->default_value, m.type, p.schema->format);
            if (rendered)
              m.default_value = options_.propagate_defaults
                                    ? *rendered
                                    : literal_renderer::placeholder();
          }
          decl.members.push_back(std::move(m));
        }

        if (!props.empty() && node.additional_properties) {
          extension_data_member ext;
          ext.name = scope.allocate(std::string("AdditionalProperties"));
          ext.type = make_map(resolver_.resolve(*node.additional_properties),
                              options_.mutable_maps);
          decl.extension_data = std::move(ext);
        }
        return decl;
      }

      // Build an aggregate after every ancestor it inherits from.
      void
      ensure_aggregate(const entry& e) {
        std::vector<const entry*> chain{&e};
        if (!e.raw.empty()) {
          std::string current = e.raw;
          for (auto it = base_of_.find(current); it != base_of_.end();
               it = base_of_.find(current)) {
            current = it->second;
            auto found = std::find_if(order_.begin(), order_.end(),
                                      [&](const entry& x) { return x.raw == current; });
            chain.push_back(&*found);
          }
        }
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
          const entry& link = **it;
          if (aggregates_.count(link.name)) continue;
          aggregates_.emplace(link.name,
                              build_aggregate(link.name, *link.node, link.raw));
        }
      }

    public:
      synthesis_run(const schema_set& schemas, const generator_options& options,
                    name_registry& registry)
          : schemas_(schemas), options_(options), registry_(registry),
            resolver_(schemas, options, &result_.diagnostics),
            renderer_([this](const std::string& name) -> const declaration* {
              auto it = built_.find(name);
              return it == built_.end() ? nullptr : &it->second;
            }) {}

      synthesis_result
      run() {
        // Pass 1: classification and naming
        std::vector<std::string> raws;
        for (const auto& s : schemas_.schemas()) {
          shapes_[s.name] = classify(s.name, *s.schema);
          raws.push_back(s.name);
        }
        auto names = registry_.declarations().allocate(raws);
        for (std::size_t i = 0; i < raws.size(); ++i)
          resolver_.bind_schema(raws[i], names[i]);

        compute_bases();

        for (std::size_t i = 0; i < raws.size(); ++i) {
          const auto& s = schemas_.schemas()[i];
          auto kind = shapes_.at(s.name);
          order_.push_back({kind, s.schema.get(), names[i], s.name});
          if (kind == declaration_kind::aggregate)
            discover(names[i], collect_properties(*s.schema, s.name, names[i]));
        }

        std::vector<std::string> enum_raws;
        for (const auto& g : enum_groups_) enum_raws.push_back(g.key);
        auto enum_names = registry_.declarations().allocate(enum_raws);
        for (std::size_t i = 0; i < enum_groups_.size(); ++i) {
          enum_groups_[i].name = enum_names[i];
          for (const auto* node : enum_groups_[i].nodes)
            resolver_.bind_inline(*node, enum_names[i]);
        }
        for (auto& e : order_)
          if (e.enum_group < enum_groups_.size())
            e.name = enum_groups_[e.enum_group].name;

        // Pass 2: assembly. Enumerations and aliases first so that defaults
        // can refer to them.
        for (const auto& e : order_) {
          if (e.kind == declaration_kind::enumeration) {
            if (e.enum_group < enum_groups_.size()) {
              const auto& g = enum_groups_[e.enum_group];
              built_.emplace(e.name,
                             build_enumeration(e.name, g.shape, g.description));
            } else {
              built_.emplace(e.name,
                             build_enumeration(e.name, *enumeration_shape(*e.node),
                                               e.node->description));
            }
          }
        }
        for (const auto& e : order_) {
          if (e.kind == declaration_kind::type_alias)
            built_.emplace(e.name,
                           type_alias_decl{e.name, resolver_.resolve(*e.node),
                                           e.node->description});
        }
        for (const auto& e : order_) {
          if (e.kind == declaration_kind::discriminated_union)
            built_.emplace(e.name, build_union(e.name, *e.node));
        }
        for (const auto& e : order_) {
          if (e.kind == declaration_kind::aggregate) ensure_aggregate(e);
        }

        for (const auto& e : order_) {
          if (e.kind == declaration_kind::aggregate) {
            result_.declarations.emplace_back(std::move(aggregates_.at(e.name)));
          } else {
            result_.declarations.push_back(std::move(built_.at(e.name)));
          }
          result_.index.emplace(e.name, e.kind);
        }
        return std::move(result_);
      }
    };

  } // namespace

  declaration_synthesizer::declaration_synthesizer(const schema_set& schemas,
                                                   generator_options options)
      : schemas_(schemas), options_(std::move(options)) {}

  synthesis_result
  declaration_synthesizer::synthesize() const {
    name_registry registry(options_.to_naming_options());
    return synthesize(registry);
  }

  synthesis_result
  declaration_synthesizer::synthesize(name_registry& registry) const {
    synthesis_run run(schemas_, options_, registry);
    return run.run();
  }

} // namespace oag
