#include <oag/codegen.hpp>
#include <oag/literal_renderer.hpp>
#include <oag/naming.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace oag {

  namespace {

    enum class cut_kind { none, forward, indirect, ignored };

    // One use of another declaration by name.
    struct dependency {
      std::size_t target;
      // The complete type is needed: a base, a value member, a variant
      bool by_value;
      // Member or variant the use comes from; empty for bases and alias
      // targets, which can never be made indirect
      std::string via;
      cut_kind cut = cut_kind::none;
    };

    struct edge_ref {
      std::size_t from;
      std::size_t index;
    };

    // Declarations lowered for one synthesized declaration, with what they
    // need from the rest of the file.
    struct lowered_group {
      std::string name;
      std::vector<cpp_decl> decls;
      std::set<std::string> includes;
      std::vector<std::string> forward;
      std::vector<std::size_t> needs;
    };

    template <typename F>
    void
    for_each_reference(const resolved_type& type, bool by_value, F&& f) {
      std::visit(
          [&](const auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, collection_type>)
              for_each_reference(*t.element, false, f);
            else if constexpr (std::is_same_v<T, map_type>)
              for_each_reference(*t.value, by_value, f);
            else if constexpr (std::is_same_v<T, named_reference>)
              f(t.name, by_value);
            else if constexpr (std::is_same_v<T, nullable_type>)
              for_each_reference(*t.inner, by_value, f);
          },
          type.value);
    }

    // Aliases over a primitive become a struct with a single `value` field
    bool
    is_wrapper_alias(const type_alias_decl& alias) {
      const auto& target = alias.target.unwrapped();
      return target.is<primitive_type>() && !target.is_opaque();
    }

    bool
    is_immutable_container(const resolved_type& type) {
      const auto& t = type.unwrapped();
      if (t.is<collection_type>()) return !t.as<collection_type>().is_mutable;
      if (t.is<map_type>()) return !t.as<map_type>().is_mutable;
      return false;
    }

    // std::any and std::chrono::hh_mm_ss have no operator==
    bool
    is_comparable(const std::string& type) {
      return type.find("std::any") == std::string::npos &&
             type.find("hh_mm_ss") == std::string::npos;
    }

    bool
    is_comparable(const std::vector<cpp_field>& fields) {
      return std::all_of(fields.begin(), fields.end(), [](const cpp_field& f) {
        return is_comparable(f.type);
      });
    }

    std::string
    enumerator_value(std::int64_t v, bool wide) {
      if (v == std::numeric_limits<std::int64_t>::min())
        return "(-9223372036854775807LL - 1)";
      if (!wide && v == std::numeric_limits<std::int32_t>::min())
        return "(-2147483647 - 1)";
      return std::to_string(v);
    }

    class lowering {
      const synthesis_result& result_;
      const type_map& types_;
      const codegen_options& options_;
      std::map<std::string, std::size_t> index_;
      std::vector<std::vector<dependency>> deps_;

      const type_mapping&
      mapping(const std::string& key) const {
        auto* m = types_.find(key);
        if (!m)
          throw std::invalid_argument("type map has no entry for '" + key +
                                      "'");
        return *m;
      }

      static void
      add_headers(std::set<std::string>& includes, const std::string& headers) {
        std::istringstream in(headers);
        std::string header;
        while (in >> header)
          includes.insert(header);
      }

      std::string
      use(const std::string& key, std::set<std::string>& includes) const {
        const auto& m = mapping(key);
        add_headers(includes, m.cpp_header);
        return m.cpp_type;
      }

      std::string
      wrap(const std::string& key, const std::string& argument,
           std::set<std::string>& includes) const {
        return instantiate(use(key, includes), argument);
      }

      // Declared names inside a struct are spelled fully qualified: a member
      // may share its name with a declaration, which would otherwise change
      // the meaning of the unqualified name within the class.
      std::string
      qualified(const std::string& name) const {
        if (options_.cpp_namespace.empty()) return "::" + name;
        return "::" + options_.cpp_namespace + "::" + name;
      }

      // Default expressions that name a declaration ("Status::Active",
      // "PetName{...}") get the same qualification.
      std::string
      qualified_expression(const std::string& text) const {
        auto end = text.find_first_of(":{");
        if (end == std::string::npos || end == 0) return text;
        if (!index_.count(text.substr(0, end))) return text;
        return qualified(text.substr(0, end)) + text.substr(end);
      }

      // C++ spelling of a resolved type. References named in `indirect` are
      // held through the indirection template where the complete type would
      // otherwise be required.
      std::string
      spell(const resolved_type& type, const std::set<std::string>& indirect,
            bool by_value, bool qualify, std::set<std::string>& includes) const {
        return std::visit(
            [&](const auto& t) -> std::string {
              using T = std::decay_t<decltype(t)>;
              if constexpr (std::is_same_v<T, primitive_type>) {
                return use(to_string(t.kind), includes);
              } else if constexpr (std::is_same_v<T, collection_type>) {
                return wrap("collection",
                            spell(*t.element, indirect, false, qualify, includes),
                            includes);
              } else if constexpr (std::is_same_v<T, map_type>) {
                return wrap("map",
                            spell(*t.value, indirect, by_value, qualify, includes),
                            includes);
              } else if constexpr (std::is_same_v<T, named_reference>) {
                auto name = qualify ? qualified(t.name) : t.name;
                if (by_value && indirect.count(t.name))
                  return wrap("indirect", name, includes);
                return name;
              } else {
                const auto& inner = *t.inner;
                // the indirection is already nullable
                if (by_value && inner.template is<named_reference>() &&
                    indirect.count(inner.template as<named_reference>().name))
                  return spell(inner, indirect, by_value, qualify, includes);
                return wrap("nullable",
                            spell(inner, indirect, by_value, qualify, includes),
                            includes);
              }
            },
            type.value);
      }

      std::string
      doc(const std::string& description) const {
        return options_.doc_comments ? description : std::string{};
      }

      bool
      is_struct(std::size_t i) const {
        const auto& decl = result_.declarations[i];
        if (std::holds_alternative<aggregate_decl>(decl)) return true;
        if (auto* alias = std::get_if<type_alias_decl>(&decl))
          return is_wrapper_alias(*alias);
        return false;
      }

      // Targets reached from `via` that were made indirect to break a cycle.
      std::set<std::string>
      indirect_targets(std::size_t i, const std::string& via) const {
        std::set<std::string> out;
        for (const auto& d : deps_[i])
          if (d.cut == cut_kind::indirect && d.via == via)
            out.insert(declaration_name(result_.declarations[d.target]));
        return out;
      }

      void
      collect_dependencies() {
        const auto& decls = result_.declarations;
        deps_.assign(decls.size(), {});
        for (std::size_t i = 0; i < decls.size(); ++i) {
          auto add = [&](const std::string& name, bool by_value,
                         const std::string& via) {
            auto it = index_.find(name);
            if (it == index_.end()) return;
            for (auto& d : deps_[i]) {
              if (d.target == it->second && d.via == via) {
                d.by_value = d.by_value || by_value;
                return;
              }
            }
            deps_[i].push_back({it->second, by_value, via});
          };

          std::visit(
              [&](const auto& d) {
                using T = std::decay_t<decltype(d)>;
                if constexpr (std::is_same_v<T, aggregate_decl>) {
                  if (!d.base.empty()) add(d.base, true, {});
                  for (const auto& m : d.members)
                    for_each_reference(m.type, true,
                                       [&](const std::string& n, bool v) {
                                         add(n, v, m.name);
                                       });
                  if (d.extension_data)
                    for_each_reference(d.extension_data->type, true,
                                       [&](const std::string& n, bool v) {
                                         add(n, v, d.extension_data->name);
                                       });
                } else if constexpr (std::is_same_v<T, union_decl>) {
                  for (const auto& v : d.variants)
                    add(v.name, true, v.name);
                } else if constexpr (std::is_same_v<T, type_alias_decl>) {
                  for_each_reference(d.target, true,
                                     [&](const std::string& n, bool v) {
                                       add(n, v, {});
                                     });
                }
              },
              decls[i]);
        }
      }

      // Edges of one dependency cycle among the uncut edges, found by a
      // depth-first walk in document order. Empty when there is none.
      std::vector<edge_ref>
      find_cycle() const {
        const std::size_t n = deps_.size();
        std::vector<int> color(n, 0);
        struct frame {
          std::size_t node;
          std::size_t next;
        };

        for (std::size_t root = 0; root < n; ++root) {
          if (color[root] != 0) continue;
          std::vector<frame> stack{{root, 0}};
          color[root] = 1;
          while (!stack.empty()) {
            auto node = stack.back().node;
            auto edge = stack.back().next;
            if (edge == deps_[node].size()) {
              color[node] = 2;
              stack.pop_back();
              continue;
            }
            ++stack.back().next;
            const auto& d = deps_[node][edge];
            if (d.cut != cut_kind::none) continue;
            if (color[d.target] == 1) {
              std::size_t start = 0;
              while (stack[start].node != d.target)
                ++start;
              std::vector<edge_ref> cycle;
              for (std::size_t q = start; q + 1 < stack.size(); ++q)
                cycle.push_back({stack[q].node, stack[q].next - 1});
              cycle.push_back({node, edge});
              return cycle;
            }
            if (color[d.target] == 0) {
              color[d.target] = 1;
              stack.push_back({d.target, 0});
            }
          }
        }
        return {};
      }

      // Cut one edge per cycle, walking back from the edge that closed it: a
      // by-name use of a struct needs only a forward declaration; otherwise
      // a member or variant is held through the indirection template.
      void
      break_cycles() {
        for (auto cycle = find_cycle(); !cycle.empty(); cycle = find_cycle()) {
          dependency* chosen = nullptr;
          for (auto it = cycle.rbegin(); it != cycle.rend() && !chosen; ++it) {
            auto& d = deps_[it->from][it->index];
            if (!d.by_value && is_struct(d.target)) {
              d.cut = cut_kind::forward;
              chosen = &d;
            }
          }
          for (auto it = cycle.rbegin(); it != cycle.rend() && !chosen; ++it) {
            auto& d = deps_[it->from][it->index];
            if (!d.via.empty() && is_struct(d.target)) {
              d.cut = cut_kind::indirect;
              chosen = &d;
            }
          }
          // alias-only cycles have no C++ spelling; they keep document order
          if (!chosen)
            deps_[cycle.back().from][cycle.back().index].cut = cut_kind::ignored;
        }
      }

      // Topological sort over the uncut edges. Among the declarations whose
      // dependencies are satisfied the earliest in document order goes
      // first.
      std::vector<std::size_t>
      order_declarations() const {
        const std::size_t n = deps_.size();
        std::vector<std::size_t> in_degree(n, 0);
        std::vector<std::vector<std::size_t>> reverse_deps(n);
        for (std::size_t i = 0; i < n; ++i) {
          for (const auto& d : deps_[i]) {
            if (d.cut != cut_kind::none || d.target == i) continue;
            reverse_deps[d.target].push_back(i);
            ++in_degree[i];
          }
        }

        std::set<std::size_t> ready;
        for (std::size_t i = 0; i < n; ++i)
          if (in_degree[i] == 0) ready.insert(i);

        std::vector<std::size_t> order;
        while (!ready.empty()) {
          auto idx = *ready.begin();
          ready.erase(ready.begin());
          order.push_back(idx);
          for (auto dependent : reverse_deps[idx])
            if (--in_degree[dependent] == 0) ready.insert(dependent);
        }

        if (order.size() < n) {
          std::set<std::size_t> visited(order.begin(), order.end());
          for (std::size_t i = 0; i < n; ++i)
            if (visited.find(i) == visited.end()) order.push_back(i);
        }
        return order;
      }

      void
      lower_aggregate(std::size_t i, const aggregate_decl& a,
                      lowered_group& out) const {
        cpp_struct s;
        s.name = a.name;
        s.base = a.base;
        s.doc = doc(a.description);

        for (const auto& m : a.members) {
          auto indirect = indirect_targets(i, m.name);
          cpp_field f;
          f.name = m.name;
          f.type = spell(m.type, indirect, true, true, out.includes);
          if (is_immutable_container(m.type)) f.type = "const " + f.type;
          if (m.default_value && indirect.empty())
            f.default_value = qualified_expression(m.default_value->text);
          if (m.original_key != m.name)
            f.comment = "json: " + cpp_string_literal(m.original_key);
          f.doc = doc(m.description);
          s.fields.push_back(std::move(f));
        }

        if (a.extension_data) {
          const auto& ext = *a.extension_data;
          cpp_field f;
          f.name = ext.name;
          f.type = spell(ext.type, indirect_targets(i, ext.name), true, true,
                         out.includes);
          if (is_immutable_container(ext.type)) f.type = "const " + f.type;
          f.comment = "additional properties";
          s.fields.push_back(std::move(f));
        }

        s.generate_equality = is_comparable(s.fields);
        out.decls.push_back(std::move(s));
      }

      void
      lower_enumeration(const enumeration_decl& e, lowered_group& out) const {
        cpp_enum en;
        en.name = e.name;
        en.doc = doc(e.description);

        if (e.underlying == enum_underlying::integer) {
          bool wide = false;
          for (const auto& m : e.members) {
            auto v = m.value.get<std::int64_t>();
            wide = wide || v < std::numeric_limits<std::int32_t>::min() ||
                   v > std::numeric_limits<std::int32_t>::max();
          }
          en.underlying_type = wide ? "std::int64_t" : "std::int32_t";
          out.includes.insert("<cstdint>");
          for (const auto& m : e.members) {
            auto v = m.value.get<std::int64_t>();
            en.values.push_back({m.name, cpp_string_literal(std::to_string(v)),
                                 enumerator_value(v, wide)});
          }
        } else {
          for (const auto& m : e.members)
            en.values.push_back(
                {m.name, cpp_string_literal(m.value.get<std::string>()), {}});
        }

        out.includes.insert("<stdexcept>");
        out.includes.insert("<string>");
        out.includes.insert("<string_view>");
        out.decls.push_back(std::move(en));
      }

      void
      lower_union(std::size_t i, const union_decl& u, lowered_group& out) const {
        if (u.variants.empty()) {
          out.decls.push_back(cpp_type_alias{
              u.name, use(to_string(primitive_kind::opaque), out.includes),
              doc(u.description)});
          return;
        }

        std::string target = "std::variant<";
        for (std::size_t k = 0; k < u.variants.size(); ++k) {
          const auto& v = u.variants[k];
          if (k > 0) target += ", ";
          if (indirect_targets(i, v.name).count(v.name))
            target += wrap("indirect", v.name, out.includes);
          else
            target += v.name;
        }
        target += ">";
        out.includes.insert("<variant>");
        out.decls.push_back(cpp_type_alias{u.name, target, doc(u.description)});

        if (!u.discriminator) return;

        out.includes.insert("<string_view>");
        out.decls.push_back(cpp_constant{"std::string_view",
                                         u.name + "_discriminator_property",
                                         cpp_string_literal(*u.discriminator)});

        std::string body = "  switch (v.index()) {\n";
        for (std::size_t k = 0; k < u.variants.size(); ++k) {
          const auto& literal = u.variants[k].literal;
          body += "  case " + std::to_string(k) + ": return " +
                  cpp_string_literal(literal ? *literal : u.variants[k].name) +
                  ";\n";
        }
        body += "  }\n  return \"\";\n";
        out.decls.push_back(cpp_function{"std::string_view",
                                         u.name + "_discriminator_value",
                                         "const " + u.name + "& v", body});
      }

      void
      lower_alias(const type_alias_decl& a, lowered_group& out) const {
        if (is_wrapper_alias(a)) {
          cpp_struct s;
          s.name = a.name;
          s.doc = doc(a.description);
          cpp_field f;
          f.name = "value";
          f.type = spell(a.target, {}, true, false, out.includes);
          s.fields.push_back(std::move(f));
          s.generate_equality = is_comparable(s.fields);
          out.decls.push_back(std::move(s));
          return;
        }
        out.decls.push_back(cpp_type_alias{
            a.name, spell(a.target, {}, true, false, out.includes),
            doc(a.description)});
      }

      lowered_group
      lower(std::size_t i) const {
        const auto& decl = result_.declarations[i];
        lowered_group out;
        out.name = declaration_name(decl);

        for (const auto& d : deps_[i]) {
          if (d.target == i) continue;
          if (d.cut == cut_kind::forward || d.cut == cut_kind::indirect) {
            const auto& name = declaration_name(result_.declarations[d.target]);
            if (std::find(out.forward.begin(), out.forward.end(), name) ==
                out.forward.end())
              out.forward.push_back(name);
          } else if (std::find(out.needs.begin(), out.needs.end(), d.target) ==
                     out.needs.end()) {
            out.needs.push_back(d.target);
          }
        }
        std::visit(
            [&](const auto& d) {
              using T = std::decay_t<decltype(d)>;
              if constexpr (std::is_same_v<T, aggregate_decl>)
                lower_aggregate(i, d, out);
              else if constexpr (std::is_same_v<T, enumeration_decl>)
                lower_enumeration(d, out);
              else if constexpr (std::is_same_v<T, union_decl>)
                lower_union(i, d, out);
              else
                lower_alias(d, out);
            },
            decl);
        return out;
      }

      // A declaration compares by value only when everything it holds does.
      // Members held through the indirection template would compare by
      // address, so they rule out equality too.
      void
      drop_equality(const std::vector<std::size_t>& order,
                    std::vector<lowered_group>& groups) const {
        std::vector<bool> comparable(result_.declarations.size(), true);
        for (std::size_t k = 0; k < order.size(); ++k) {
          auto i = order[k];
          for (const auto& d : deps_[i])
            if (d.cut == cut_kind::indirect) comparable[i] = false;
          for (const auto& d : groups[k].decls) {
            if (const auto* s = std::get_if<cpp_struct>(&d))
              if (!s->generate_equality) comparable[i] = false;
            if (const auto* a = std::get_if<cpp_type_alias>(&d))
              if (!is_comparable(a->target)) comparable[i] = false;
          }
        }

        for (bool changed = true; changed;) {
          changed = false;
          for (std::size_t i = 0; i < comparable.size(); ++i) {
            if (!comparable[i]) continue;
            for (const auto& d : deps_[i]) {
              if (d.target != i && !comparable[d.target]) {
                comparable[i] = false;
                changed = true;
                break;
              }
            }
          }
        }

        for (std::size_t k = 0; k < order.size(); ++k) {
          if (comparable[order[k]]) continue;
          for (auto& d : groups[k].decls)
            if (auto* s = std::get_if<cpp_struct>(&d))
              s->generate_equality = false;
        }
      }

      std::vector<std::string>
      header_comment() const {
        if (!options_.file_header) return {};
        return {"Generated by oag. Do not edit."};
      }

      std::string
      per_type_filename(const std::string& name) const {
        return options_.file_stem + "_" + to_snake_case(name) + ".hpp";
      }

    public:
      lowering(const synthesis_result& result, const type_map& types,
               const codegen_options& options)
          : result_(result), types_(types), options_(options) {
        for (std::size_t i = 0; i < result_.declarations.size(); ++i)
          index_.emplace(declaration_name(result_.declarations[i]), i);
        collect_dependencies();
        break_cycles();
      }

      std::vector<cpp_file>
      run() const {
        auto order = order_declarations();
        std::vector<lowered_group> groups;
        for (auto i : order)
          groups.push_back(lower(i));
        drop_equality(order, groups);

        std::vector<cpp_file> files;
        const std::string header_filename = options_.file_stem + ".hpp";

        if (options_.mode == output_mode::header_only) {
          cpp_namespace ns;
          ns.name = options_.cpp_namespace;
          std::set<std::string> includes;
          std::set<std::string> declared;
          for (auto& g : groups) {
            for (const auto& fwd : g.forward)
              if (declared.insert(fwd).second)
                ns.declarations.push_back(cpp_forward_decl{fwd});
            declared.insert(g.name);
            includes.insert(g.includes.begin(), g.includes.end());
            for (auto& d : g.decls)
              ns.declarations.push_back(std::move(d));
          }

          cpp_file file;
          file.filename = header_filename;
          file.header_comment = header_comment();
          for (const auto& inc : includes)
            file.includes.push_back({inc});
          file.namespaces.push_back(std::move(ns));
          files.push_back(std::move(file));
          return files;
        }

        // One header per declaration plus an umbrella header
        cpp_file umbrella;
        umbrella.filename = header_filename;
        umbrella.header_comment = header_comment();

        for (auto& g : groups) {
          cpp_file type_file;
          type_file.filename = per_type_filename(g.name);
          type_file.header_comment = header_comment();
          for (const auto& inc : g.includes)
            type_file.includes.push_back({inc});
          for (auto need : g.needs) {
            const auto& name = declaration_name(result_.declarations[need]);
            if (name != g.name)
              type_file.includes.push_back(
                  {"\"" + per_type_filename(name) + "\""});
          }

          cpp_namespace type_ns;
          type_ns.name = options_.cpp_namespace;
          for (const auto& fwd : g.forward)
            if (fwd != g.name) type_ns.declarations.push_back(cpp_forward_decl{fwd});
          for (auto& d : g.decls)
            type_ns.declarations.push_back(std::move(d));
          type_file.namespaces.push_back(std::move(type_ns));

          umbrella.includes.push_back({"\"" + type_file.filename + "\""});
          files.push_back(std::move(type_file));
        }

        files.push_back(std::move(umbrella));
        return files;
      }
    };

  } // namespace

  codegen::codegen(const synthesis_result& result, const type_map& types,
                   codegen_options options)
      : result_(result), types_(types), options_(std::move(options)) {}

  std::vector<cpp_file>
  codegen::generate() const {
    lowering run(result_, types_, options_);
    return run.run();
  }

} // namespace oag
