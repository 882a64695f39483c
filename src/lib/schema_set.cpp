#include <oag/schema_set.hpp>

#include <stdexcept>
#include <string>

namespace oag {

  namespace {

    void
    collect_unresolved(const schema_set& set, const schema_node& node,
                       const std::string& path,
                       std::vector<unresolved_reference>& out) {
      if (node.is_reference()) {
        if (!set.contains(node.ref)) out.push_back({node.ref, path});
        return;
      }

      for (const auto& p : node.properties) {
        if (p.schema)
          collect_unresolved(set, *p.schema, path + "/properties/" + p.name,
                             out);
      }
      if (node.items) collect_unresolved(set, *node.items, path + "/items", out);
      if (node.additional_properties)
        collect_unresolved(set, *node.additional_properties,
                           path + "/additionalProperties", out);

      auto walk_list = [&](const std::vector<schema_ptr>& list,
                           const std::string& key) {
        for (std::size_t i = 0; i < list.size(); ++i) {
          if (list[i])
            collect_unresolved(set, *list[i],
                               path + "/" + key + "/" + std::to_string(i), out);
        }
      };
      walk_list(node.all_of, "allOf");
      walk_list(node.one_of, "oneOf");
      walk_list(node.any_of, "anyOf");

      if (node.discriminator) {
        for (const auto& [value, target] : node.discriminator->mapping) {
          if (!set.contains(target))
            out.push_back({target, path + "/discriminator/mapping/" + value});
        }
      }
    }

  } // namespace

  void
  schema_set::add(std::string name, schema_ptr schema) {
    if (!schema)
      throw std::invalid_argument("schema_set: null schema for '" + name + "'");
    if (index_.count(name))
      throw std::invalid_argument("schema_set: duplicate schema name '" + name +
                                  "'");
    index_.emplace(name, schemas_.size());
    schemas_.push_back({std::move(name), std::move(schema)});
  }

  const schema_node*
  schema_set::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return schemas_[it->second].schema.get();
  }

  std::vector<unresolved_reference>
  schema_set::unresolved_references() const {
    std::vector<unresolved_reference> result;
    for (const auto& s : schemas_)
      collect_unresolved(*this, *s.schema, s.name, result);
    return result;
  }

} // namespace oag
