#pragma once

#include <oag/schema.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace oag {

  struct named_schema {
    std::string name;
    schema_ptr schema;
  };

  struct unresolved_reference {
    std::string target;
    // Location of the reference, e.g. "Order/properties/items/items"
    std::string path;

    bool
    operator==(const unresolved_reference&) const = default;
  };

  // Named schemas in document order. Iteration order is insertion order and
  // drives every ordering decision downstream.
  class schema_set {
    std::vector<named_schema> schemas_;
    std::unordered_map<std::string, std::size_t> index_;

  public:
    schema_set() = default;

    void
    add(std::string name, schema_ptr schema);

    void
    add(std::string name, schema_node node) {
      add(std::move(name), make_schema(std::move(node)));
    }

    const schema_node*
    find(const std::string& name) const;

    bool
    contains(const std::string& name) const {
      return index_.count(name) != 0;
    }

    const std::vector<named_schema>&
    schemas() const {
      return schemas_;
    }

    std::size_t
    size() const {
      return schemas_.size();
    }

    bool
    empty() const {
      return schemas_.empty();
    }

    std::vector<unresolved_reference>
    unresolved_references() const;
  };

} // namespace oag
