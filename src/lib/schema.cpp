#include <oag/schema.hpp>

#include <algorithm>

namespace oag {

  bool
  schema_node::is_required(const std::string& property) const {
    return std::find(required.begin(), required.end(), property) !=
           required.end();
  }

  const schema_property*
  schema_node::find_property(const std::string& property) const {
    for (const auto& p : properties) {
      if (p.name == property) return &p;
    }
    return nullptr;
  }

} // namespace oag
