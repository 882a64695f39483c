#include <oag/diagnostic.hpp>

namespace oag {

  std::string
  to_string(diagnostic_kind kind) {
    switch (kind) {
      case diagnostic_kind::composition_cycle:
        return "composition_cycle";
      case diagnostic_kind::unresolved_discriminator_target:
        return "unresolved_discriminator_target";
      case diagnostic_kind::unresolved_reference:
        return "unresolved_reference";
      case diagnostic_kind::depth_exceeded:
        return "depth_exceeded";
      case diagnostic_kind::unsupported_union_member:
        return "unsupported_union_member";
      case diagnostic_kind::empty_enumeration:
        return "empty_enumeration";
    }
    return "unknown";
  }

  std::string
  format_diagnostic(const diagnostic& d) {
    return to_string(d.kind) + ": " + d.subject + ": " + d.message;
  }

} // namespace oag
