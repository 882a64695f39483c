#pragma once

#include <string>

namespace oag {

  enum class diagnostic_kind {
    composition_cycle,
    unresolved_discriminator_target,
    unresolved_reference,
    depth_exceeded,
    unsupported_union_member,
    empty_enumeration,
  };

  std::string
  to_string(diagnostic_kind kind);

  // A condition that was approximated rather than represented exactly.
  // Collected during synthesis; never thrown.
  struct diagnostic {
    diagnostic_kind kind;
    std::string subject;
    std::string message;

    bool
    operator==(const diagnostic&) const = default;
  };

  std::string
  format_diagnostic(const diagnostic& d);

} // namespace oag
