#pragma once

#include <oag/naming.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace oag {

  // Engine configuration, constant for one generation run.
  struct generator_options {
    naming_style naming = naming_style::pascal_case;
    bool mutable_collections = false;
    bool mutable_maps = false;
    // An optional member with a non-null default is not wrapped nullable.
    bool default_non_nullable = true;
    // Render schema defaults into member initializers; when off, defaulted
    // members get the placeholder expression instead.
    bool propagate_defaults = true;
    std::vector<std::string> reserved_words = cpp_keywords();
    std::size_t max_composition_depth = 64;
    std::size_t max_numeric_suffix = 100000;

    naming_options
    to_naming_options() const {
      return {naming, reserved_words, max_numeric_suffix};
    }
  };

  naming_style
  parse_naming_style(const std::string& text);

} // namespace oag
