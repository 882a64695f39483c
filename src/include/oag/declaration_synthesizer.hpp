#pragma once

#include <oag/declaration.hpp>
#include <oag/diagnostic.hpp>
#include <oag/generator_options.hpp>
#include <oag/naming.hpp>
#include <oag/schema_set.hpp>

#include <map>
#include <string>
#include <vector>

namespace oag {

  struct synthesis_result {
    // Document order: every top-level schema followed by the nested
    // declarations first discovered under it.
    std::vector<declaration> declarations;
    std::map<std::string, declaration_kind> index;
    std::vector<diagnostic> diagnostics;

    const declaration*
    find(const std::string& name) const;

    template <typename T>
    const T*
    find_as(const std::string& name) const {
      auto* decl = find(name);
      return decl ? std::get_if<T>(decl) : nullptr;
    }
  };

  class declaration_synthesizer {
    const schema_set& schemas_;
    generator_options options_;

  public:
    explicit declaration_synthesizer(const schema_set& schemas,
                                     generator_options options = {});
    explicit declaration_synthesizer(schema_set&&,
                                     generator_options = {}) = delete;

    // Synthesize with a fresh name registry.
    synthesis_result
    synthesize() const;

    // Synthesize into a caller-supplied registry, which may already hold
    // names that must not be handed out.
    synthesis_result
    synthesize(name_registry& registry) const;
  };

} // namespace oag
