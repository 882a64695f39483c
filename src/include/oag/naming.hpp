#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace oag {

  enum class naming_style { pascal_case, camel_case, snake_case };

  enum class naming_convention {
    snake_case,
    kebab_case,
    dot_notation,
    camel_case,
    pascal_case,
    lowercase,
    uppercase,
    unknown,
  };

  const std::vector<std::string>&
  cpp_keywords();

  struct naming_options {
    naming_style style = naming_style::pascal_case;
    std::vector<std::string> reserved_words = cpp_keywords();
    std::size_t max_numeric_suffix = 100000;
  };

  class name_exhaustion_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  std::string
  to_snake_case(std::string_view name);

  std::string
  to_pascal_case(std::string_view name);

  std::string
  to_camel_case(std::string_view name);

  // 0 when raw already equals its canonical form, 1 for a case-only
  // difference, 10 + (number of symbols) when raw contains symbols, 2 for any
  // other transformation.
  int
  naturalness_score(std::string_view raw, std::string_view canonical);

  naming_convention
  detect_naming_convention(std::string_view raw);

  // Word appended by the naming-style differentiation strategy
  // ("SnakeCase", "Lowercase", ...); nullopt for naming_convention::unknown.
  std::optional<std::string>
  convention_suffix(naming_convention convention);

  // Replace the leading run of symbols with descriptive words. nullopt when
  // the name has no leading symbol with a known word.
  std::optional<std::string>
  expand_leading_symbols(std::string_view raw);

  std::string
  expand_all_symbols(std::string_view raw);

  struct collision_resolution {
    std::string canonical_name;
    // Raw name keeping canonical_name; empty when the canonical name was
    // already taken and every member had to be differentiated.
    std::string winner;
    std::vector<std::pair<std::string, std::string>> others;
  };

  class name_registry;

  // One naming namespace: the declarations of a run, the members of one
  // aggregate, or the members of one enumeration.
  class name_scope {
    const name_registry* registry_;
    std::string fallback_;
    std::string enclosing_;
    // allocated name -> raw names it was allocated for
    std::map<std::string, std::vector<std::string>> origins_;

  public:
    name_scope(const name_registry& registry, std::string fallback,
               std::string enclosing = {});

    // Mark a name as taken without going through collision resolution.
    void
    reserve(const std::string& name, const std::string& raw);

    bool
    contains(const std::string& name) const {
      return origins_.count(name) != 0;
    }

    std::set<std::string>
    used_names() const;

    // Canonical form of raw in this scope (fallback and enclosing-name rules
    // applied), without allocating it.
    std::string
    canonical(std::string_view raw) const;

    // Allocate names for a batch of raw names. Returns one name per input, in
    // input order. Colliding raw names are resolved by naturalness.
    std::vector<std::string>
    allocate(const std::vector<std::string>& raw_names);

    std::string
    allocate(const std::string& raw_name);

    const std::map<std::string, std::vector<std::string>>&
    allocations() const {
      return origins_;
    }
  };

  // Per-run naming state. Not copyable: scopes point back at the registry.
  class name_registry {
    naming_options options_;
    std::unordered_set<std::string> reserved_;
    name_scope declarations_;

  public:
    explicit name_registry(naming_options options = {});

    name_registry(const name_registry&) = delete;
    name_registry&
    operator=(const name_registry&) = delete;

    const naming_options&
    options() const {
      return options_;
    }

    bool
    is_reserved(const std::string& name) const {
      return reserved_.count(name) != 0;
    }

    // Deterministic conversion of a raw schema or property name into an
    // identifier in the configured style. Returns the empty string when
    // nothing of the name survives.
    std::string
    canonicalize(std::string_view raw) const;

    std::string
    escape(std::string identifier) const;

    // Resolve a group of raw names sharing one canonical form. `used` holds
    // the names already taken in the target scope; it is not modified.
    collision_resolution
    resolve_collision(const std::vector<std::string>& group,
                      const std::set<std::string>& used) const;

    // Differentiated name for raw whose canonical form collided. The result
    // is neither in `used` nor equal to canonical.
    std::string
    differentiate(std::string_view raw, const std::string& canonical,
                  const std::set<std::string>& used) const;

    name_scope&
    declarations() {
      return declarations_;
    }

    const name_scope&
    declarations() const {
      return declarations_;
    }

    name_scope
    make_scope(std::string fallback, std::string enclosing = {}) const {
      return name_scope(*this, std::move(fallback), std::move(enclosing));
    }
  };

} // namespace oag
