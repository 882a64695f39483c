#include <oag/naming.hpp>

#include <algorithm>
#include <unordered_map>

namespace oag {

  namespace {

    bool
    is_upper(char c) {
      return c >= 'A' && c <= 'Z';
    }

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    bool
    is_alnum(char c) {
      return is_upper(c) || is_lower(c) || is_digit(c);
    }

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
             c == '\v';
    }

    bool
    is_separator(char c) {
      return c == '-' || c == '_' || c == '.' || is_space(c);
    }

    char
    to_lower(char c) {
      if (is_upper(c)) return static_cast<char>(c - 'A' + 'a');
      return c;
    }

    char
    to_upper(char c) {
      if (is_lower(c)) return static_cast<char>(c - 'a' + 'A');
      return c;
    }

    const std::unordered_map<char, std::string>&
    symbol_words() {
      static const std::unordered_map<char, std::string> words = {
          {'_', "Underscore"}, {'-', "Dash"},      {'.', "Dot"},
          {'@', "At"},         {'#', "Hash"},      {'$', "Dollar"},
          {'%', "Percent"},    {'&', "And"},       {'+', "Plus"},
          {'~', "Tilde"},      {'!', "Bang"},      {'*', "Star"},
          {'/', "Slash"},      {'\\', "Backslash"}, {':', "Colon"},
          {'^', "Caret"},      {'|', "Pipe"},
      };
      return words;
    }

    // "+1" reads as "Plus1", "-1" as "Minus1"; a dash between words stays a
    // separator.
    std::string
    spell_signs(std::string_view raw) {
      std::string out;
      out.reserve(raw.size() + 8);
      for (std::size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '+') {
          out += " Plus ";
          continue;
        }
        if (c == '-' && (i == 0 || is_space(raw[i - 1])) &&
            i + 1 < raw.size() && is_digit(raw[i + 1])) {
          out += " Minus ";
          continue;
        }
        out += c;
      }
      return out;
    }

    std::vector<std::string>
    split_words(std::string_view raw) {
      std::string cleaned;
      for (char c : spell_signs(raw))
        if (is_alnum(c) || is_separator(c)) cleaned += c;

      std::vector<std::string> words;
      std::string current;
      for (std::size_t i = 0; i < cleaned.size(); ++i) {
        char c = cleaned[i];
        if (is_separator(c)) {
          if (!current.empty()) words.push_back(std::move(current));
          current.clear();
          continue;
        }
        if (is_upper(c) && !current.empty() && is_lower(current.back())) {
          words.push_back(std::move(current));
          current.clear();
        }
        current += c;
      }
      if (!current.empty()) words.push_back(std::move(current));
      return words;
    }

    bool
    all_upper(const std::string& word) {
      return std::all_of(word.begin(), word.end(), is_upper);
    }

    // An all-upper word keeps its capitals unless the name was split on
    // separators ("USER_STATUS" -> "UserStatus", "ABC" -> "ABC"). Applying a
    // style to its own output must not change it.
    std::string
    pascal_word(const std::string& word, bool separated) {
      std::string out = word;
      if (separated && all_upper(word))
        std::transform(out.begin() + 1, out.end(), out.begin() + 1, to_lower);
      out[0] = to_upper(out[0]);
      return out;
    }

    bool
    has_separator(std::string_view raw) {
      auto spelled = spell_signs(raw);
      return std::any_of(spelled.begin(), spelled.end(), is_separator);
    }

    // Lowercase a leading capital run, keeping the last capital when it
    // starts the next word ("APIResponse" -> "apiResponse").
    std::string
    lower_leading(std::string word) {
      std::size_t run = 0;
      while (run < word.size() && is_upper(word[run])) ++run;
      std::size_t stop = run;
      if (run > 1 && run < word.size() && is_lower(word[run])) stop = run - 1;
      if (stop == 0) stop = 1;
      for (std::size_t i = 0; i < stop && i < word.size(); ++i)
        word[i] = to_lower(word[i]);
      return word;
    }

    std::string
    snake_word(std::string_view name) {
      std::string result;
      result.reserve(name.size() + 4);

      for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (is_upper(c)) {
          // camelCase boundary, or the 'P' in "HTMLParser"
          if (!result.empty() && result.back() != '_') {
            bool prev_lower = is_lower(name[i - 1]);
            bool prev_upper = is_upper(name[i - 1]);
            bool next_lower = (i + 1 < name.size()) && is_lower(name[i + 1]);

            if (prev_lower || (prev_upper && next_lower)) result += '_';
          }
          result += to_lower(c);
        } else {
          result += c;
        }
      }
      return result;
    }

    std::string
    digit_guard(std::string identifier) {
      if (!identifier.empty() && is_digit(identifier[0]))
        identifier.insert(identifier.begin(), '_');
      return identifier;
    }

    std::size_t
    pick_winner(const std::vector<std::string>& raws,
                const std::string& canonical) {
      std::size_t best = 0;
      int best_score = naturalness_score(raws[0], canonical);
      for (std::size_t i = 1; i < raws.size(); ++i) {
        int score = naturalness_score(raws[i], canonical);
        if (score < best_score) {
          best = i;
          best_score = score;
        }
      }
      return best;
    }

  } // namespace

  const std::vector<std::string>&
  cpp_keywords() {
    static const std::vector<std::string> keywords = {
        "alignas",       "alignof",     "and",
        "and_eq",        "asm",         "auto",
        "bitand",        "bitor",       "bool",
        "break",         "case",        "catch",
        "char",          "char8_t",     "char16_t",
        "char32_t",      "class",       "compl",
        "concept",       "const",       "consteval",
        "constexpr",     "constinit",   "const_cast",
        "continue",      "co_await",    "co_return",
        "co_yield",      "decltype",    "default",
        "delete",        "do",          "double",
        "dynamic_cast",  "else",        "enum",
        "explicit",      "export",      "extern",
        "false",         "float",       "for",
        "friend",        "goto",        "if",
        "inline",        "int",         "long",
        "mutable",       "namespace",   "new",
        "noexcept",      "not",         "not_eq",
        "nullptr",       "operator",    "or",
        "or_eq",         "private",     "protected",
        "public",        "register",    "reinterpret_cast",
        "requires",      "return",      "short",
        "signed",        "sizeof",      "static",
        "static_assert", "static_cast", "struct",
        "switch",        "template",    "this",
        "thread_local",  "throw",       "true",
        "try",           "typedef",     "typeid",
        "typename",      "union",       "unsigned",
        "using",         "virtual",     "void",
        "volatile",      "wchar_t",     "while",
        "xor",           "xor_eq",
    };
    return keywords;
  }

  std::string
  to_snake_case(std::string_view name) {
    std::string result;
    for (const auto& word : split_words(name)) {
      if (!result.empty()) result += '_';
      result += snake_word(word);
    }
    return digit_guard(std::move(result));
  }

  std::string
  to_pascal_case(std::string_view name) {
    std::string result;
    bool separated = has_separator(name);
    for (const auto& word : split_words(name))
      result += pascal_word(word, separated);
    return digit_guard(std::move(result));
  }

  std::string
  to_camel_case(std::string_view name) {
    std::string result;
    bool separated = has_separator(name);
    for (const auto& word : split_words(name)) {
      if (result.empty())
        result += lower_leading(pascal_word(word, separated));
      else
        result += pascal_word(word, separated);
    }
    return digit_guard(std::move(result));
  }

  int
  naturalness_score(std::string_view raw, std::string_view canonical) {
    if (raw == canonical) return 0;
    if (raw.size() == canonical.size() &&
        std::equal(raw.begin(), raw.end(), canonical.begin(),
                   [](char a, char b) { return to_lower(a) == to_lower(b); }))
      return 1;
    auto symbols = std::count_if(raw.begin(), raw.end(),
                                 [](char c) { return !is_alnum(c); });
    if (symbols > 0) return 10 + static_cast<int>(symbols);
    return 2;
  }

  naming_convention
  detect_naming_convention(std::string_view raw) {
    if (raw.find('_') != std::string_view::npos)
      return naming_convention::snake_case;
    if (raw.find('-') != std::string_view::npos)
      return naming_convention::kebab_case;
    if (raw.find('.') != std::string_view::npos)
      return naming_convention::dot_notation;

    bool any_upper = std::any_of(raw.begin(), raw.end(), is_upper);
    bool any_lower = std::any_of(raw.begin(), raw.end(), is_lower);
    if (raw.empty()) return naming_convention::unknown;
    if (is_lower(raw[0]) && any_upper) return naming_convention::camel_case;
    if (is_upper(raw[0]) && any_lower) return naming_convention::pascal_case;
    if (!any_upper) return naming_convention::lowercase;
    return naming_convention::uppercase;
  }

  std::optional<std::string>
  convention_suffix(naming_convention convention) {
    switch (convention) {
      case naming_convention::snake_case:
        return "SnakeCase";
      case naming_convention::kebab_case:
        return "KebabCase";
      case naming_convention::dot_notation:
        return "DotNotation";
      case naming_convention::camel_case:
        return "CamelCase";
      case naming_convention::pascal_case:
        return "PascalCase";
      case naming_convention::lowercase:
        return "Lowercase";
      case naming_convention::uppercase:
        return "Uppercase";
      case naming_convention::unknown:
        break;
    }
    return std::nullopt;
  }

  std::optional<std::string>
  expand_leading_symbols(std::string_view raw) {
    const auto& words = symbol_words();
    std::string out;
    bool expanded = false;
    std::size_t i = 0;
    for (; i < raw.size() && !is_alnum(raw[i]); ++i) {
      auto it = words.find(raw[i]);
      if (it == words.end()) continue;
      out += it->second;
      out += ' ';
      expanded = true;
    }
    if (!expanded) return std::nullopt;
    out += raw.substr(i);
    return out;
  }

  std::string
  expand_all_symbols(std::string_view raw) {
    const auto& words = symbol_words();
    std::string out;
    for (char c : raw) {
      if (is_alnum(c) || is_space(c)) {
        out += c;
        continue;
      }
      auto it = words.find(c);
      if (it == words.end()) {
        out += ' ';
        continue;
      }
      out += ' ';
      out += it->second;
      out += ' ';
    }
    return out;
  }

  // -- name_registry ------------------------------------------------------

  name_registry::name_registry(naming_options options)
      : options_(std::move(options)),
        reserved_(options_.reserved_words.begin(),
                  options_.reserved_words.end()),
        declarations_(*this, "UnknownType") {}

  std::string
  name_registry::escape(std::string identifier) const {
    if (reserved_.count(identifier)) identifier += '_';
    return identifier;
  }

  std::string
  name_registry::canonicalize(std::string_view raw) const {
    if (auto slash = raw.rfind('/'); slash != std::string_view::npos)
      raw = raw.substr(slash + 1);

    std::string styled;
    switch (options_.style) {
      case naming_style::pascal_case:
        styled = to_pascal_case(raw);
        break;
      case naming_style::camel_case:
        styled = to_camel_case(raw);
        break;
      case naming_style::snake_case:
        styled = to_snake_case(raw);
        break;
    }
    if (styled.empty()) return styled;
    return escape(std::move(styled));
  }

  collision_resolution
  name_registry::resolve_collision(const std::vector<std::string>& group,
                                   const std::set<std::string>& used) const {
    if (group.empty())
      throw std::invalid_argument("naming: empty collision group");

    collision_resolution result;
    result.canonical_name = canonicalize(group.front());

    auto taken = used;
    std::size_t winner = group.size();
    if (!taken.count(result.canonical_name)) {
      winner = pick_winner(group, result.canonical_name);
      result.winner = group[winner];
      taken.insert(result.canonical_name);
    }

    for (std::size_t i = 0; i < group.size(); ++i) {
      if (i == winner) continue;
      auto name = differentiate(group[i], result.canonical_name, taken);
      taken.insert(name);
      result.others.emplace_back(group[i], std::move(name));
    }
    return result;
  }

  std::string
  name_registry::differentiate(std::string_view raw,
                               const std::string& canonical,
                               const std::set<std::string>& used) const {
    auto acceptable = [&](const std::string& candidate) {
      return !candidate.empty() && candidate != canonical &&
             !used.count(candidate);
    };

    if (auto expanded = expand_leading_symbols(raw)) {
      auto candidate = canonicalize(*expanded);
      if (acceptable(candidate)) return candidate;
    }

    auto expanded = expand_all_symbols(raw);
    if (expanded != raw) {
      auto candidate = canonicalize(expanded);
      if (acceptable(candidate)) return candidate;
    }

    std::string base = canonical;
    if (!base.empty() && base.back() == '_' &&
        reserved_.count(base.substr(0, base.size() - 1)))
      base.pop_back();

    if (auto suffix = convention_suffix(detect_naming_convention(raw))) {
      std::string candidate = options_.style == naming_style::snake_case
                                  ? base + "_" + to_snake_case(*suffix)
                                  : base + *suffix;
      candidate = escape(std::move(candidate));
      if (acceptable(candidate)) return candidate;
    }

    for (std::size_t n = 2; n <= options_.max_numeric_suffix; ++n) {
      auto candidate = escape(base + std::to_string(n));
      if (acceptable(candidate)) return candidate;
    }

    throw name_exhaustion_error("naming: no free name for '" +
                                std::string(raw) + "' (canonical '" +
                                canonical + "')");
  }

  // -- name_scope ---------------------------------------------------------

  name_scope::name_scope(const name_registry& registry, std::string fallback,
                         std::string enclosing)
      : registry_(&registry), fallback_(std::move(fallback)),
        enclosing_(std::move(enclosing)) {}

  void
  name_scope::reserve(const std::string& name, const std::string& raw) {
    origins_[name].push_back(raw);
  }

  std::set<std::string>
  name_scope::used_names() const {
    std::set<std::string> names;
    for (const auto& [name, raws] : origins_) names.insert(name);
    return names;
  }

  std::string
  name_scope::canonical(std::string_view raw) const {
    auto name = registry_->canonicalize(raw);
    if (name.empty()) name = registry_->canonicalize(fallback_);
    if (!enclosing_.empty() && name == enclosing_)
      name += registry_->options().style == naming_style::snake_case
                  ? "_value"
                  : "Value";
    return name;
  }

  std::vector<std::string>
  name_scope::allocate(const std::vector<std::string>& raw_names) {
    std::vector<std::string> result(raw_names.size());
    std::vector<std::string> canon;
    canon.reserve(raw_names.size());

    // canonical -> indices, in order of first appearance
    std::vector<std::pair<std::string, std::vector<std::size_t>>> groups;
    std::unordered_map<std::string, std::size_t> group_index;
    for (std::size_t i = 0; i < raw_names.size(); ++i) {
      canon.push_back(canonical(raw_names[i]));
      auto [it, inserted] = group_index.emplace(canon.back(), groups.size());
      if (inserted) groups.push_back({canon.back(), {}});
      groups[it->second].second.push_back(i);
    }

    auto used = used_names();
    std::vector<bool> assigned(raw_names.size(), false);

    // Every winner is reserved before any differentiation so that a
    // differentiated name never takes another group's canonical name.
    for (const auto& [name, indices] : groups) {
      if (used.count(name)) continue;
      std::vector<std::string> raws;
      for (auto i : indices) raws.push_back(raw_names[i]);
      auto winner = indices[pick_winner(raws, name)];
      result[winner] = name;
      assigned[winner] = true;
      used.insert(name);
    }

    for (const auto& [name, indices] : groups) {
      for (auto i : indices) {
        if (assigned[i]) continue;
        result[i] = registry_->differentiate(raw_names[i], name, used);
        used.insert(result[i]);
      }
    }

    for (std::size_t i = 0; i < raw_names.size(); ++i)
      origins_[result[i]].push_back(raw_names[i]);
    return result;
  }

  std::string
  name_scope::allocate(const std::string& raw_name) {
    return allocate(std::vector<std::string>{raw_name}).front();
  }

} // namespace oag
