#pragma once

#include <oag/declaration.hpp>
#include <oag/resolved_type.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace oag {

  // C++ string literal for text, with quotes.
  std::string
  cpp_string_literal(std::string_view text);

  class literal_renderer {
  public:
    using declaration_lookup =
        std::function<const declaration*(const std::string&)>;

  private:
    declaration_lookup lookup_;

    std::optional<expression>
    render_primitive(const nlohmann::json& value, primitive_kind kind,
                     const std::string& format) const;

    std::optional<expression>
    render_named(const nlohmann::json& value, const std::string& name) const;

  public:
    explicit literal_renderer(declaration_lookup lookup = {});

    // Expression for a schema default, or nullopt when the value has no
    // constant representation for the type. `format` is the schema's format
    // string, used to tell unrecognized string formats apart.
    std::optional<expression>
    render(const nlohmann::json& value, const resolved_type& type,
           const std::string& format = {}) const;

    static expression
    placeholder() {
      return {expression_kind::placeholder, "{}"};
    }
  };

} // namespace oag
