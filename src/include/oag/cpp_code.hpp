#pragma once

#include <string>
#include <variant>
#include <vector>

namespace oag {

  struct cpp_include {
    std::string path;

    bool
    operator==(const cpp_include&) const = default;
  };

  struct cpp_enumerator {
    std::string name;
    // Text produced by to_string and accepted by _from_string
    std::string wire_value;
    // Explicit underlying value; empty for string enumerations
    std::string value;

    bool
    operator==(const cpp_enumerator&) const = default;
  };

  struct cpp_enum {
    std::string name;
    std::string underlying_type;
    std::vector<cpp_enumerator> values;
    std::string doc;

    bool
    operator==(const cpp_enum&) const = default;
  };

  struct cpp_field {
    std::string type;
    std::string name;
    std::string default_value;
    std::string comment;
    std::string doc;

    bool
    operator==(const cpp_field&) const = default;
  };

  struct cpp_struct {
    std::string name;
    std::string base;
    std::vector<cpp_field> fields;
    bool generate_equality = true;
    std::string doc;

    bool
    operator==(const cpp_struct&) const = default;
  };

  struct cpp_type_alias {
    std::string name;
    std::string target;
    std::string doc;

    bool
    operator==(const cpp_type_alias&) const = default;
  };

  struct cpp_forward_decl {
    std::string name;

    bool
    operator==(const cpp_forward_decl&) const = default;
  };

  struct cpp_constant {
    std::string type;
    std::string name;
    std::string value;

    bool
    operator==(const cpp_constant&) const = default;
  };

  struct cpp_function {
    std::string return_type;
    std::string name;
    std::string parameters;
    std::string body;

    bool
    operator==(const cpp_function&) const = default;
  };

  using cpp_decl = std::variant<cpp_struct, cpp_enum, cpp_type_alias,
                                cpp_forward_decl, cpp_constant, cpp_function>;

  struct cpp_namespace {
    std::string name;
    std::vector<cpp_decl> declarations;

    bool
    operator==(const cpp_namespace&) const = default;
  };

  struct cpp_file {
    std::string filename;
    // Comment block placed above #pragma once, one entry per line
    std::vector<std::string> header_comment;
    std::vector<cpp_include> includes;
    std::vector<cpp_namespace> namespaces;

    bool
    operator==(const cpp_file&) const = default;
  };

} // namespace oag
