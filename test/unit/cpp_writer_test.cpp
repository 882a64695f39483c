#include <oag/cpp_code.hpp>
#include <oag/cpp_writer.hpp>

#include <catch2/catch.hpp>

#include <string>

using namespace oag;

static const cpp_writer writer;

static cpp_file
file_with(cpp_decl decl) {
  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"api", {std::move(decl)}});
  return file;
}

// TDD step 1: Empty file -> #pragma once + trailing newline
TEST_CASE("empty file produces pragma once", "[cpp_writer]") {
  cpp_file file;
  file.filename = "empty.hpp";

  CHECK(writer.write(file) == "#pragma once\n");
}

// TDD step 2: Header comment sits above #pragma once
TEST_CASE("header comment", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.header_comment = {"Generated by oag. Do not edit.", ""};

  CHECK(writer.write(file) ==
        "// Generated by oag. Do not edit.\n//\n\n#pragma once\n");
}

// TDD step 3: System includes come before local includes
TEST_CASE("system and local includes", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.includes.push_back({"\"schemas_pet.hpp\""});
  file.includes.push_back({"<string>"});
  file.includes.push_back({"<vector>"});

  CHECK(writer.write(file) == "#pragma once\n\n"
                              "#include <string>\n"
                              "#include <vector>\n"
                              "\n"
                              "#include \"schemas_pet.hpp\"\n");
}

// TDD step 4: Empty struct without equality
TEST_CASE("empty struct", "[cpp_writer]") {
  cpp_struct s;
  s.name = "Empty";
  s.generate_equality = false;

  auto expected = R"(#pragma once

namespace api {

struct Empty {};

} // namespace api
)";
  CHECK(writer.write(file_with(std::move(s))) == expected);
}

// TDD step 5: Struct with fields, defaults, comments and equality
TEST_CASE("struct with fields", "[cpp_writer]") {
  cpp_struct s;
  s.name = "Pet";
  s.fields.push_back({"std::string", "name", "", "", ""});
  s.fields.push_back({"std::int32_t", "age", "3", "", ""});
  s.fields.push_back(
      {"std::optional<std::string>", "petType", "", "json: \"pet_type\"", ""});

  auto expected = R"(#pragma once

namespace api {

struct Pet {
  std::string name;
  std::int32_t age = 3;
  std::optional<std::string> petType; // json: "pet_type"

  bool operator==(const Pet&) const = default;
};

} // namespace api
)";
  CHECK(writer.write(file_with(std::move(s))) == expected);
}

TEST_CASE("empty struct with equality", "[cpp_writer]") {
  cpp_struct s;
  s.name = "Marker";

  auto expected = R"(#pragma once

namespace api {

struct Marker {
  bool operator==(const Marker&) const = default;
};

} // namespace api
)";
  CHECK(writer.write(file_with(std::move(s))) == expected);
}

// TDD step 6: Derived struct with documentation
TEST_CASE("struct with base and doc comments", "[cpp_writer]") {
  cpp_struct s;
  s.name = "Cat";
  s.base = "Pet";
  s.generate_equality = false;
  s.doc = "A cat.\n\nLikes boxes.";
  s.fields.push_back({"bool", "indoor", "true", "", "Lives inside."});

  auto expected = R"(#pragma once

namespace api {

/// A cat.
///
/// Likes boxes.
struct Cat : Pet {
  /// Lives inside.
  bool indoor = true;
};

} // namespace api
)";
  CHECK(writer.write(file_with(std::move(s))) == expected);
}

// TDD step 7: Enumeration with conversion functions
TEST_CASE("string enumeration", "[cpp_writer]") {
  cpp_enum e;
  e.name = "Status";
  e.values.push_back({"Active", "\"active\"", ""});
  e.values.push_back({"Inactive", "\"inactive\"", ""});

  auto expected = R"(#pragma once

namespace api {

enum class Status {
  Active,
  Inactive,
};

inline std::string_view to_string(Status v) {
  switch (v) {
  case Status::Active: return "active";
  case Status::Inactive: return "inactive";
  }
  return "";
}

inline Status Status_from_string(std::string_view s) {
  if (s == "active") return Status::Active;
  if (s == "inactive") return Status::Inactive;
  throw std::invalid_argument(std::string("invalid Status value: ") + std::string(s));
}

} // namespace api
)";
  CHECK(writer.write(file_with(std::move(e))) == expected);
}

TEST_CASE("integer enumeration with explicit values", "[cpp_writer]") {
  cpp_enum e;
  e.name = "Level";
  e.underlying_type = "std::int32_t";
  e.values.push_back({"_1", "\"1\"", "1"});
  e.values.push_back({"Minus2", "\"-2\"", "-2"});

  auto result = writer.write(file_with(std::move(e)));
  CHECK(result.find("enum class Level : std::int32_t {\n"
                    "  _1 = 1,\n"
                    "  Minus2 = -2,\n"
                    "};\n") != std::string::npos);
  CHECK(result.find("  case Level::Minus2: return \"-2\";\n") !=
        std::string::npos);
  CHECK(result.find("  if (s == \"1\") return Level::_1;\n") !=
        std::string::npos);
}

// TDD step 8: Aliases, forward declarations, constants and functions
TEST_CASE("type alias", "[cpp_writer]") {
  cpp_type_alias a{"Tags", "std::vector<std::string>", "Free-form tags."};

  auto expected = R"(#pragma once

namespace api {

/// Free-form tags.
using Tags = std::vector<std::string>;

} // namespace api
)";
  CHECK(writer.write(file_with(std::move(a))) == expected);
}

TEST_CASE("forward declaration and constant", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back(
      {"api",
       {cpp_forward_decl{"Node"},
        cpp_constant{"std::string_view", "Pet_discriminator_property",
                     "\"petType\""}}});

  auto expected = R"(#pragma once

namespace api {

struct Node;

inline constexpr std::string_view Pet_discriminator_property = "petType";

} // namespace api
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("inline function", "[cpp_writer]") {
  cpp_function f{"std::string_view", "Pet_discriminator_value", "const Pet& v",
                 "  switch (v.index()) {\n  case 0: return \"cat\";\n  }\n"
                 "  return \"\";\n"};

  auto expected = R"(#pragma once

namespace api {

inline std::string_view Pet_discriminator_value(const Pet& v) {
  switch (v.index()) {
  case 0: return "cat";
  }
  return "";
}

} // namespace api
)";
  CHECK(writer.write(file_with(std::move(f))) == expected);
}

// TDD step 9: Declarations outside any namespace
TEST_CASE("unnamed namespace writes declarations at file scope",
          "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"", {cpp_forward_decl{"Pet"}}});

  CHECK(writer.write(file) == "#pragma once\n\nstruct Pet;\n");
}

TEST_CASE("nested namespace name is written verbatim", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"acme::petstore", {cpp_forward_decl{"Pet"}}});

  auto expected = R"(#pragma once

namespace acme::petstore {

struct Pet;

} // namespace acme::petstore
)";
  CHECK(writer.write(file) == expected);
}
