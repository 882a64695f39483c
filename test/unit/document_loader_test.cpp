#include <oag/document_loader.hpp>

#include <catch2/catch.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>

using namespace oag;

#define STRINGIFY_IMPL(x) #x
#define STRINGIFY(x) STRINGIFY_IMPL(x)

static const std::string petstore_yaml = R"(
openapi: 3.0.3
info:
  title: Petstore
  version: "1.0"
components:
  schemas:
    Pet:
      type: object
      required: [name]
      properties:
        name:
          type: string
        tag:
          type: string
          nullable: true
        status:
          type: string
          enum: [available, sold]
          default: available
    Pets:
      type: array
      items:
        $ref: '#/components/schemas/Pet'
)";

// ---------------------------------------------------------------------------
// reference names
// ---------------------------------------------------------------------------

TEST_CASE("reference_name keeps the last segment", "[document_loader]") {
  CHECK(reference_name("#/components/schemas/Pet") == "Pet");
  CHECK(reference_name("#/$defs/Node") == "Node");
  CHECK(reference_name("Pet") == "Pet");
}

TEST_CASE("reference_name unescapes JSON pointer sequences",
          "[document_loader]") {
  CHECK(reference_name("#/components/schemas/a~1b") == "a/b");
  CHECK(reference_name("#/components/schemas/a~0b") == "a~b");
}

// ---------------------------------------------------------------------------
// YAML and JSON documents
// ---------------------------------------------------------------------------

TEST_CASE("YAML document schemas keep document order", "[document_loader]") {
  auto schemas = load_document(petstore_yaml);
  REQUIRE(schemas.size() == 2);
  CHECK(schemas.schemas()[0].name == "Pet");
  CHECK(schemas.schemas()[1].name == "Pets");

  const auto* pet = schemas.find("Pet");
  REQUIRE(pet != nullptr);
  CHECK(pet->kind == schema_kind::object);
  REQUIRE(pet->properties.size() == 3);
  CHECK(pet->properties[0].name == "name");
  CHECK(pet->properties[1].name == "tag");
  CHECK(pet->properties[2].name == "status");
  CHECK(pet->is_required("name"));
  CHECK_FALSE(pet->is_required("tag"));
}

TEST_CASE("nullable adds null to the kind set", "[document_loader]") {
  auto schemas = load_document(petstore_yaml);
  const auto* tag = schemas.find("Pet")->find_property("tag");
  REQUIRE(tag != nullptr);
  CHECK(tag->schema->is_nullable());
  CHECK(tag->schema->base_kind() == schema_kind::string);
}

TEST_CASE("enum values and defaults are read", "[document_loader]") {
  auto schemas = load_document(petstore_yaml);
  const auto& status = *schemas.find("Pet")->find_property("status")->schema;
  REQUIRE(status.enum_values.size() == 2);
  CHECK(status.enum_values[0] == "available");
  CHECK(status.enum_values[1] == "sold");
  REQUIRE(status.default_value.has_value());
  CHECK(*status.default_value == "available");
}

TEST_CASE("references are reduced to schema names", "[document_loader]") {
  auto schemas = load_document(petstore_yaml);
  const auto* pets = schemas.find("Pets");
  REQUIRE(pets != nullptr);
  CHECK(pets->kind == schema_kind::array);
  REQUIRE(pets->items != nullptr);
  CHECK(pets->items->ref == "Pet");
  CHECK(schemas.unresolved_references().empty());
}

TEST_CASE("YAML scalars are typed like JSON", "[document_loader]") {
  auto schemas = load_document(R"(
components:
  schemas:
    Limits:
      type: object
      properties:
        count: {type: integer, default: 10}
        ratio: {type: number, default: 0.5}
        enabled: {type: boolean, default: true}
        code: {type: string, default: "10"}
        nothing: {type: string, default: null}
)");
  const auto* limits = schemas.find("Limits");
  REQUIRE(limits != nullptr);
  CHECK(limits->find_property("count")->schema->default_value->is_number_integer());
  CHECK(*limits->find_property("count")->schema->default_value == 10);
  CHECK(limits->find_property("ratio")->schema->default_value->is_number_float());
  CHECK(*limits->find_property("enabled")->schema->default_value == true);
  // quoted scalars stay strings
  CHECK(*limits->find_property("code")->schema->default_value == "10");
  CHECK(limits->find_property("nothing")->schema->default_value->is_null());
}

TEST_CASE("JSON document with type arrays and const", "[document_loader]") {
  auto schemas = load_document(R"({
    "components": {"schemas": {
      "Id": {"type": ["string", "null"]},
      "Kind": {"const": "dog"},
      "Shape": {
        "oneOf": [{"$ref": "#/components/schemas/Id"}],
        "discriminator": {
          "propertyName": "kind",
          "mapping": {"id": "#/components/schemas/Id"}
        }
      }
    }}
  })");
  REQUIRE(schemas.size() == 3);

  const auto* id = schemas.find("Id");
  CHECK(id->is_nullable());
  CHECK(id->base_kind() == schema_kind::string);

  const auto* kind = schemas.find("Kind");
  REQUIRE(kind->enum_values.size() == 1);
  CHECK(kind->enum_values[0] == "dog");

  const auto* shape = schemas.find("Shape");
  REQUIRE(shape->one_of.size() == 1);
  REQUIRE(shape->discriminator.has_value());
  CHECK(shape->discriminator->property_name == "kind");
  REQUIRE(shape->discriminator->mapping.size() == 1);
  CHECK(shape->discriminator->mapping[0].first == "id");
  CHECK(shape->discriminator->mapping[0].second == "Id");
}

TEST_CASE("$defs and definitions are accepted", "[document_loader]") {
  auto defs = load_document(R"({"$defs": {"Node": {"type": "object"}}})");
  REQUIRE(defs.size() == 1);
  CHECK(defs.contains("Node"));

  auto definitions =
      load_document("definitions:\n  Leaf:\n    type: string\n");
  REQUIRE(definitions.size() == 1);
  CHECK(definitions.contains("Leaf"));
}

TEST_CASE("additionalProperties true and false", "[document_loader]") {
  auto schemas = load_document(R"({"$defs": {
    "Open": {"type": "object", "additionalProperties": true},
    "Closed": {"type": "object", "additionalProperties": false},
    "Counts": {"type": "object", "additionalProperties": {"type": "integer"}}
  }})");
  CHECK(schemas.find("Open")->additional_properties != nullptr);
  CHECK(schemas.find("Closed")->additional_properties == nullptr);
  REQUIRE(schemas.find("Counts")->additional_properties != nullptr);
  CHECK(schemas.find("Counts")->additional_properties->kind ==
        schema_kind::integer);
}

TEST_CASE("composition lists are read in order", "[document_loader]") {
  auto schemas = load_document(R"({"$defs": {
    "A": {"type": "object"},
    "B": {"allOf": [{"$ref": "#/$defs/A"}, {"properties": {"x": {"type": "string"}}}]},
    "C": {"anyOf": [{"type": "string"}, {"type": "integer"}]}
  }})");
  const auto* b = schemas.find("B");
  REQUIRE(b->all_of.size() == 2);
  CHECK(b->all_of[0]->ref == "A");
  CHECK(b->all_of[1]->properties.size() == 1);
  REQUIRE(schemas.find("C")->any_of.size() == 2);
}

TEST_CASE("document without schemas is empty", "[document_loader]") {
  CHECK(load_document("openapi: 3.1.0\ninfo: {title: x}\n").empty());
  CHECK(load_document(R"({"components": {}})").empty());
}

// ---------------------------------------------------------------------------
// errors
// ---------------------------------------------------------------------------

TEST_CASE("malformed documents throw document_error", "[document_loader]") {
  CHECK_THROWS_AS(load_document("{not json", document_format::json),
                  document_error);
  CHECK_THROWS_AS(load_document("key: [unclosed", document_format::yaml),
                  document_error);
  CHECK_THROWS_AS(load_document("- a\n- b\n"), document_error);
}

TEST_CASE("malformed schemas throw document_error", "[document_loader]") {
  CHECK_THROWS_AS(load_document(R"({"$defs": {"X": {"type": "tuple"}}})"),
                  document_error);
  CHECK_THROWS_AS(load_document(R"({"$defs": {"X": {"$ref": 3}}})"),
                  document_error);
  CHECK_THROWS_AS(load_document(R"({"$defs": {"X": {"enum": "a"}}})"),
                  document_error);
  CHECK_THROWS_AS(load_document(R"({"$defs": {"X": 42}})"), document_error);
}

TEST_CASE("missing file throws runtime_error", "[document_loader]") {
  try {
    load_document_file("/nonexistent/openapi.yaml");
    FAIL("expected an exception");
  } catch (const document_error&) {
    FAIL("a missing file is not a parse error");
  } catch (const std::runtime_error& e) {
    CHECK(std::string(e.what()).find("cannot open file") != std::string::npos);
  }
}

TEST_CASE("load_document_file reads the fixture", "[document_loader]") {
  std::filesystem::path data = STRINGIFY(OAG_TEST_DATA_DIR);
  auto schemas = load_document_file(data / "petstore.yaml");
  CHECK(schemas.contains("Pet"));
  CHECK(schemas.contains("Category"));
}
