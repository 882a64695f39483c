#include <oag/declaration_synthesizer.hpp>
#include <oag/document_loader.hpp>
#include <oag/literal_renderer.hpp>

#include <catch2/catch.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace oag;

static synthesis_result
synthesize(const std::string& document, generator_options options = {}) {
  auto schemas = load_document(document);
  declaration_synthesizer synthesizer(schemas, std::move(options));
  return synthesizer.synthesize();
}

static std::vector<std::string>
names_of(const synthesis_result& result) {
  std::vector<std::string> names;
  for (const auto& d : result.declarations)
    names.push_back(declaration_name(d));
  return names;
}

static bool
has_diagnostic(const synthesis_result& result, diagnostic_kind kind,
               const std::string& subject) {
  for (const auto& d : result.diagnostics)
    if (d.kind == kind && d.subject == subject) return true;
  return false;
}

// ---------------------------------------------------------------------------
// inline enumerations
// ---------------------------------------------------------------------------

TEST_CASE("same property name with different values gives two enumerations",
          "[synthesizer][enum]") {
  auto result = synthesize(R"({"$defs": {
    "Order": {"type": "object", "properties": {
      "status": {"type": "string", "enum": ["pending", "shipped", "delivered"]}}},
    "User": {"type": "object", "properties": {
      "status": {"type": "string", "enum": ["active", "inactive"]}}}
  }})");

  CHECK(names_of(result) ==
        std::vector<std::string>{"Order", "Status", "User", "StatusLowercase"});

  auto* order_status = result.find_as<enumeration_decl>("Status");
  REQUIRE(order_status != nullptr);
  REQUIRE(order_status->members.size() == 3);
  CHECK(order_status->members[0].name == "Pending");
  CHECK(order_status->members[2].value == "delivered");

  auto* user_status = result.find_as<enumeration_decl>("StatusLowercase");
  REQUIRE(user_status != nullptr);
  REQUIRE(user_status->members.size() == 2);
  CHECK(user_status->members[0].name == "Active");

  auto* order = result.find_as<aggregate_decl>("Order");
  REQUIRE(order != nullptr);
  REQUIRE(order->find_key("status") != nullptr);
  CHECK(order->find_key("status")->type ==
        make_nullable(make_reference("Status")));

  auto* user = result.find_as<aggregate_decl>("User");
  REQUIRE(user != nullptr);
  CHECK(user->find_key("status")->type ==
        make_nullable(make_reference("StatusLowercase")));
}

TEST_CASE("identical inline enumerations are shared", "[synthesizer][enum]") {
  auto result = synthesize(R"({"$defs": {
    "Order": {"type": "object", "properties": {
      "status": {"type": "string", "enum": ["open", "closed"]}}},
    "Ticket": {"type": "object", "properties": {
      "status": {"type": "string", "enum": ["open", "closed"]}}}
  }})");

  CHECK(names_of(result) ==
        std::vector<std::string>{"Order", "Status", "Ticket"});
  CHECK(result.find_as<aggregate_decl>("Ticket")->find_key("status")->type ==
        make_nullable(make_reference("Status")));
}

TEST_CASE("inline enumeration collides with a top-level schema",
          "[synthesizer][enum]") {
  auto result = synthesize(R"({"$defs": {
    "Status": {"type": "string", "enum": ["up", "down"]},
    "Order": {"type": "object", "properties": {
      "status": {"type": "string", "enum": ["pending", "shipped"]}}}
  }})");

  CHECK(names_of(result) ==
        std::vector<std::string>{"Status", "Order", "StatusLowercase"});
  CHECK(result.index.at("StatusLowercase") == declaration_kind::enumeration);
}

TEST_CASE("inline enumerations on array items", "[synthesizer][enum]") {
  auto result = synthesize(R"({"$defs": {
    "Pet": {"type": "object", "properties": {
      "tags": {"type": "array", "items": {"type": "string", "enum": ["a", "b"]}}}}
  }})");

  REQUIRE(result.find_as<enumeration_decl>("Tags") != nullptr);
  CHECK(result.find_as<aggregate_decl>("Pet")->find_key("tags")->type ==
        make_nullable(make_collection(make_reference("Tags"), false)));
}

TEST_CASE("integer enumeration members", "[synthesizer][enum]") {
  auto result = synthesize(R"({"$defs": {
    "Code": {"type": "integer", "enum": [200, 404, 200]}
  }})");

  auto* code = result.find_as<enumeration_decl>("Code");
  REQUIRE(code != nullptr);
  CHECK(code->underlying == enum_underlying::integer);
  REQUIRE(code->members.size() == 2);
  CHECK(code->members[0].name == "_200");
  CHECK(code->members[1].name == "_404");
  CHECK(code->members[1].value == 404);
}

TEST_CASE("enumeration without representable values becomes an alias",
          "[synthesizer][enum]") {
  auto result = synthesize(R"({"$defs": {
    "Odd": {"type": "string", "enum": [1, 2]}
  }})");

  CHECK(result.index.at("Odd") == declaration_kind::type_alias);
  CHECK(has_diagnostic(result, diagnostic_kind::empty_enumeration, "Odd"));
}

// ---------------------------------------------------------------------------
// aggregates and inheritance
// ---------------------------------------------------------------------------

TEST_CASE("allOf with a reference establishes a base", "[synthesizer][allOf]") {
  auto result = synthesize(R"({"$defs": {
    "Pet": {"type": "object", "required": ["name"],
            "properties": {"name": {"type": "string"}}},
    "Cat": {"allOf": [
      {"$ref": "#/$defs/Pet"},
      {"type": "object", "required": ["indoor"], "properties": {
        "indoor": {"type": "boolean"},
        "declawed": {"type": "boolean"},
        "name": {"type": "string"}}}
    ]}
  }})");

  auto* cat = result.find_as<aggregate_decl>("Cat");
  REQUIRE(cat != nullptr);
  CHECK(cat->base == "Pet");
  REQUIRE(cat->members.size() == 2);

  CHECK(cat->members[0].original_key == "indoor");
  CHECK(cat->members[0].mandatory);
  CHECK(cat->members[0].type == make_primitive(primitive_kind::boolean));

  CHECK(cat->members[1].original_key == "declawed");
  CHECK_FALSE(cat->members[1].mandatory);
  CHECK(cat->members[1].type ==
        make_nullable(make_primitive(primitive_kind::boolean)));

  // name is inherited, not redeclared
  CHECK(cat->find_key("name") == nullptr);
}

TEST_CASE("further allOf references are flattened", "[synthesizer][allOf]") {
  auto result = synthesize(R"({"$defs": {
    "Pet": {"type": "object", "properties": {"name": {"type": "string"}}},
    "Tagged": {"type": "object", "properties": {"tag": {"type": "string"}}},
    "Dog": {"allOf": [
      {"$ref": "#/$defs/Pet"},
      {"$ref": "#/$defs/Tagged"},
      {"properties": {"bark": {"type": "string"}}}
    ]}
  }})");

  auto* dog = result.find_as<aggregate_decl>("Dog");
  REQUIRE(dog != nullptr);
  CHECK(dog->base == "Pet");
  REQUIRE(dog->members.size() == 2);
  CHECK(dog->members[0].original_key == "tag");
  CHECK(dog->members[1].original_key == "bark");
}

TEST_CASE("base chain cycle drops the closing edge", "[synthesizer][allOf]") {
  auto result = synthesize(R"({"$defs": {
    "A": {"allOf": [{"$ref": "#/$defs/B"},
                    {"properties": {"x": {"type": "string"}}}]},
    "B": {"allOf": [{"$ref": "#/$defs/A"},
                    {"properties": {"y": {"type": "string"}}}]}
  }})");

  auto* a = result.find_as<aggregate_decl>("A");
  auto* b = result.find_as<aggregate_decl>("B");
  REQUIRE(a != nullptr);
  REQUIRE(b != nullptr);
  CHECK(a->base == "B");
  CHECK(b->base.empty());
  REQUIRE(b->members.size() == 1);
  CHECK(b->members[0].original_key == "y");
  REQUIRE(a->members.size() == 1);
  CHECK(a->members[0].original_key == "x");
  CHECK(has_diagnostic(result, diagnostic_kind::composition_cycle, "B"));
}

TEST_CASE("colliding property names are differentiated",
          "[synthesizer][naming]") {
  auto result = synthesize(R"({"$defs": {
    "Account": {"type": "object", "properties": {
      "user_name": {"type": "string"},
      "userName": {"type": "string"},
      "@type": {"type": "string"}}}
  }})");

  auto* account = result.find_as<aggregate_decl>("Account");
  REQUIRE(account != nullptr);
  CHECK(account->find_key("userName")->name == "UserName");
  CHECK(account->find_key("user_name")->name == "UserUnderscoreName");
  CHECK(account->find_key("@type")->name == "Type");
}

TEST_CASE("member named like its aggregate", "[synthesizer][naming]") {
  auto result = synthesize(R"({"$defs": {
    "Pet": {"type": "object", "properties": {"pet": {"type": "string"}}}
  }})");
  CHECK(result.find_as<aggregate_decl>("Pet")->members[0].name == "PetValue");
}

TEST_CASE("inline objects become nested aggregates", "[synthesizer]") {
  auto result = synthesize(R"({"$defs": {
    "User": {"type": "object", "properties": {
      "address": {"type": "object", "properties": {
        "street": {"type": "string"}}},
      "id": {"type": "integer"}}}
  }})");

  CHECK(names_of(result) == std::vector<std::string>{"User", "UserAddress"});
  auto* user = result.find_as<aggregate_decl>("User");
  CHECK(user->find_key("address")->type ==
        make_nullable(make_reference("UserAddress")));
  auto* address = result.find_as<aggregate_decl>("UserAddress");
  REQUIRE(address != nullptr);
  CHECK(address->members[0].name == "Street");
}

TEST_CASE("properties with additionalProperties get extension data",
          "[synthesizer]") {
  auto result = synthesize(R"({"$defs": {
    "Bag": {"type": "object",
            "properties": {"id": {"type": "integer"}},
            "additionalProperties": {"type": "string"}},
    "Counts": {"type": "object",
               "additionalProperties": {"type": "integer"}},
    "Empty": {"type": "object"}
  }})");

  auto* bag = result.find_as<aggregate_decl>("Bag");
  REQUIRE(bag != nullptr);
  REQUIRE(bag->extension_data.has_value());
  CHECK(bag->extension_data->name == "AdditionalProperties");
  CHECK(bag->extension_data->type ==
        make_map(make_primitive(primitive_kind::string), false));

  auto* counts = result.find_as<type_alias_decl>("Counts");
  REQUIRE(counts != nullptr);
  CHECK(counts->target ==
        make_map(make_primitive(primitive_kind::int32), false));

  auto* empty = result.find_as<aggregate_decl>("Empty");
  REQUIRE(empty != nullptr);
  CHECK(empty->members.empty());
  CHECK_FALSE(empty->extension_data.has_value());
}

// ---------------------------------------------------------------------------
// defaults
// ---------------------------------------------------------------------------

TEST_CASE("defaults are rendered onto members", "[synthesizer][default]") {
  const std::string doc = R"({"$defs": {
    "Settings": {"type": "object", "properties": {
      "retries": {"type": "integer", "default": 3},
      "mode": {"type": "string", "enum": ["fast", "safe"], "default": "safe"},
      "label": {"type": "string", "default": "say \"hi\""},
      "extra": {"type": "object", "default": {}}}}
  }})";

  auto result = synthesize(doc);
  auto* settings = result.find_as<aggregate_decl>("Settings");
  REQUIRE(settings != nullptr);

  const auto* retries = settings->find_key("retries");
  CHECK(retries->type == make_primitive(primitive_kind::int32));
  REQUIRE(retries->default_value.has_value());
  CHECK(retries->default_value->text == "3");

  const auto* mode = settings->find_key("mode");
  REQUIRE(mode->default_value.has_value());
  CHECK(mode->default_value->kind == expression_kind::enum_member);
  CHECK(mode->default_value->text == "Mode::Safe");

  CHECK(settings->find_key("label")->default_value->text ==
        "\"say \\\"hi\\\"\"");

  // no constant representation
  CHECK_FALSE(settings->find_key("extra")->default_value.has_value());

  generator_options off;
  off.propagate_defaults = false;
  auto placeholders = synthesize(doc, off);
  auto* plain = placeholders.find_as<aggregate_decl>("Settings");
  REQUIRE(plain->find_key("retries")->default_value.has_value());
  CHECK(*plain->find_key("retries")->default_value ==
        literal_renderer::placeholder());
  // members without a renderable default stay without one
  CHECK_FALSE(plain->find_key("extra")->default_value.has_value());
}

TEST_CASE("a default keeps an optional member non-nullable unless disabled",
          "[synthesizer][default]") {
  const std::string doc = R"({"$defs": {
    "Page": {"type": "object", "properties": {
      "size": {"type": "integer", "default": 20}}}
  }})";

  CHECK_FALSE(synthesize(doc)
                  .find_as<aggregate_decl>("Page")
                  ->members[0]
                  .type.is_nullable());

  generator_options keep;
  keep.default_non_nullable = false;
  CHECK(synthesize(doc, keep)
            .find_as<aggregate_decl>("Page")
            ->members[0]
            .type.is_nullable());
}

// ---------------------------------------------------------------------------
// unions
// ---------------------------------------------------------------------------

TEST_CASE("discriminated union variants follow the mapping",
          "[synthesizer][union]") {
  auto result = synthesize(R"({"$defs": {
    "Pet": {
      "oneOf": [{"$ref": "#/$defs/Cat"}, {"$ref": "#/$defs/Dog"}],
      "discriminator": {"propertyName": "petType",
                        "mapping": {"cat": "#/$defs/Cat"}}
    },
    "Cat": {"type": "object", "properties": {"purr": {"type": "boolean"}}},
    "Dog": {"type": "object", "properties": {"bark": {"type": "boolean"}}}
  }})");

  auto* pet = result.find_as<union_decl>("Pet");
  REQUIRE(pet != nullptr);
  CHECK_FALSE(pet->open);
  REQUIRE(pet->discriminator.has_value());
  CHECK(*pet->discriminator == "petType");
  CHECK(pet->variants == std::vector<union_variant>{{"Cat", "cat"},
                                                    {"Dog", "Dog"}});
  CHECK(result.index.at("Pet") == declaration_kind::discriminated_union);
}

TEST_CASE("union without discriminator is open", "[synthesizer][union]") {
  auto result = synthesize(R"({"$defs": {
    "Shape": {"anyOf": [{"$ref": "#/$defs/Circle"},
                        {"$ref": "#/$defs/Square"},
                        {"type": "null"}]},
    "Circle": {"type": "object", "properties": {"r": {"type": "number"}}},
    "Square": {"type": "object", "properties": {"side": {"type": "number"}}}
  }})");

  auto* shape = result.find_as<union_decl>("Shape");
  REQUIRE(shape != nullptr);
  CHECK(shape->open);
  CHECK_FALSE(shape->discriminator.has_value());
  CHECK(shape->variants ==
        std::vector<union_variant>{{"Circle", std::nullopt},
                                   {"Square", std::nullopt}});
}

TEST_CASE("unknown mapping targets and inline members are dropped",
          "[synthesizer][union]") {
  auto result = synthesize(R"({"$defs": {
    "Animal": {
      "oneOf": [{"$ref": "#/$defs/Cat"}, {"type": "string"}],
      "discriminator": {"propertyName": "kind",
                        "mapping": {"bird": "#/$defs/Bird",
                                    "cat": "#/$defs/Cat"}}
    },
    "Cat": {"type": "object", "properties": {"purr": {"type": "boolean"}}}
  }})");

  auto* animal = result.find_as<union_decl>("Animal");
  REQUIRE(animal != nullptr);
  CHECK(animal->variants == std::vector<union_variant>{{"Cat", "cat"}});
  CHECK(has_diagnostic(result, diagnostic_kind::unresolved_discriminator_target,
                       "Animal"));
  CHECK(has_diagnostic(result, diagnostic_kind::unsupported_union_member,
                       "Animal"));
}

TEST_CASE("inline discriminated union property is declared",
          "[synthesizer][union]") {
  auto result = synthesize(R"({"$defs": {
    "Owner": {"type": "object", "properties": {
      "pet": {"oneOf": [{"$ref": "#/$defs/Cat"}, {"$ref": "#/$defs/Dog"}],
              "discriminator": {"propertyName": "petType"}}}},
    "Cat": {"type": "object"},
    "Dog": {"type": "object"}
  }})");

  auto* pet = result.find_as<union_decl>("OwnerPet");
  REQUIRE(pet != nullptr);
  CHECK(pet->variants.size() == 2);
  CHECK(result.find_as<aggregate_decl>("Owner")->find_key("pet")->type ==
        make_nullable(make_reference("OwnerPet")));
}

// ---------------------------------------------------------------------------
// diagnostics and determinism
// ---------------------------------------------------------------------------

TEST_CASE("unresolved references are reported once", "[synthesizer]") {
  auto result = synthesize(R"({"$defs": {
    "Order": {"type": "object", "required": ["item", "backup"], "properties": {
      "item": {"$ref": "#/$defs/Item"},
      "backup": {"$ref": "#/$defs/Item"}}}
  }})");

  auto* order = result.find_as<aggregate_decl>("Order");
  CHECK(order->find_key("item")->type.is_opaque());
  REQUIRE(result.diagnostics.size() == 1);
  CHECK(result.diagnostics[0].kind == diagnostic_kind::unresolved_reference);
  CHECK(result.diagnostics[0].subject == "Item");
}

TEST_CASE("references use canonical declaration names", "[synthesizer]") {
  auto result = synthesize(R"({"$defs": {
    "pet_owner": {"type": "object", "properties": {"name": {"type": "string"}}},
    "Pets": {"type": "array", "items": {"$ref": "#/$defs/pet_owner"}}
  }})");

  CHECK(names_of(result) == std::vector<std::string>{"PetOwner", "Pets"});
  CHECK(result.find_as<type_alias_decl>("Pets")->target ==
        make_collection(make_reference("PetOwner"), false));
}

TEST_CASE("repeated runs produce the same names", "[synthesizer]") {
  const std::string doc = R"({"$defs": {
    "status": {"type": "string"},
    "Status": {"type": "string"},
    "STATUS": {"type": "string"},
    "status_": {"type": "string"}
  }})";
  auto first = synthesize(doc);
  auto second = synthesize(doc);
  CHECK(names_of(first) == names_of(second));
  CHECK(names_of(first) ==
        std::vector<std::string>{"StatusLowercase", "Status", "STATUS",
                                 "StatusUnderscore"});
}

TEST_CASE("a pre-seeded registry keeps its names", "[synthesizer]") {
  auto schemas = load_document(R"({"$defs": {"Pet": {"type": "object"}}})");
  name_registry registry;
  registry.declarations().reserve("Pet", "Pet");

  declaration_synthesizer synthesizer(schemas);
  auto result = synthesizer.synthesize(registry);
  CHECK(names_of(result) == std::vector<std::string>{"PetPascalCase"});
}

TEST_CASE("snake_case naming style", "[synthesizer][naming]") {
  generator_options options;
  options.naming = naming_style::snake_case;
  auto result = synthesize(R"({"$defs": {
    "PetOwner": {"type": "object", "properties": {"firstName": {"type": "string"}}}
  }})",
                           options);

  auto* owner = result.find_as<aggregate_decl>("pet_owner");
  REQUIRE(owner != nullptr);
  CHECK(owner->members[0].name == "first_name");
  CHECK(owner->members[0].original_key == "firstName");
}
