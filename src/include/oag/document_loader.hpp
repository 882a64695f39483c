#pragma once

#include <oag/schema_set.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace oag {

  enum class document_format { json, yaml, detect };

  class document_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // JSON-pointer reference ("#/components/schemas/Pet") reduced to the
  // schema name it ends in, with ~1 and ~0 unescaped.
  std::string
  reference_name(std::string_view ref);

  // Parse YAML text into an order-preserving JSON value.
  nlohmann::ordered_json
  yaml_to_json(std::string_view text);

  // Collect the schemas of an already parsed document.
  schema_set
  schemas_from_document(const nlohmann::ordered_json& document);

  schema_set
  load_document(std::string_view text,
                document_format format = document_format::detect);

  schema_set
  load_document_file(const std::filesystem::path& path);

} // namespace oag
