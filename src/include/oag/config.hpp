#pragma once

#include <oag/codegen.hpp>
#include <oag/generator_options.hpp>
#include <oag/type_map.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace oag {

  // Everything one run needs besides the input document.
  struct configuration {
    generator_options generator;
    codegen_options emission;
    type_map types = type_map::defaults();
  };

  // Apply a JSON configuration object on top of the defaults. Unknown keys
  // and values of the wrong type throw std::invalid_argument.
  //
  //   {
  //     "naming": "snake",
  //     "mutable_collections": true,
  //     "reserved_words": ["Object"],
  //     "namespace": "petstore",
  //     "output_mode": "file_per_type",
  //     "types": {"date_time": "std::string"}
  //   }
  configuration
  load_options(const nlohmann::json& config);

  configuration
  load_options_file(const std::filesystem::path& path);

  output_mode
  parse_output_mode(const std::string& text);

} // namespace oag
