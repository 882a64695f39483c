#include <oag/config.hpp>

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>

namespace oag {

  namespace {

    bool
    boolean_value(const std::string& key, const nlohmann::json& value) {
      if (!value.is_boolean())
        throw std::invalid_argument("config: '" + key + "' must be a boolean");
      return value.get<bool>();
    }

    std::string
    string_value(const std::string& key, const nlohmann::json& value) {
      if (!value.is_string())
        throw std::invalid_argument("config: '" + key + "' must be a string");
      return value.get<std::string>();
    }

    std::size_t
    count_value(const std::string& key, const nlohmann::json& value) {
      if (!value.is_number_unsigned() || value.get<std::size_t>() == 0)
        throw std::invalid_argument("config: '" + key +
                                    "' must be a positive integer");
      return value.get<std::size_t>();
    }

  } // namespace

  naming_style
  parse_naming_style(const std::string& text) {
    if (text == "pascal" || text == "pascal_case") return naming_style::pascal_case;
    if (text == "camel" || text == "camel_case") return naming_style::camel_case;
    if (text == "snake" || text == "snake_case") return naming_style::snake_case;
    throw std::invalid_argument("unknown naming style '" + text +
                                "' (expected pascal, camel or snake)");
  }

  output_mode
  parse_output_mode(const std::string& text) {
    if (text == "header_only") return output_mode::header_only;
    if (text == "file_per_type") return output_mode::file_per_type;
    throw std::invalid_argument("unknown output mode '" + text +
                                "' (expected header_only or file_per_type)");
  }

  configuration
  load_options(const nlohmann::json& config) {
    if (!config.is_object())
      throw std::invalid_argument("config: expected an object");

    configuration result;
    auto& gen = result.generator;
    auto& emit = result.emission;

    for (const auto& [key, value] : config.items()) {
      if (key == "naming") {
        gen.naming = parse_naming_style(string_value(key, value));
      } else if (key == "mutable_collections") {
        gen.mutable_collections = boolean_value(key, value);
      } else if (key == "mutable_maps") {
        gen.mutable_maps = boolean_value(key, value);
      } else if (key == "default_non_nullable") {
        gen.default_non_nullable = boolean_value(key, value);
      } else if (key == "propagate_defaults") {
        gen.propagate_defaults = boolean_value(key, value);
      } else if (key == "reserved_words") {
        // added to the C++ keywords, which stay reserved
        if (!value.is_array())
          throw std::invalid_argument("config: 'reserved_words' must be an array");
        for (const auto& word : value) {
          auto w = string_value("reserved_words", word);
          if (std::find(gen.reserved_words.begin(), gen.reserved_words.end(),
                        w) == gen.reserved_words.end())
            gen.reserved_words.push_back(std::move(w));
        }
      } else if (key == "max_composition_depth") {
        gen.max_composition_depth = count_value(key, value);
      } else if (key == "max_numeric_suffix") {
        gen.max_numeric_suffix = count_value(key, value);
      } else if (key == "namespace") {
        emit.cpp_namespace = string_value(key, value);
      } else if (key == "output_mode") {
        emit.mode = parse_output_mode(string_value(key, value));
      } else if (key == "file_stem") {
        emit.file_stem = string_value(key, value);
        if (emit.file_stem.empty())
          throw std::invalid_argument("config: 'file_stem' must not be empty");
      } else if (key == "doc_comments") {
        emit.doc_comments = boolean_value(key, value);
      } else if (key == "file_header") {
        emit.file_header = boolean_value(key, value);
      } else if (key == "types") {
        result.types.merge(type_map::load(value));
      } else {
        throw std::invalid_argument("config: unknown key '" + key + "'");
      }
    }
    return result;
  }

  configuration
  load_options_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open file: " + path.string());

    nlohmann::json config;
    try {
      config = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw std::invalid_argument("config: " + path.string() + ": " + e.what());
    }
    return load_options(config);
  }

} // namespace oag
