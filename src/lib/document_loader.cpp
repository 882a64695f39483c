#include <oag/document_loader.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace oag {

  namespace {

    using ordered_json = nlohmann::ordered_json;

    constexpr std::size_t max_document_depth = 256;

    bool
    is_yaml_integer(const std::string& s) {
      std::size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
      if (i == s.size()) return false;
      for (; i < s.size(); ++i)
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
      return true;
    }

    bool
    is_yaml_float(const std::string& s) {
      std::size_t i = 0;
      if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
      std::size_t digits = 0;
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        ++i;
        ++digits;
      }
      if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
          ++i;
          ++digits;
        }
      }
      if (digits == 0) return false;
      if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
        std::size_t exp_digits = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
          ++i;
          ++exp_digits;
        }
        if (exp_digits == 0) return false;
      }
      return i == s.size();
    }

    ordered_json
    scalar_to_json(const YAML::Node& node) {
      const std::string& text = node.Scalar();
      // quoted scalars carry the non-specific tag "!"
      if (node.Tag() == "!") return text;

      if (text == "true" || text == "True" || text == "TRUE") return true;
      if (text == "false" || text == "False" || text == "FALSE") return false;
      if (text.empty() || text == "~" || text == "null" || text == "Null" ||
          text == "NULL")
        return nullptr;

      if (is_yaml_integer(text)) {
        errno = 0;
        char* end = nullptr;
        long long value = std::strtoll(text.c_str(), &end, 10);
        if (errno == 0) return static_cast<std::int64_t>(value);
        if (text[0] != '-') {
          errno = 0;
          unsigned long long u = std::strtoull(text.c_str(), &end, 10);
          if (errno == 0) return static_cast<std::uint64_t>(u);
        }
        return std::strtod(text.c_str(), nullptr);
      }
      if (is_yaml_float(text)) return std::strtod(text.c_str(), nullptr);
      return text;
    }

    ordered_json
    node_to_json(const YAML::Node& node, std::size_t depth) {
      if (depth > max_document_depth)
        throw document_error("document nesting is too deep");

      switch (node.Type()) {
        case YAML::NodeType::Scalar:
          return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
          auto out = ordered_json::array();
          for (const auto& item : node) out.push_back(node_to_json(item, depth + 1));
          return out;
        }
        case YAML::NodeType::Map: {
          auto out = ordered_json::object();
          for (const auto& kv : node)
            out[kv.first.as<std::string>()] = node_to_json(kv.second, depth + 1);
          return out;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
          break;
      }
      return nullptr;
    }

    nlohmann::json
    plain(const ordered_json& value) {
      return nlohmann::json::parse(value.dump());
    }

    schema_kind
    kind_named(const std::string& name, const std::string& path) {
      if (name == "string") return schema_kind::string;
      if (name == "integer") return schema_kind::integer;
      if (name == "number") return schema_kind::number;
      if (name == "boolean") return schema_kind::boolean;
      if (name == "array") return schema_kind::array;
      if (name == "object") return schema_kind::object;
      if (name == "null") return schema_kind::null;
      throw document_error(path + ": unknown type '" + name + "'");
    }

    class schema_reader {
      std::size_t depth_ = 0;

      schema_ptr
      read_child(const ordered_json& j, const std::string& path) {
        if (++depth_ > max_document_depth)
          throw document_error(path + ": schema nesting is too deep");
        auto result = read(j, path);
        --depth_;
        return result;
      }

      std::vector<schema_ptr>
      read_list(const ordered_json& j, const std::string& path) {
        if (!j.is_array()) throw document_error(path + ": expected an array");
        std::vector<schema_ptr> out;
        for (std::size_t i = 0; i < j.size(); ++i)
          out.push_back(read_child(j[i], path + "/" + std::to_string(i)));
        return out;
      }

      static std::string
      string_field(const ordered_json& j, const char* key,
                   const std::string& path) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return {};
        if (!it->is_string())
          throw document_error(path + ": '" + key + "' must be a string");
        return it->get<std::string>();
      }

    public:
      schema_ptr
      read(const ordered_json& j, const std::string& path) {
        schema_node node;
        // `true` accepts anything
        if (j.is_boolean()) return make_schema(std::move(node));
        if (!j.is_object())
          throw document_error(path + ": schema must be an object");

        if (auto it = j.find("$ref"); it != j.end()) {
          if (!it->is_string())
            throw document_error(path + ": '$ref' must be a string");
          node.ref = reference_name(it->get<std::string>());
        }

        if (auto it = j.find("type"); it != j.end()) {
          if (it->is_string()) {
            node.kind |= kind_named(it->get<std::string>(), path);
          } else if (it->is_array()) {
            for (const auto& t : *it) {
              if (!t.is_string())
                throw document_error(path + ": 'type' entries must be strings");
              node.kind |= kind_named(t.get<std::string>(), path);
            }
          } else {
            throw document_error(path + ": 'type' must be a string or array");
          }
        }
        if (auto it = j.find("nullable"); it != j.end() && it->is_boolean() &&
                                          it->get<bool>())
          node.kind |= schema_kind::null;

        node.format = string_field(j, "format", path);
        node.description = string_field(j, "description", path);

        if (auto it = j.find("enum"); it != j.end()) {
          if (!it->is_array())
            throw document_error(path + ": 'enum' must be an array");
          for (const auto& v : *it) node.enum_values.push_back(plain(v));
        } else if (auto c = j.find("const"); c != j.end()) {
          node.enum_values.push_back(plain(*c));
        }

        if (auto it = j.find("required"); it != j.end()) {
          if (!it->is_array())
            throw document_error(path + ": 'required' must be an array");
          for (const auto& r : *it) {
            if (!r.is_string())
              throw document_error(path + ": 'required' entries must be strings");
            auto name = r.get<std::string>();
            if (std::find(node.required.begin(), node.required.end(), name) ==
                node.required.end())
              node.required.push_back(std::move(name));
          }
        }

        if (auto it = j.find("properties"); it != j.end()) {
          if (!it->is_object())
            throw document_error(path + ": 'properties' must be an object");
          for (const auto& [name, value] : it->items())
            node.properties.push_back(
                {name, read_child(value, path + "/properties/" + name)});
        }

        if (auto it = j.find("items"); it != j.end() && it->is_object())
          node.items = read_child(*it, path + "/items");

        if (auto it = j.find("additionalProperties"); it != j.end()) {
          if (it->is_object() || (it->is_boolean() && it->get<bool>()))
            node.additional_properties =
                read_child(*it, path + "/additionalProperties");
        }

        if (auto it = j.find("allOf"); it != j.end())
          node.all_of = read_list(*it, path + "/allOf");
        if (auto it = j.find("oneOf"); it != j.end())
          node.one_of = read_list(*it, path + "/oneOf");
        if (auto it = j.find("anyOf"); it != j.end())
          node.any_of = read_list(*it, path + "/anyOf");

        if (auto it = j.find("discriminator"); it != j.end() && it->is_object()) {
          schema_discriminator d;
          d.property_name = string_field(*it, "propertyName", path + "/discriminator");
          if (auto m = it->find("mapping"); m != it->end() && m->is_object()) {
            for (const auto& [value, target] : m->items()) {
              if (!target.is_string())
                throw document_error(path +
                                     "/discriminator: mapping targets must be strings");
              d.mapping.emplace_back(value,
                                     reference_name(target.get<std::string>()));
            }
          }
          node.discriminator = std::move(d);
        }

        if (auto it = j.find("default"); it != j.end())
          node.default_value = plain(*it);

        return make_schema(std::move(node));
      }
    };

    bool
    looks_like_json(std::string_view text) {
      for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        return c == '{' || c == '[';
      }
      return false;
    }

  } // namespace

  std::string
  reference_name(std::string_view ref) {
    auto slash = ref.rfind('/');
    if (slash != std::string_view::npos) ref = ref.substr(slash + 1);

    std::string out;
    out.reserve(ref.size());
    for (std::size_t i = 0; i < ref.size(); ++i) {
      if (ref[i] == '~' && i + 1 < ref.size()) {
        if (ref[i + 1] == '1') {
          out += '/';
          ++i;
          continue;
        }
        if (ref[i + 1] == '0') {
          out += '~';
          ++i;
          continue;
        }
      }
      out += ref[i];
    }
    return out;
  }

  nlohmann::ordered_json
  yaml_to_json(std::string_view text) {
    YAML::Node root;
    try {
      root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
      throw document_error("failed to parse YAML: " + std::string(e.what()));
    }
    return node_to_json(root, 0);
  }

  schema_set
  schemas_from_document(const nlohmann::ordered_json& document) {
    if (!document.is_object())
      throw document_error("document root must be an object");

    const ordered_json* collection = nullptr;
    std::string base;
    if (auto c = document.find("components");
        c != document.end() && c->is_object()) {
      if (auto s = c->find("schemas"); s != c->end()) {
        collection = &*s;
        base = "#/components/schemas";
      }
    }
    if (!collection) {
      for (const char* key : {"$defs", "definitions"}) {
        if (auto s = document.find(key); s != document.end()) {
          collection = &*s;
          base = std::string("#/") + key;
          break;
        }
      }
    }

    schema_set schemas;
    if (!collection || collection->is_null()) return schemas;
    if (!collection->is_object())
      throw document_error(base + ": expected an object of schemas");

    schema_reader reader;
    for (const auto& [name, value] : collection->items())
      schemas.add(name, reader.read(value, base + "/" + name));
    return schemas;
  }

  schema_set
  load_document(std::string_view text, document_format format) {
    if (format == document_format::detect)
      format = looks_like_json(text) ? document_format::json
                                     : document_format::yaml;

    ordered_json document;
    if (format == document_format::json) {
      try {
        document = ordered_json::parse(text.begin(), text.end());
      } catch (const nlohmann::json::parse_error& e) {
        throw document_error("failed to parse JSON: " + std::string(e.what()));
      }
    } else {
      document = yaml_to_json(text);
    }
    return schemas_from_document(document);
  }

  schema_set
  load_document_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
      throw std::runtime_error("cannot open file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();

    auto ext = path.extension().string();
    auto format = document_format::detect;
    if (ext == ".json")
      format = document_format::json;
    else if (ext == ".yaml" || ext == ".yml")
      format = document_format::yaml;
    return load_document(ss.str(), format);
  }

} // namespace oag
