#include <oag/literal_renderer.hpp>

#include "iso8601_parse.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace oag {

  namespace {

    std::optional<std::int64_t>
    integral_value(const nlohmann::json& value) {
      if (value.is_number_unsigned()) {
        auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(
                    std::numeric_limits<std::int64_t>::max()))
          return std::nullopt;
        return static_cast<std::int64_t>(u);
      }
      if (value.is_number_integer()) return value.get<std::int64_t>();
      if (value.is_number_float()) {
        double d = value.get<double>();
        if (!std::isfinite(d) || std::trunc(d) != d) return std::nullopt;
        if (d < -9223372036854775808.0 || d >= 9223372036854775808.0)
          return std::nullopt;
        return static_cast<std::int64_t>(d);
      }
      return std::nullopt;
    }

    std::string
    with_point(std::string text) {
      if (text.find_first_of(".eE") == std::string::npos) text += ".0";
      return text;
    }

    template <typename T>
    std::string
    shortest(T value) {
      char buf[64];
      auto [end, ec] = std::to_chars(buf, buf + sizeof buf, value);
      if (ec != std::errc{})
        throw std::runtime_error("literal_renderer: cannot format number");
      return with_point(std::string(buf, end));
    }

    std::string
    hex_byte(std::uint8_t b) {
      static constexpr char digits[] = "0123456789abcdef";
      std::string out = "0x";
      out += digits[b >> 4];
      out += digits[b & 0x0f];
      return out;
    }

    std::string
    time_of_day_sum(const detail::time_parts& t) {
      return "std::chrono::hours{" + std::to_string(t.hour) +
             "} + std::chrono::minutes{" + std::to_string(t.minute) +
             "} + std::chrono::seconds{" + std::to_string(t.second) +
             "} + std::chrono::milliseconds{" + std::to_string(t.millis) + "}";
    }

    std::string
    civil_date(const detail::date_parts& d) {
      return "std::chrono::year{" + std::to_string(d.year) +
             "} / std::chrono::month{" + std::to_string(d.month) +
             "} / std::chrono::day{" + std::to_string(d.day) + "}";
    }

    std::optional<expression>
    construct_formatted(const std::string& text, primitive_kind kind) {
      try {
        switch (kind) {
          case primitive_kind::date_time: {
            auto dt = detail::parse_date_time(text);
            std::string out = "std::chrono::sys_days{" + civil_date(dt.date) +
                              "} + " + time_of_day_sum(dt.time);
            // local time minus offset gives UTC
            if (dt.time.offset_minutes > 0)
              out += " - std::chrono::minutes{" +
                     std::to_string(dt.time.offset_minutes) + "}";
            else if (dt.time.offset_minutes < 0)
              out += " + std::chrono::minutes{" +
                     std::to_string(-dt.time.offset_minutes) + "}";
            return expression{expression_kind::construct, out};
          }
          case primitive_kind::date:
            return expression{expression_kind::construct,
                              "std::chrono::year_month_day{" +
                                  civil_date(detail::parse_date(text)) + "}"};
          case primitive_kind::time:
            return expression{
                expression_kind::construct,
                "std::chrono::hh_mm_ss<std::chrono::milliseconds>{" +
                    time_of_day_sum(detail::parse_time(text)) + "}"};
          case primitive_kind::duration:
            return expression{
                expression_kind::construct,
                "std::chrono::milliseconds{" +
                    std::to_string(detail::parse_duration_millis(text)) + "}"};
          case primitive_kind::uuid: {
            auto bytes = detail::parse_uuid(text);
            std::string out = "std::array<std::uint8_t, 16>{";
            for (std::size_t i = 0; i < bytes.size(); ++i) {
              if (i) out += ", ";
              out += hex_byte(bytes[i]);
            }
            out += "}";
            return expression{expression_kind::construct, out};
          }
          case primitive_kind::uri:
            return expression{expression_kind::construct,
                              "std::string{" + cpp_string_literal(text) + "}"};
          default:
            return std::nullopt;
        }
      } catch (const std::invalid_argument&) {
        return std::nullopt;
      }
    }

  } // namespace

  std::string
  cpp_string_literal(std::string_view text) {
    std::string out = "\"";
    for (char ch : text) {
      auto c = static_cast<unsigned char>(ch);
      switch (c) {
        case '\\':
          out += "\\\\";
          break;
        case '"':
          out += "\\\"";
          break;
        case '\n':
          out += "\\n";
          break;
        case '\r':
          out += "\\r";
          break;
        case '\t':
          out += "\\t";
          break;
        default:
          if (c < 0x20 || c == 0x7f) {
            out += '\\';
            out += static_cast<char>('0' + ((c >> 6) & 7));
            out += static_cast<char>('0' + ((c >> 3) & 7));
            out += static_cast<char>('0' + (c & 7));
          } else {
            out += ch;
          }
      }
    }
    out += '"';
    return out;
  }

  literal_renderer::literal_renderer(declaration_lookup lookup)
      : lookup_(std::move(lookup)) {}

  std::optional<expression>
  literal_renderer::render(const nlohmann::json& value,
                           const resolved_type& type,
                           const std::string& format) const {
    if (value.is_null()) return std::nullopt;
    const auto& target = type.unwrapped();

    if (auto* p = std::get_if<primitive_type>(&target.value))
      return render_primitive(value, p->kind, format);

    if (auto* c = std::get_if<collection_type>(&target.value)) {
      if (!value.is_array()) return std::nullopt;
      if (value.empty()) return expression{expression_kind::empty_collection, "{}"};
      std::string out = "{";
      for (std::size_t i = 0; i < value.size(); ++i) {
        auto element = render(value[i], *c->element);
        if (!element || element->kind == expression_kind::placeholder)
          return std::nullopt;
        if (i) out += ", ";
        out += element->text;
      }
      out += "}";
      return expression{expression_kind::collection, out};
    }

    if (auto* r = std::get_if<named_reference>(&target.value))
      return render_named(value, r->name);

    return std::nullopt;
  }

  std::optional<expression>
  literal_renderer::render_named(const nlohmann::json& value,
                                 const std::string& name) const {
    if (!lookup_) return std::nullopt;
    const declaration* decl = lookup_(name);
    if (!decl) return std::nullopt;

    if (auto* e = std::get_if<enumeration_decl>(decl)) {
      auto* member = e->find_value(value);
      if (!member) return std::nullopt;
      return expression{expression_kind::enum_member,
                        e->name + "::" + member->name};
    }

    if (auto* alias = std::get_if<type_alias_decl>(decl)) {
      auto inner = render(value, alias->target);
      if (!inner) return std::nullopt;
      // collection aliases are plain `using` declarations
      if (alias->target.unwrapped().is<collection_type>() ||
          inner->kind == expression_kind::placeholder)
        return inner;
      return expression{expression_kind::construct,
                        alias->name + "{" + inner->text + "}"};
    }

    return std::nullopt;
  }

  std::optional<expression>
  literal_renderer::render_primitive(const nlohmann::json& value,
                                     primitive_kind kind,
                                     const std::string& format) const {
    switch (kind) {
      case primitive_kind::boolean:
        if (!value.is_boolean()) return std::nullopt;
        return expression{expression_kind::literal,
                          value.get<bool>() ? "true" : "false"};

      case primitive_kind::int32: {
        auto v = integral_value(value);
        if (!v || *v < std::numeric_limits<std::int32_t>::min() ||
            *v > std::numeric_limits<std::int32_t>::max())
          return std::nullopt;
        if (*v == std::numeric_limits<std::int32_t>::min())
          return expression{expression_kind::literal, "(-2147483647 - 1)"};
        return expression{expression_kind::literal, std::to_string(*v)};
      }

      case primitive_kind::int64: {
        auto v = integral_value(value);
        if (!v) return std::nullopt;
        if (*v == std::numeric_limits<std::int64_t>::min())
          return expression{expression_kind::literal,
                            "(-9223372036854775807LL - 1)"};
        return expression{expression_kind::literal, std::to_string(*v) + "LL"};
      }

      case primitive_kind::float32: {
        if (!value.is_number()) return std::nullopt;
        double d = value.get<double>();
        if (!std::isfinite(d) ||
            std::fabs(d) > std::numeric_limits<float>::max())
          return std::nullopt;
        return expression{expression_kind::literal,
                          shortest(static_cast<float>(d)) + "f"};
      }

      case primitive_kind::float64: {
        if (!value.is_number()) return std::nullopt;
        double d = value.get<double>();
        if (!std::isfinite(d)) return std::nullopt;
        return expression{expression_kind::literal, shortest(d)};
      }

      case primitive_kind::decimal:
        if (!value.is_number()) return std::nullopt;
        if (value.is_number_float() && !std::isfinite(value.get<double>()))
          return std::nullopt;
        return expression{expression_kind::literal,
                          with_point(value.dump()) + "L"};

      case primitive_kind::string:
        if (!value.is_string()) return std::nullopt;
        if (!format.empty()) return placeholder();
        return expression{expression_kind::literal,
                          cpp_string_literal(value.get<std::string>())};

      case primitive_kind::date_time:
      case primitive_kind::date:
      case primitive_kind::time:
      case primitive_kind::duration:
      case primitive_kind::uuid:
      case primitive_kind::uri:
        if (!value.is_string()) return std::nullopt;
        return construct_formatted(value.get<std::string>(), kind);

      case primitive_kind::byte_array:
      case primitive_kind::binary:
      case primitive_kind::opaque:
        return std::nullopt;
    }
    return std::nullopt;
  }

} // namespace oag
