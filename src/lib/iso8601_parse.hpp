#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

// Parsers for the textual forms of formatted string defaults. All of them
// throw std::invalid_argument on malformed input.
namespace oag::detail {

  inline bool
  is_leap_year(int32_t year) {
    if (year < 0) { year = -(year + 1); }
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
  }

  inline uint8_t
  days_in_month(int32_t year, uint8_t month) {
    static constexpr uint8_t table[] = {0,  31, 28, 31, 30, 31, 30,
                                        31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
      throw std::invalid_argument("days_in_month: invalid month");
    }
    if (month == 2 && is_leap_year(year)) { return 29; }
    return table[month];
  }

  inline int
  parse_digits(std::string_view str, std::size_t pos, std::size_t count) {
    if (pos + count > str.size()) {
      throw std::invalid_argument("unexpected end of input");
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
      if (str[i] < '0' || str[i] > '9') {
        throw std::invalid_argument("expected digit");
      }
      value = value * 10 + (str[i] - '0');
    }
    return value;
  }

  struct tz_result {
    int16_t offset_minutes;
    std::size_t consumed;
  };

  // Z, +hh:mm or -hh:mm. Absence means UTC.
  inline tz_result
  parse_timezone(std::string_view str) {
    if (str.empty()) { return {0, 0}; }

    if (str[0] == 'Z' || str[0] == 'z') { return {0, 1}; }

    if (str[0] == '+' || str[0] == '-') {
      if (str.size() < 6 || str[3] != ':') {
        throw std::invalid_argument("invalid timezone format");
      }
      bool neg = str[0] == '-';
      int hours = parse_digits(str, 1, 2);
      int mins = parse_digits(str, 4, 2);

      if (hours > 14 || (hours == 14 && mins > 0) || mins > 59) {
        throw std::invalid_argument("timezone offset out of range");
      }

      int16_t offset = static_cast<int16_t>(hours * 60 + mins);
      if (neg) { offset = static_cast<int16_t>(-offset); }
      return {offset, 6};
    }

    throw std::invalid_argument("invalid timezone designator");
  }

  struct frac_result {
    int32_t millis;
    std::size_t consumed;
  };

  // Fractional seconds truncated to milliseconds.
  inline frac_result
  parse_fractional_seconds(std::string_view str) {
    if (str.empty() || str[0] != '.') { return {0, 0}; }
    std::size_t pos = 1;
    int32_t millis = 0;
    int digits = 0;
    while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (str[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (pos == 1) { throw std::invalid_argument("empty fraction"); }
    while (digits < 3) {
      millis *= 10;
      ++digits;
    }
    return {millis, pos};
  }

  struct date_parts {
    int32_t year;
    uint8_t month;
    uint8_t day;
  };

  struct time_parts {
    uint8_t hour;
    uint8_t minute;
    uint8_t second;
    int32_t millis;
    int16_t offset_minutes;
  };

  struct date_time_parts {
    date_parts date;
    time_parts time;
  };

  inline date_parts
  parse_date_prefix(std::string_view str) {
    if (str.size() < 10 || str[4] != '-' || str[7] != '-') {
      throw std::invalid_argument("expected YYYY-MM-DD");
    }
    date_parts d{};
    d.year = parse_digits(str, 0, 4);
    d.month = static_cast<uint8_t>(parse_digits(str, 5, 2));
    d.day = static_cast<uint8_t>(parse_digits(str, 8, 2));
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) {
      throw std::invalid_argument("day out of range");
    }
    return d;
  }

  inline date_parts
  parse_date(std::string_view str) {
    auto d = parse_date_prefix(str);
    if (str.size() != 10) { throw std::invalid_argument("trailing text"); }
    return d;
  }

  inline time_parts
  parse_time(std::string_view str) {
    if (str.size() < 8 || str[2] != ':' || str[5] != ':') {
      throw std::invalid_argument("expected hh:mm:ss");
    }
    time_parts t{};
    t.hour = static_cast<uint8_t>(parse_digits(str, 0, 2));
    t.minute = static_cast<uint8_t>(parse_digits(str, 3, 2));
    t.second = static_cast<uint8_t>(parse_digits(str, 6, 2));
    if (t.hour > 23 || t.minute > 59 || t.second > 60) {
      throw std::invalid_argument("time component out of range");
    }
    std::size_t pos = 8;
    auto frac = parse_fractional_seconds(str.substr(pos));
    t.millis = frac.millis;
    pos += frac.consumed;
    auto tz = parse_timezone(str.substr(pos));
    t.offset_minutes = tz.offset_minutes;
    pos += tz.consumed;
    if (pos != str.size()) { throw std::invalid_argument("trailing text"); }
    return t;
  }

  inline date_time_parts
  parse_date_time(std::string_view str) {
    auto d = parse_date_prefix(str);
    if (str.size() < 11 || (str[10] != 'T' && str[10] != 't' && str[10] != ' ')) {
      throw std::invalid_argument("expected 'T' separator");
    }
    return {d, parse_time(str.substr(11))};
  }

  // ISO 8601 duration (PnW, PnDTnHnMnS) in milliseconds. Years and months
  // have no fixed length and are rejected.
  inline int64_t
  parse_duration_millis(std::string_view str) {
    bool negative = false;
    std::size_t pos = 0;
    if (pos < str.size() && str[pos] == '-') {
      negative = true;
      ++pos;
    }
    if (pos >= str.size() || str[pos] != 'P') {
      throw std::invalid_argument("duration must start with 'P'");
    }
    ++pos;

    bool in_time = false;
    bool any = false;
    int64_t total = 0;
    while (pos < str.size()) {
      if (str[pos] == 'T') {
        if (in_time) { throw std::invalid_argument("repeated 'T'"); }
        in_time = true;
        ++pos;
        continue;
      }
      std::size_t start = pos;
      int64_t value = 0;
      while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
        value = value * 10 + (str[pos] - '0');
        ++pos;
      }
      if (pos == start) { throw std::invalid_argument("expected number"); }
      int32_t millis = 0;
      if (pos < str.size() && str[pos] == '.') {
        auto frac = parse_fractional_seconds(str.substr(pos));
        millis = frac.millis;
        pos += frac.consumed;
        if (pos >= str.size() || str[pos] != 'S') {
          throw std::invalid_argument("fraction allowed on seconds only");
        }
      }
      if (pos >= str.size()) { throw std::invalid_argument("missing unit"); }
      char unit = str[pos++];
      if (!in_time) {
        if (unit == 'W')
          total += value * 7 * 86400000;
        else if (unit == 'D')
          total += value * 86400000;
        else
          throw std::invalid_argument("unsupported date component");
      } else {
        if (unit == 'H')
          total += value * 3600000;
        else if (unit == 'M')
          total += value * 60000;
        else if (unit == 'S')
          total += value * 1000 + millis;
        else
          throw std::invalid_argument("unsupported time component");
      }
      any = true;
    }
    if (!any) { throw std::invalid_argument("empty duration"); }
    return negative ? -total : total;
  }

  inline std::array<uint8_t, 16>
  parse_uuid(std::string_view str) {
    if (str.size() != 36 || str[8] != '-' || str[13] != '-' ||
        str[18] != '-' || str[23] != '-') {
      throw std::invalid_argument("expected 8-4-4-4-12 hex groups");
    }
    auto hex = [](char c) -> int {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      throw std::invalid_argument("expected hex digit");
    };
    std::array<uint8_t, 16> bytes{};
    std::size_t out = 0;
    for (std::size_t i = 0; i < str.size();) {
      if (str[i] == '-') {
        ++i;
        continue;
      }
      bytes[out++] = static_cast<uint8_t>(hex(str[i]) * 16 + hex(str[i + 1]));
      i += 2;
    }
    return bytes;
  }

} // namespace oag::detail
