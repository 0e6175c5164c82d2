#ifndef TOPOCRAWL_CORE_JSON_UTILS_HPP_
#define TOPOCRAWL_CORE_JSON_UTILS_HPP_

#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace topocrawl::core {

// Shared JSON string escaping for the result and graph writers.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

inline std::string JsonString(std::string_view value) {
  return "\"" + EscapeJson(value) + "\"";
}

// Optional text renders as JSON null when absent or empty, mirroring how the
// result document reports "not learned yet".
inline std::string JsonOptionalString(const std::optional<std::string>& value) {
  if (!value.has_value() || value->empty()) {
    return "null";
  }
  return JsonString(value.value());
}

inline std::string JsonStringArray(const std::vector<std::string>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0U) {
      out += ",";
    }
    out += JsonString(values[i]);
  }
  out += "]";
  return out;
}

inline std::string JsonStringMap(const std::map<std::string, std::string>& values) {
  std::string out = "{";
  bool first = true;
  for (const auto& [key, value] : values) {
    if (!first) {
      out += ",";
    }
    first = false;
    out += JsonString(key) + ":" + JsonString(value);
  }
  out += "}";
  return out;
}

} // namespace topocrawl::core

#endif // TOPOCRAWL_CORE_JSON_UTILS_HPP_
