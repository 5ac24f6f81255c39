#ifndef ARMGUARD_CORE_JSON_UTILS_HPP_
#define ARMGUARD_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace armguard::core {

// JSON string escaping shared by the report writer and the event stream.
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

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

// Round-trippable number text. JSON has no NaN/Inf, so those become null.
inline std::string FormatJsonNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  std::ostringstream out;
  out << std::setprecision(17) << value;
  return out.str();
}

inline std::string ToJsonArray(const std::vector<double>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0U) {
      out += ",";
    }
    out += FormatJsonNumber(values[i]);
  }
  out += "]";
  return out;
}

inline std::string ToJsonArray(const std::vector<std::size_t>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0U) {
      out += ",";
    }
    out += std::to_string(values[i]);
  }
  out += "]";
  return out;
}

inline std::string ToJsonArray(const std::vector<std::string>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0U) {
      out += ",";
    }
    out += QuoteJson(values[i]);
  }
  out += "]";
  return out;
}

} // namespace armguard::core

#endif // ARMGUARD_CORE_JSON_UTILS_HPP_
