#ifndef BINPOST_CORE_JSON_UTILS_HPP_
#define BINPOST_CORE_JSON_UTILS_HPP_

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace binpost::core {

// JSON string escaping shared by the run report and outcome serializers.
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

// Emits `["a","b"]` with paths rendered in their native string form.
inline std::string ToJsonPathArray(const std::vector<std::filesystem::path>& paths) {
  std::string out = "[";
  for (std::size_t i = 0; i < paths.size(); ++i) {
    if (i != 0U) {
      out += ",";
    }
    out += QuoteJson(paths[i].string());
  }
  out += "]";
  return out;
}

} // namespace binpost::core

#endif // BINPOST_CORE_JSON_UTILS_HPP_
