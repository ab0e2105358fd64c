#ifndef CHRONOSNAP_CORE_JSON_UTILS_HPP_
#define CHRONOSNAP_CORE_JSON_UTILS_HPP_

#include <optional>
#include <string>
#include <string_view>

namespace chronosnap::core {

// Appends `input` to `out` as the body of a JSON string literal. Control
// characters without a short escape become six-character unicode escapes.
inline void AppendJsonEscaped(std::string& out, std::string_view input) {
  constexpr char kHexDigits[] = "0123456789abcdef";
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
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
    default: {
      const auto byte = static_cast<unsigned char>(ch);
      if (byte < 0x20U) {
        out += "\\u00";
        out += kHexDigits[byte >> 4U];
        out += kHexDigits[byte & 0x0FU];
      } else {
        out += ch;
      }
      break;
    }
    }
  }
}

// `input` as a complete JSON string value, quotes included. Every string the
// serve protocol, `list-devices --json` and DeviceStatus emit goes through here.
inline std::string QuoteJson(std::string_view input) {
  std::string quoted;
  quoted.reserve(input.size() + 2U);
  quoted += '"';
  AppendJsonEscaped(quoted, input);
  quoted += '"';
  return quoted;
}

// Nullable string field: `null` when absent.
inline std::string QuoteJsonOrNull(const std::optional<std::string>& input) {
  return input.has_value() ? QuoteJson(input.value()) : std::string("null");
}

} // namespace chronosnap::core

#endif // CHRONOSNAP_CORE_JSON_UTILS_HPP_
