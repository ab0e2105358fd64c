#ifndef CHRONOSNAP_CORE_BASE64_HPP_
#define CHRONOSNAP_CORE_BASE64_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chronosnap::core {

// Standard alphabet (RFC 4648) with '=' padding, matching what browsers expect
// inside `data:` URIs.
inline std::string EncodeBase64(const std::uint8_t* data, const std::size_t size) {
  static constexpr char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string out;
  out.reserve(((size + 2U) / 3U) * 4U);

  std::size_t i = 0;
  for (; i + 2U < size; i += 3U) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16U) |
                                 (static_cast<std::uint32_t>(data[i + 1U]) << 8U) |
                                 static_cast<std::uint32_t>(data[i + 2U]);
    out.push_back(kAlphabet[(triple >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(triple >> 12U) & 0x3FU]);
    out.push_back(kAlphabet[(triple >> 6U) & 0x3FU]);
    out.push_back(kAlphabet[triple & 0x3FU]);
  }

  const std::size_t remaining = size - i;
  if (remaining == 1U) {
    const std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16U;
    out.push_back(kAlphabet[(triple >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(triple >> 12U) & 0x3FU]);
    out += "==";
  } else if (remaining == 2U) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16U) |
                                 (static_cast<std::uint32_t>(data[i + 1U]) << 8U);
    out.push_back(kAlphabet[(triple >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(triple >> 12U) & 0x3FU]);
    out.push_back(kAlphabet[(triple >> 6U) & 0x3FU]);
    out.push_back('=');
  }
  return out;
}

inline std::string EncodeBase64(const std::vector<std::uint8_t>& bytes) {
  return EncodeBase64(bytes.data(), bytes.size());
}

// Strict decoder: rejects characters outside the alphabet, misplaced padding
// and lengths that are not a multiple of four. ASCII whitespace is skipped.
inline bool DecodeBase64(std::string_view text, std::vector<std::uint8_t>& bytes,
                         std::string& error) {
  bytes.clear();
  error.clear();

  auto decode_char = [](const char c) -> int {
    if (c >= 'A' && c <= 'Z') {
      return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
      return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
      return c - '0' + 52;
    }
    if (c == '+') {
      return 62;
    }
    if (c == '/') {
      return 63;
    }
    return -1;
  };

  std::string compact;
  compact.reserve(text.size());
  for (const char c : text) {
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
      continue;
    }
    compact.push_back(c);
  }

  if (compact.size() % 4U != 0U) {
    error = "base64 payload length must be a multiple of 4";
    return false;
  }

  bytes.reserve((compact.size() / 4U) * 3U);
  for (std::size_t i = 0; i < compact.size(); i += 4U) {
    std::array<int, 4> values{};
    std::size_t padding = 0;
    for (std::size_t j = 0; j < 4U; ++j) {
      const char c = compact[i + j];
      if (c == '=') {
        const bool last_quad = i + 4U == compact.size();
        if (!last_quad || j < 2U) {
          error = "base64 padding is only allowed at the end of the payload";
          return false;
        }
        ++padding;
        values[j] = 0;
        continue;
      }
      if (padding > 0U) {
        error = "base64 data cannot follow padding";
        return false;
      }
      values[j] = decode_char(c);
      if (values[j] < 0) {
        error = "base64 payload contains an invalid character at offset " + std::to_string(i + j);
        return false;
      }
    }

    const std::uint32_t triple = (static_cast<std::uint32_t>(values[0]) << 18U) |
                                 (static_cast<std::uint32_t>(values[1]) << 12U) |
                                 (static_cast<std::uint32_t>(values[2]) << 6U) |
                                 static_cast<std::uint32_t>(values[3]);
    bytes.push_back(static_cast<std::uint8_t>((triple >> 16U) & 0xFFU));
    if (padding < 2U) {
      bytes.push_back(static_cast<std::uint8_t>((triple >> 8U) & 0xFFU));
    }
    if (padding < 1U) {
      bytes.push_back(static_cast<std::uint8_t>(triple & 0xFFU));
    }
  }
  return true;
}

} // namespace chronosnap::core

#endif // CHRONOSNAP_CORE_BASE64_HPP_
