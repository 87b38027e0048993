#pragma once

#include <stdexcept>
#include <string>

namespace ccwc {

/// How word boundaries are recognised.
enum class WhitespaceMode {
  Ascii,   ///< Raw bytes: space, \t, \n, \v, \f, \r.
  Unicode  ///< Decoded code points with the Unicode White_Space-like set.
};

inline bool is_ascii_space(unsigned char c) {
  return c == ' ' || (c >= '\t' && c <= '\r');
}

inline bool is_unicode_space(char32_t cp) {
  if (cp < 0x80) {
    return cp == U' ' || (cp >= U'\t' && cp <= U'\r') || (cp >= 0x1C && cp <= 0x1F);
  }
  switch (cp) {
    case 0x0085:
    case 0x00A0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

inline const char* to_string(WhitespaceMode mode) {
  return mode == WhitespaceMode::Unicode ? "unicode" : "ascii";
}

/// Parse "ascii" / "unicode".  Throws std::invalid_argument otherwise.
inline WhitespaceMode parse_whitespace_mode(const std::string& text) {
  if (text == "ascii") return WhitespaceMode::Ascii;
  if (text == "unicode") return WhitespaceMode::Unicode;
  throw std::invalid_argument("whitespace mode must be 'ascii' or 'unicode', got '" + text + "'");
}

}  // namespace ccwc
