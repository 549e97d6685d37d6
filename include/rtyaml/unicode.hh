#pragma once

#include <string>
#include <string_view>

namespace rtyaml {

// Character classes used across the scanner and the emitter ----------------

constexpr bool is_line_break(char32_t ch) noexcept {
  return ch == U'\r' || ch == U'\n' || ch == U'\x85' || ch == U'\u2028' || ch == U'\u2029';
}

// '\0 \t\r\n\x85\u2028\u2029', i.e. whitespace or the end of input
constexpr bool is_blank_or_break_z(char32_t ch) noexcept {
  return ch == U'\0' || ch == U' ' || ch == U'\t' || is_line_break(ch);
}

// '\0\r\n\x85\u2028\u2029'
constexpr bool is_break_z(char32_t ch) noexcept { return ch == U'\0' || is_line_break(ch); }

constexpr bool is_ascii_alnum(char32_t ch) noexcept {
  return (ch >= U'0' && ch <= U'9') || (ch >= U'A' && ch <= U'Z') || (ch >= U'a' && ch <= U'z');
}

constexpr bool is_hex_digit(char32_t ch) noexcept {
  return (ch >= U'0' && ch <= U'9') || (ch >= U'A' && ch <= U'F') || (ch >= U'a' && ch <= U'f');
}

// Characters allowed in the input stream
constexpr bool is_printable(char32_t ch) noexcept {
  return ch == U'\x09' || ch == U'\x0A' || ch == U'\x0D' || (ch >= U'\x20' && ch <= U'\x7E') || ch == U'\x85' ||
         (ch >= U'\xA0' && ch <= U'\uD7FF') || (ch >= U'\uE000' && ch <= U'\uFFFD') ||
         (ch >= U'\U00010000' && ch <= U'\U0010FFFF');
}

// Anchor and alias names may hold anything except whitespace and flow indicators
constexpr bool check_anchorname_char(char32_t ch) noexcept {
  if (ch <= U' ')
    return false;
  switch (ch) {
  case U',':
  case U'[':
  case U']':
  case U'{':
  case U'}':
  case U'\x85':
  case U'\u2028':
  case U'\u2029':
  case U'\uFEFF':
    return false;
  default:
    return true;
  }
}

// UTF-8 conversion ----------------------------------------------------------

void append_utf8(std::string &out, char32_t ch);

std::string to_utf8(std::u32string_view text);

inline std::string to_utf8(char32_t ch) {
  std::string out;
  append_utf8(out, ch);
  return out;
}

// Lenient decode, malformed sequences become U+FFFD
std::u32string from_utf8(std::string_view text);

// Strict decode, returns the byte offset of the first malformed sequence or npos when valid
std::size_t decode_utf8(std::string_view text, std::u32string &out);

// Number of code points in a UTF-8 string
std::size_t utf8_length(std::string_view text);

// Quoted character or string for error messages, e.g. 'a', '\n', '\x00' or "'"
std::string repr_char(char32_t ch);
std::string repr_str(std::string_view text);

} // namespace rtyaml
