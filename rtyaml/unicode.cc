#include "rtyaml/unicode.hh"

namespace rtyaml {

void append_utf8(std::string &out, char32_t ch) {
  if (ch < 0x80) {
    out.push_back(static_cast<char>(ch));
  } else if (ch < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (ch >> 6)));
    out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
  } else if (ch < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (ch >> 12)));
    out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (ch >> 18)));
    out.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
  }
}

std::string to_utf8(std::u32string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char32_t ch : text) {
    append_utf8(out, ch);
  }
  return out;
}

std::size_t decode_utf8(std::string_view text, std::u32string &out) {
  out.reserve(out.size() + text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    auto b0 = static_cast<unsigned char>(text[i]);
    char32_t ch;
    std::size_t extra;
    if (b0 < 0x80) {
      ch = b0;
      extra = 0;
    } else if ((b0 & 0xE0) == 0xC0) {
      ch = b0 & 0x1F;
      extra = 1;
    } else if ((b0 & 0xF0) == 0xE0) {
      ch = b0 & 0x0F;
      extra = 2;
    } else if ((b0 & 0xF8) == 0xF0) {
      ch = b0 & 0x07;
      extra = 3;
    } else {
      return i;
    }
    if (i + extra >= text.size()) {
      return i;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      auto b = static_cast<unsigned char>(text[i + k]);
      if ((b & 0xC0) != 0x80)
        return i;
      ch = (ch << 6) | (b & 0x3F);
    }
    // overlong forms and surrogates are malformed
    if ((extra == 1 && ch < 0x80) || (extra == 2 && ch < 0x800) || (extra == 3 && ch < 0x10000) || ch > 0x10FFFF ||
        (ch >= 0xD800 && ch <= 0xDFFF)) {
      return i;
    }
    out.push_back(ch);
    i += extra + 1;
  }
  return std::string_view::npos;
}

std::u32string from_utf8(std::string_view text) {
  std::u32string out;
  while (!text.empty()) {
    std::size_t bad = decode_utf8(text, out);
    if (bad == std::string_view::npos)
      break;
    out.push_back(U'\uFFFD');
    text.remove_prefix(bad + 1);
  }
  return out;
}

std::size_t utf8_length(std::string_view text) {
  std::size_t n = 0;
  for (char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
      ++n;
  }
  return n;
}

namespace {

void append_escaped(std::string &out, char32_t ch, char32_t quote) {
  switch (ch) {
  case U'\n':
    out += "\\n";
    return;
  case U'\r':
    out += "\\r";
    return;
  case U'\t':
    out += "\\t";
    return;
  case U'\\':
    out += "\\\\";
    return;
  default:
    break;
  }
  if (ch == quote) {
    out += "\\";
    append_utf8(out, ch);
  } else if (ch < 0x20 || ch == 0x7F) {
    static const char *hex = "0123456789abcdef";
    out += "\\x";
    out.push_back(hex[(ch >> 4) & 0xF]);
    out.push_back(hex[ch & 0xF]);
  } else {
    append_utf8(out, ch);
  }
}

} // namespace

std::string repr_char(char32_t ch) {
  char32_t quote = ch == U'\'' ? U'"' : U'\'';
  std::string out(1, static_cast<char>(quote));
  append_escaped(out, ch, quote);
  out.push_back(static_cast<char>(quote));
  return out;
}

std::string repr_str(std::string_view text) {
  std::u32string decoded = from_utf8(text);
  char32_t quote = U'\'';
  if (decoded.find(U'\'') != std::u32string::npos && decoded.find(U'"') == std::u32string::npos) {
    quote = U'"';
  }
  std::string out(1, static_cast<char>(quote));
  for (char32_t ch : decoded) {
    append_escaped(out, ch, quote);
  }
  out.push_back(static_cast<char>(quote));
  return out;
}

} // namespace rtyaml
