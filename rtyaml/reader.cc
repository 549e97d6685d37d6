#include "rtyaml/reader.hh"
#include "rtyaml/unicode.hh"

namespace rtyaml {

Reader::Reader(std::string_view bytes, std::string name)
    : name_(std::move(name)), buffer_(std::make_shared<std::u32string>()) {
  decode(bytes);
  check_printable();
  buffer_->push_back(U'\0');
}

Reader::Reader(std::u32string text, std::string name)
    : name_(std::move(name)), buffer_(std::make_shared<std::u32string>(std::move(text))) {
  check_printable();
  buffer_->push_back(U'\0');
}

void Reader::decode(std::string_view bytes) {
  auto byte_at = [&bytes](std::size_t i) { return static_cast<unsigned char>(bytes[i]); };

  if (bytes.size() >= 2 && ((byte_at(0) == 0xFF && byte_at(1) == 0xFE) || (byte_at(0) == 0xFE && byte_at(1) == 0xFF))) {
    bool little = byte_at(0) == 0xFF;
    encoding_ = little ? "utf-16-le" : "utf-16-be";
    auto unit_at = [&](std::size_t i) -> char32_t {
      return little ? (byte_at(i) | (byte_at(i + 1) << 8)) : ((byte_at(i) << 8) | byte_at(i + 1));
    };
    std::size_t i = 0;
    while (i + 1 < bytes.size()) {
      char32_t unit = unit_at(i);
      if (unit >= 0xD800 && unit <= 0xDBFF) {
        if (i + 3 >= bytes.size()) {
          throw ReaderError(name_, i, byte_at(i), encoding_, "unexpected end of data");
        }
        char32_t low = unit_at(i + 2);
        if (low < 0xDC00 || low > 0xDFFF) {
          throw ReaderError(name_, i + 2, byte_at(i + 2), encoding_, "illegal UTF-16 surrogate");
        }
        buffer_->push_back(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
        i += 4;
      } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
        throw ReaderError(name_, i, byte_at(i), encoding_, "illegal encoding");
      } else {
        buffer_->push_back(unit);
        i += 2;
      }
    }
    if (i < bytes.size()) {
      throw ReaderError(name_, i, byte_at(i), encoding_, "truncated data");
    }
    return;
  }

  encoding_ = "utf-8";
  std::size_t bad = decode_utf8(bytes, *buffer_);
  if (bad != std::string_view::npos) {
    throw ReaderError(name_, bad, byte_at(bad), encoding_, "invalid start byte");
  }
}

void Reader::check_printable() const {
  const std::u32string &buf = *buffer_;
  for (std::size_t i = 0; i < buf.size(); ++i) {
    if (!is_printable(buf[i]) && buf[i] != U'\uFEFF') {
      throw ReaderError(name_, i, static_cast<std::uint32_t>(buf[i]), "", "special characters are not allowed");
    }
  }
}

std::u32string Reader::prefix(std::size_t length) const {
  if (pointer_ >= buffer_->size()) {
    return std::u32string();
  }
  return buffer_->substr(pointer_, length);
}

void Reader::forward(std::size_t length) {
  while (length != 0 && pointer_ < buffer_->size()) {
    char32_t ch = (*buffer_)[pointer_];
    ++pointer_;
    ++index_;
    if (ch == U'\n' || (ch == U'\r' && peek() != U'\n')) {
      ++line_;
      column_ = 0;
    } else if (ch != U'\uFEFF') {
      ++column_;
    }
    --length;
  }
}

void Reader::forward_1_1(std::size_t length) {
  while (length != 0 && pointer_ < buffer_->size()) {
    char32_t ch = (*buffer_)[pointer_];
    ++pointer_;
    ++index_;
    if (ch == U'\n' || ch == U'\x85' || ch == U'\u2028' || ch == U'\u2029' || (ch == U'\r' && peek() != U'\n')) {
      ++line_;
      column_ = 0;
    } else if (ch != U'\uFEFF') {
      ++column_;
    }
    --length;
  }
}

} // namespace rtyaml
