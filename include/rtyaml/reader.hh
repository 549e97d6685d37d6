#pragma once

#include "./error.hh"

#include <memory>
#include <string>
#include <string_view>

namespace rtyaml {

// Decoded character stream with position tracking
//
// The whole input is decoded up front: UTF-16 LE/BE by BOM, UTF-8 otherwise. A BOM is kept in the
// buffer (the scanner skips it at index 0) and never counts as a column. A NUL terminates the buffer.
class Reader {
private:
  std::string name_;
  std::string encoding_;
  std::shared_ptr<std::u32string> buffer_;
  std::size_t pointer_ = 0;
  std::size_t index_ = 0;
  std::size_t line_ = 0;
  std::size_t column_ = 0;

  void decode(std::string_view bytes);
  void check_printable() const;

public:
  // Raw bytes, the encoding is detected from a BOM
  explicit Reader(std::string_view bytes, std::string name = "<byte string>");

  // Already decoded text
  explicit Reader(std::u32string text, std::string name = "<unicode string>");

  const std::string &name() const noexcept { return name_; }
  const std::string &encoding() const noexcept { return encoding_; }
  std::size_t index() const noexcept { return index_; }
  std::size_t line() const noexcept { return line_; }
  std::size_t column() const noexcept { return column_; }

  // The character `index` positions ahead, NUL past the end
  char32_t peek(std::size_t index = 0) const noexcept {
    std::size_t at = pointer_ + index;
    return at < buffer_->size() ? (*buffer_)[at] : U'\0';
  }

  std::u32string prefix(std::size_t length = 1) const;

  // Advance, counting '\n' and a lone '\r' as line ends (YAML 1.2)
  void forward(std::size_t length = 1);

  // Advance, also counting '\x85', '\u2028' and '\u2029' as line ends (YAML 1.1)
  void forward_1_1(std::size_t length = 1);

  Mark get_mark() const { return Mark(name_, index_, line_, column_, buffer_, pointer_); }
};

} // namespace rtyaml
