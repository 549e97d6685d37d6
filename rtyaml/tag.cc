#include "rtyaml/tag.hh"

namespace rtyaml {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::string uri_decode(std::string_view s) {
  std::string res;
  res.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hex_value(s[i + 1]), lo = hex_value(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        res += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    res += s[i];
  }
  return res;
}

Tag::Tag(std::optional<std::string> handle, std::string suffix, const TagHandles &handles)
    : handle_(std::move(handle)), suffix_(std::move(suffix)) {
  if (!handle_) {
    value_ = uri_decode(suffix_);
    return;
  }
  auto it = handles.find(*handle_);
  value_ = (it != handles.end() ? it->second : *handle_) + uri_decode(suffix_);
}

} // namespace rtyaml
