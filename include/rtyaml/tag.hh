#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rtyaml {

// Tag handles in effect for a document, handle -> prefix
using TagHandles = std::map<std::string, std::string>;

inline const TagHandles &default_tag_handles() {
  static const TagHandles handles{{"!", "!"}, {"!!", "tag:yaml.org,2002:"}};
  return handles;
}

inline constexpr std::string_view kYamlTagPrefix = "tag:yaml.org,2002:";

// A node tag as written in the source plus its expanded value
//
// Tags read from a document keep their handle and (still %-escaped) suffix so the original spelling
// is known; tags made on dump only carry the expanded value. Two tags are equal when their
// expanded values are.
class Tag {
private:
  std::optional<std::string> handle_;
  std::string suffix_;
  std::string value_;

public:
  Tag() = default;

  // A tag with a fully expanded value, e.g. `tag:yaml.org,2002:str`
  explicit Tag(std::string value) : suffix_(value), value_(std::move(value)) {}

  // `handles` must contain `handle`, callers check with is_known_handle() first
  Tag(std::optional<std::string> handle, std::string suffix, const TagHandles &handles);

  const std::optional<std::string> &handle() const noexcept { return handle_; }
  const std::string &suffix() const noexcept { return suffix_; }
  const std::string &value() const noexcept { return value_; }

  bool empty() const noexcept { return value_.empty(); }
  bool starts_with(std::string_view prefix) const noexcept { return value_.starts_with(prefix); }

  // The short form of a standard tag, `str` for `tag:yaml.org,2002:str`, empty for other tags
  std::string_view yaml_suffix() const noexcept {
    if (!starts_with(kYamlTagPrefix))
      return {};
    return std::string_view(value_).substr(kYamlTagPrefix.size());
  }

  bool operator==(const Tag &other) const noexcept { return value_ == other.value_; }
  bool operator==(std::string_view other) const noexcept { return value_ == other; }

  static bool is_known_handle(const std::optional<std::string> &handle, const TagHandles &handles) {
    return !handle || handles.count(*handle) > 0;
  }
};

// Replace each %XX escape by the byte it encodes
std::string uri_decode(std::string_view s);

// The tag of a standard type, e.g. yaml_tag("int") == "tag:yaml.org,2002:int"
inline std::string yaml_tag(std::string_view name) {
  std::string s(kYamlTagPrefix);
  s += name;
  return s;
}

} // namespace rtyaml
