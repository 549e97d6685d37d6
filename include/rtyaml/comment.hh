#pragma once

#include "./error.hh"

#include <memory>
#include <string>
#include <vector>

namespace rtyaml {

// A run of comment lines and/or blank lines as found in the source
//
// `value` holds the raw text including the `#` and all line breaks. Comments created by the host
// program only carry a column in their start mark.
struct CommentToken {
  std::string value;
  Mark start_mark;
  Mark end_mark;
  bool pre_done = false;     // set by the emitter once written as a pre comment
  bool block_header = false; // the comment after a `|` or `>` indicator, written on the indicator line
  std::size_t gap = 0;       // spaces between an eol comment and the token it follows, 0 when unknown

  CommentToken(std::string value, Mark start_mark, Mark end_mark = Mark())
      : value(std::move(value)), start_mark(std::move(start_mark)), end_mark(std::move(end_mark)) {}

  std::size_t column() const noexcept { return start_mark.column; }
  void reset() noexcept { pre_done = false; }
};

// Comment tokens are shared between tokens, events, nodes and containers
using CommentRef = std::shared_ptr<CommentToken>;
using CommentGroup = std::vector<CommentRef>;

// Positional comment slots, an empty group stands for "no comment in this slot"
//
// Tokens, events and nodes use [eol, pre] and optionally [eol, pre, -, -, eol-of-empty-value] or a
// third end slot. Mapping items use [key-eol, key-pre, value-eol, value-post], sequence items [eol, pre].
using CommentSlots = std::vector<CommentGroup>;

inline CommentRef make_comment(std::string value, Mark start_mark, Mark end_mark = Mark()) {
  return std::make_shared<CommentToken>(std::move(value), std::move(start_mark), std::move(end_mark));
}

// The group at `pos`, empty when the slots are shorter
inline const CommentGroup &comment_slot(const CommentSlots &slots, std::size_t pos) {
  static const CommentGroup none;
  return pos < slots.size() ? slots[pos] : none;
}

// The single comment in an eol slot, or null
inline CommentRef comment_at(const CommentSlots &slots, std::size_t pos) {
  const CommentGroup &group = comment_slot(slots, pos);
  return group.empty() ? nullptr : group.front();
}

inline void set_comment_slot(CommentSlots &slots, std::size_t pos, CommentGroup group) {
  if (slots.size() <= pos) {
    slots.resize(pos + 1);
  }
  slots[pos] = std::move(group);
}

inline bool has_comment(const CommentSlots &slots) noexcept {
  for (const auto &group : slots) {
    if (!group.empty()) {
      return true;
    }
  }
  return false;
}

} // namespace rtyaml
