#pragma once

#include "./comment.hh"

#include <optional>
#include <string>
#include <utility>

namespace rtyaml {

enum class TokenKind {
  StreamStart,
  StreamEnd,
  Directive,
  DocumentStart,
  DocumentEnd,
  BlockSequenceStart,
  BlockMappingStart,
  BlockEnd,
  FlowSequenceStart,
  FlowMappingStart,
  FlowSequenceEnd,
  FlowMappingEnd,
  Key,
  Value,
  BlockEntry,
  FlowEntry,
  Alias,
  Anchor,
  Tag,
  Scalar,
  Comment,
};

// The token id as used in error messages, e.g. `<block end>` or `:`
const char *token_id(TokenKind kind) noexcept;

// Scalar presentation as written in the source, Plain means no indicator
enum class ScalarStyle : char {
  Plain = '\0',
  SingleQuoted = '\'',
  DoubleQuoted = '"',
  Literal = '|',
  Folded = '>',
  // Dump only: a set member key written after `?`, and the empty value of a set member
  ExplicitKey = '?',
  SetValue = '-',
};

struct VersionInfo {
  int major = 1;
  int minor = 2;

  bool operator==(const VersionInfo &) const = default;
  auto operator<=>(const VersionInfo &) const = default;

  std::string str() const { return std::to_string(major) + "." + std::to_string(minor); }
};

struct Token {
  TokenKind kind;
  Mark start_mark;
  Mark end_mark;
  CommentSlots comment; // empty when the token carries no comment

  // Scalar value, alias/anchor name, directive name
  std::string value;
  // Scalar
  bool plain = false;
  ScalarStyle style = ScalarStyle::Plain;
  // Tag: handle is absent for verbatim `!<...>` tags and the bare `!`
  std::optional<std::string> tag_handle;
  std::string tag_suffix;
  // Directive
  std::optional<VersionInfo> version;
  std::pair<std::string, std::string> tag_directive;
  // StreamStart
  std::string encoding;
  // Comment
  CommentRef comment_token;

  Token(TokenKind kind, Mark start_mark, Mark end_mark)
      : kind(kind), start_mark(std::move(start_mark)), end_mark(std::move(end_mark)) {}

  const char *id() const noexcept { return token_id(kind); }

  void add_post_comment(CommentRef c);
  void add_pre_comments(CommentGroup comments);

  // Move this token's comment onto `target`, normally the next token
  //
  // With `empty`, the eol part is duplicated into the fifth slot so the composer can tell that the
  // comment followed a key without value. Throws when both tokens already carry the same slot.
  void move_old_comment(Token &target, bool empty = false);

  // Detach the eol part as a new comment, drops the token comment when no pre part remains
  CommentSlots split_old_comment();
};

} // namespace rtyaml
