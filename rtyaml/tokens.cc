#include "rtyaml/tokens.hh"

namespace rtyaml {

const char *token_id(TokenKind kind) noexcept {
  switch (kind) {
  case TokenKind::StreamStart:
    return "<stream start>";
  case TokenKind::StreamEnd:
    return "<stream end>";
  case TokenKind::Directive:
    return "<directive>";
  case TokenKind::DocumentStart:
    return "<document start>";
  case TokenKind::DocumentEnd:
    return "<document end>";
  case TokenKind::BlockSequenceStart:
    return "<block sequence start>";
  case TokenKind::BlockMappingStart:
    return "<block mapping start>";
  case TokenKind::BlockEnd:
    return "<block end>";
  case TokenKind::FlowSequenceStart:
    return "[";
  case TokenKind::FlowMappingStart:
    return "{";
  case TokenKind::FlowSequenceEnd:
    return "]";
  case TokenKind::FlowMappingEnd:
    return "}";
  case TokenKind::Key:
    return "?";
  case TokenKind::Value:
    return ":";
  case TokenKind::BlockEntry:
    return "-";
  case TokenKind::FlowEntry:
    return ",";
  case TokenKind::Alias:
    return "<alias>";
  case TokenKind::Anchor:
    return "<anchor>";
  case TokenKind::Tag:
    return "<tag>";
  case TokenKind::Scalar:
    return "<scalar>";
  case TokenKind::Comment:
    return "<comment>";
  }
  return "<unknown>";
}

void Token::add_post_comment(CommentRef c) {
  if (comment.size() < 2) {
    comment.resize(2);
  }
  comment[0] = CommentGroup{std::move(c)};
}

void Token::add_pre_comments(CommentGroup comments) {
  if (comment.size() < 2) {
    comment.resize(2);
  }
  comment[1] = std::move(comments);
}

void Token::move_old_comment(Token &target, bool empty) {
  if (comment.empty()) {
    return;
  }
  if (target.kind == TokenKind::StreamEnd || target.kind == TokenKind::DocumentStart) {
    return;
  }
  CommentSlots c = std::move(comment);
  comment.clear();
  if (target.comment.empty()) {
    if (empty) {
      CommentGroup eol = comment_slot(c, 0);
      target.comment = {eol, comment_slot(c, 1), {}, {}, eol};
    } else {
      target.comment = std::move(c);
    }
    return;
  }
  CommentSlots &tc = target.comment;
  if ((!comment_slot(c, 0).empty() && !comment_slot(tc, 0).empty()) ||
      (!comment_slot(c, 1).empty() && !comment_slot(tc, 1).empty())) {
    throw ParserError("", std::nullopt, "overlap in comment", target.start_mark);
  }
  if (!comment_slot(c, 0).empty()) {
    set_comment_slot(tc, 0, c[0]);
  }
  if (!comment_slot(c, 1).empty()) {
    set_comment_slot(tc, 1, c[1]);
  }
}

CommentSlots Token::split_old_comment() {
  if (comment_slot(comment, 0).empty()) {
    return {};
  }
  CommentSlots ret = {comment[0], {}};
  if (comment_slot(comment, 1).empty()) {
    comment.clear();
  }
  return ret;
}

} // namespace rtyaml
