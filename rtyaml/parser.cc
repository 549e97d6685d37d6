#include "rtyaml/parser.hh"

namespace rtyaml {

namespace {

std::string quoted_id(const Token &token) { return std::string("'") + token.id() + "'"; }

} // namespace

Parser::Parser(Scanner &scanner, WarningHandler warning_handler)
    : scanner_(scanner), warning_handler_(std::move(warning_handler)) {}

bool Parser::fill_current_event() {
  if (!current_event_ && state_ != State::End) {
    current_event_.emplace(next_event());
  }
  return current_event_.has_value();
}

bool Parser::check_event() { return fill_current_event(); }

bool Parser::check_event(std::initializer_list<EventKind> kinds) {
  if (!fill_current_event()) {
    return false;
  }
  for (EventKind kind : kinds) {
    if (current_event_->kind == kind) {
      return true;
    }
  }
  return false;
}

Event *Parser::peek_event() { return fill_current_event() ? &*current_event_ : nullptr; }

Event Parser::get_event() {
  if (!fill_current_event()) {
    throw ParserError("", std::nullopt, "no more events after the stream end", scanner_.reader().get_mark());
  }
  Event event = std::move(*current_event_);
  current_event_.reset();
  return event;
}

Parser::State Parser::pop_state() {
  State state = states_.back();
  states_.pop_back();
  return state;
}

Event Parser::next_event() {
  switch (state_) {
  case State::StreamStart:
    return parse_stream_start();
  case State::ImplicitDocumentStart:
    return parse_implicit_document_start();
  case State::DocumentStart:
    return parse_document_start();
  case State::DocumentEnd:
    return parse_document_end();
  case State::DocumentContent:
    return parse_document_content();
  case State::BlockNode:
    return parse_node(true);
  case State::BlockSequenceFirstEntry:
    return parse_block_sequence_first_entry();
  case State::BlockSequenceEntry:
    return parse_block_sequence_entry();
  case State::IndentlessSequenceEntry:
    return parse_indentless_sequence_entry();
  case State::BlockMappingFirstKey:
    return parse_block_mapping_first_key();
  case State::BlockMappingKey:
    return parse_block_mapping_key();
  case State::BlockMappingValue:
    return parse_block_mapping_value();
  case State::FlowSequenceFirstEntry:
    return parse_flow_sequence_first_entry();
  case State::FlowSequenceEntry:
    return parse_flow_sequence_entry();
  case State::FlowSequenceEntryMappingKey:
    return parse_flow_sequence_entry_mapping_key();
  case State::FlowSequenceEntryMappingValue:
    return parse_flow_sequence_entry_mapping_value();
  case State::FlowSequenceEntryMappingEnd:
    return parse_flow_sequence_entry_mapping_end();
  case State::FlowMappingFirstKey:
    return parse_flow_mapping_first_key();
  case State::FlowMappingKey:
    return parse_flow_mapping_key();
  case State::FlowMappingValue:
    return parse_flow_mapping_value();
  case State::FlowMappingEmptyValue:
    return parse_flow_mapping_empty_value();
  case State::End:
    break;
  }
  throw ParserError("", std::nullopt, "no more events after the stream end", scanner_.reader().get_mark());
}

Event Parser::parse_stream_start() {
  Token token = scanner_.get_token();
  move_token_comment(token);
  state_ = State::ImplicitDocumentStart;
  return Event::stream_start(token.start_mark, token.end_mark, token.encoding);
}

Event Parser::parse_implicit_document_start() {
  if (scanner_.check_token({TokenKind::Directive, TokenKind::DocumentStart, TokenKind::StreamEnd})) {
    return parse_document_start();
  }
  tag_handles_ = default_tag_handles();
  scanner_.set_yaml_version(std::nullopt);
  Mark mark = scanner_.peek_token()->start_mark;
  states_.push_back(State::DocumentEnd);
  state_ = State::BlockNode;
  return Event::document_start(mark, mark, false);
}

Event Parser::parse_document_start() {
  // extra document end indicators
  while (scanner_.check_token({TokenKind::DocumentEnd})) {
    scanner_.get_token();
  }
  if (scanner_.check_token({TokenKind::StreamEnd})) {
    Token token = scanner_.get_token();
    state_ = State::End;
    return Event(EventKind::StreamEnd, token.start_mark, token.end_mark, token.comment);
  }
  auto [version, tags] = process_directives();
  if (!scanner_.check_token({TokenKind::DocumentStart})) {
    const Token *token = scanner_.peek_token();
    throw ParserError("", std::nullopt, "expected '<document start>', but found " + quoted_id(*token),
                      token->start_mark);
  }
  Token token = scanner_.get_token();
  states_.push_back(State::DocumentEnd);
  state_ = State::DocumentContent;
  return Event::document_start(token.start_mark, token.end_mark, true, version, std::move(tags), token.comment);
}

Event Parser::parse_document_end() {
  Mark start_mark = scanner_.peek_token()->start_mark;
  Mark end_mark = start_mark;
  bool explicit_end = false;
  if (scanner_.check_token({TokenKind::DocumentEnd})) {
    Token token = scanner_.get_token();
    end_mark = token.end_mark;
    explicit_end = true;
  }
  if (scanner_.processing_version() == VersionInfo{1, 1}) {
    state_ = State::DocumentStart;
  } else {
    // after an explicit end marker the next document may start without `---`
    state_ = explicit_end ? State::ImplicitDocumentStart : State::DocumentStart;
  }
  return Event::document_end(start_mark, end_mark, explicit_end);
}

Event Parser::parse_document_content() {
  if (scanner_.check_token(
          {TokenKind::Directive, TokenKind::DocumentStart, TokenKind::DocumentEnd, TokenKind::StreamEnd})) {
    Event event = process_empty_scalar(scanner_.peek_token()->start_mark);
    state_ = pop_state();
    return event;
  }
  return parse_node(true);
}

std::pair<std::optional<VersionInfo>, TagHandles> Parser::process_directives() {
  std::optional<VersionInfo> yaml_version;
  tag_handles_.clear();
  while (scanner_.check_token({TokenKind::Directive})) {
    Token token = scanner_.get_token();
    if (token.value == "YAML") {
      if (yaml_version) {
        throw ParserError("", std::nullopt, "found duplicate YAML directive", token.start_mark);
      }
      if (!token.version || token.version->major != 1) {
        throw ParserError("", std::nullopt, "found incompatible YAML document (version 1.* is required)",
                          token.start_mark);
      }
      yaml_version = token.version;
      if (yaml_version->minor > 2 && warning_handler_) {
        warning_handler_(MarkedWarning{WarningKind::Version, "", std::nullopt,
                                       "found YAML " + yaml_version->str() + ", processing it as YAML 1.2",
                                       token.start_mark, ""});
      }
    } else if (token.value == "TAG") {
      const auto &[handle, prefix] = token.tag_directive;
      if (tag_handles_.count(handle)) {
        throw ParserError("", std::nullopt, "duplicate tag handle '" + handle + "'", token.start_mark);
      }
      tag_handles_[handle] = prefix;
    }
  }
  TagHandles tags = tag_handles_;
  loaded_version_ = yaml_version;
  for (const auto &[handle, prefix] : tag_handles_) {
    loaded_tags_[handle] = prefix;
  }
  for (const auto &[handle, prefix] : default_tag_handles()) {
    tag_handles_.emplace(handle, prefix);
  }
  scanner_.set_yaml_version(yaml_version);
  return {yaml_version, std::move(tags)};
}

Event Parser::parse_node(bool block, bool indentless_sequence) {
  if (scanner_.check_token({TokenKind::Alias})) {
    Token token = scanner_.get_token();
    state_ = pop_state();
    return Event::alias(token.value, token.start_mark, token.end_mark);
  }

  std::optional<std::string> anchor;
  std::optional<Token> tag_token;
  std::optional<Mark> start_mark, end_mark, tag_mark;
  if (scanner_.check_token({TokenKind::Anchor})) {
    Token token = scanner_.get_token();
    move_token_comment(token);
    start_mark = token.start_mark;
    end_mark = token.end_mark;
    anchor = token.value;
    if (scanner_.check_token({TokenKind::Tag})) {
      tag_token.emplace(scanner_.get_token());
      tag_mark = tag_token->start_mark;
      end_mark = tag_token->end_mark;
    }
  } else if (scanner_.check_token({TokenKind::Tag})) {
    tag_token.emplace(scanner_.get_token());
    start_mark = tag_mark = tag_token->start_mark;
    end_mark = tag_token->end_mark;
    if (scanner_.check_token({TokenKind::Anchor})) {
      Token token = scanner_.get_token();
      start_mark = tag_mark = token.start_mark;
      end_mark = token.end_mark;
      anchor = token.value;
    }
  }

  std::optional<Tag> tag;
  if (tag_token) {
    if (!Tag::is_known_handle(tag_token->tag_handle, tag_handles_)) {
      throw ParserError("while parsing a node", start_mark, "found undefined tag handle '" + *tag_token->tag_handle + "'",
                        tag_mark);
    }
    tag.emplace(tag_token->tag_handle, tag_token->tag_suffix, tag_handles_);
  }
  if (!start_mark) {
    start_mark = end_mark = scanner_.peek_token()->start_mark;
  }
  bool implicit = !tag || *tag == "!";

  if (indentless_sequence && scanner_.check_token({TokenKind::BlockEntry})) {
    Token *pt = scanner_.peek_token();
    CommentSlots comment;
    if (!comment_slot(pt->comment, 0).empty()) {
      comment = {pt->comment[0], {}};
      pt->comment[0].clear();
    }
    state_ = State::IndentlessSequenceEntry;
    return Event::collection_start(EventKind::SequenceStart, anchor, tag, implicit, *start_mark, pt->end_mark, false,
                                   std::move(comment));
  }

  if (scanner_.check_token({TokenKind::Scalar})) {
    Token token = scanner_.get_token();
    ScalarImplicit dimplicit;
    if ((token.plain && !tag) || (tag && *tag == "!")) {
      dimplicit = {true, false};
    } else if (!tag) {
      dimplicit = {false, true};
    } else {
      dimplicit = {false, false};
    }
    state_ = pop_state();
    return Event::scalar(anchor, tag, dimplicit, token.value, *start_mark, token.end_mark, token.style,
                         token.comment);
  }
  if (scanner_.check_token({TokenKind::FlowSequenceStart})) {
    Token *pt = scanner_.peek_token();
    state_ = State::FlowSequenceFirstEntry;
    return Event::collection_start(EventKind::SequenceStart, anchor, tag, implicit, *start_mark, pt->end_mark, true,
                                   pt->comment);
  }
  if (scanner_.check_token({TokenKind::FlowMappingStart})) {
    Token *pt = scanner_.peek_token();
    state_ = State::FlowMappingFirstKey;
    return Event::collection_start(EventKind::MappingStart, anchor, tag, implicit, *start_mark, pt->end_mark, true,
                                   pt->comment);
  }
  if (block && scanner_.check_token({TokenKind::BlockSequenceStart})) {
    Token *pt = scanner_.peek_token();
    CommentSlots comment = pt->comment;
    if (comment.empty() || comment_slot(comment, 1).empty()) {
      comment = pt->split_old_comment();
    }
    state_ = State::BlockSequenceFirstEntry;
    return Event::collection_start(EventKind::SequenceStart, anchor, tag, implicit, *start_mark, pt->start_mark,
                                   false, std::move(comment));
  }
  if (block && scanner_.check_token({TokenKind::BlockMappingStart})) {
    Token *pt = scanner_.peek_token();
    state_ = State::BlockMappingFirstKey;
    return Event::collection_start(EventKind::MappingStart, anchor, tag, implicit, *start_mark, pt->start_mark,
                                   false, pt->comment);
  }
  if (anchor || tag) {
    // empty scalars are allowed even if a tag or an anchor is specified
    state_ = pop_state();
    return Event::scalar(anchor, tag, ScalarImplicit{implicit, false}, "", *start_mark, *end_mark);
  }
  const Token *token = scanner_.peek_token();
  throw ParserError(std::string("while parsing a ") + (block ? "block" : "flow") + " node", start_mark,
                    "expected the node content, but found " + quoted_id(*token), token->start_mark);
}

Event Parser::parse_block_sequence_first_entry() {
  Token token = scanner_.get_token();
  marks_.push_back(token.start_mark);
  return parse_block_sequence_entry();
}

Event Parser::parse_block_sequence_entry() {
  if (scanner_.check_token({TokenKind::BlockEntry})) {
    Token token = scanner_.get_token();
    move_token_comment(token);
    if (!scanner_.check_token({TokenKind::BlockEntry, TokenKind::BlockEnd})) {
      states_.push_back(State::BlockSequenceEntry);
      return parse_node(true);
    }
    state_ = State::BlockSequenceEntry;
    return process_empty_scalar(token.end_mark);
  }
  if (!scanner_.check_token({TokenKind::BlockEnd})) {
    const Token *token = scanner_.peek_token();
    throw ParserError("while parsing a block collection", marks_.back(),
                      "expected <block end>, but found " + quoted_id(*token), token->start_mark);
  }
  Token token = scanner_.get_token();
  state_ = pop_state();
  marks_.pop_back();
  return Event(EventKind::SequenceEnd, token.start_mark, token.end_mark, token.comment);
}

Event Parser::parse_indentless_sequence_entry() {
  if (scanner_.check_token({TokenKind::BlockEntry})) {
    Token token = scanner_.get_token();
    move_token_comment(token);
    if (!scanner_.check_token({TokenKind::BlockEntry, TokenKind::Key, TokenKind::Value, TokenKind::BlockEnd})) {
      states_.push_back(State::IndentlessSequenceEntry);
      return parse_node(true);
    }
    state_ = State::IndentlessSequenceEntry;
    return process_empty_scalar(token.end_mark);
  }
  const Token *token = scanner_.peek_token();
  state_ = pop_state();
  return Event(EventKind::SequenceEnd, token->start_mark, token->start_mark, token->comment);
}

Event Parser::parse_block_mapping_first_key() {
  Token token = scanner_.get_token();
  marks_.push_back(token.start_mark);
  return parse_block_mapping_key();
}

Event Parser::parse_block_mapping_key() {
  if (scanner_.check_token({TokenKind::Key})) {
    Token token = scanner_.get_token();
    move_token_comment(token);
    if (!scanner_.check_token({TokenKind::Key, TokenKind::Value, TokenKind::BlockEnd})) {
      states_.push_back(State::BlockMappingValue);
      return parse_node(true, true);
    }
    state_ = State::BlockMappingValue;
    return process_empty_scalar(token.end_mark);
  }
  if (scanner_.processing_version() > VersionInfo{1, 1} && scanner_.check_token({TokenKind::Value})) {
    state_ = State::BlockMappingValue;
    return process_empty_scalar(scanner_.peek_token()->start_mark);
  }
  if (!scanner_.check_token({TokenKind::BlockEnd})) {
    const Token *token = scanner_.peek_token();
    throw ParserError("while parsing a block mapping", marks_.back(),
                      "expected <block end>, but found " + quoted_id(*token), token->start_mark);
  }
  Token token = scanner_.get_token();
  move_token_comment(token);
  state_ = pop_state();
  marks_.pop_back();
  return Event(EventKind::MappingEnd, token.start_mark, token.end_mark, token.comment);
}

Event Parser::parse_block_mapping_value() {
  if (!scanner_.check_token({TokenKind::Value})) {
    state_ = State::BlockMappingKey;
    return process_empty_scalar(scanner_.peek_token()->start_mark);
  }
  Token token = scanner_.get_token();
  // a comment on the value indicator belongs to what follows, e.g. a block collection
  if (scanner_.check_token({TokenKind::Value})) {
    move_token_comment(token);
  } else if (!scanner_.check_token({TokenKind::Key})) {
    move_token_comment(token, nullptr, true);
  }
  if (!scanner_.check_token({TokenKind::Key, TokenKind::Value, TokenKind::BlockEnd})) {
    states_.push_back(State::BlockMappingKey);
    return parse_node(true, true);
  }
  state_ = State::BlockMappingKey;
  if (!token.comment.empty()) {
    return process_empty_scalar(token.end_mark, token.comment);
  }
  // the eol comment of the next token belongs to the empty value
  Token *pt = scanner_.peek_token();
  CommentSlots comment;
  if (!pt->comment.empty()) {
    comment = {comment_slot(pt->comment, 0), {}};
    pt->comment = {{}, comment_slot(pt->comment, 1)};
  }
  return process_empty_scalar(pt->end_mark, std::move(comment));
}

Event Parser::parse_flow_sequence_first_entry() {
  Token token = scanner_.get_token();
  marks_.push_back(token.start_mark);
  return parse_flow_sequence_entry(true);
}

Event Parser::parse_flow_sequence_entry(bool first) {
  if (!scanner_.check_token({TokenKind::FlowSequenceEnd})) {
    if (!first) {
      if (scanner_.check_token({TokenKind::FlowEntry})) {
        scanner_.get_token();
      } else {
        const Token *token = scanner_.peek_token();
        throw ParserError("while parsing a flow sequence", marks_.back(),
                          "expected ',' or ']', but got " + quoted_id(*token), token->start_mark);
      }
    }
    if (scanner_.check_token({TokenKind::Key})) {
      const Token *token = scanner_.peek_token();
      state_ = State::FlowSequenceEntryMappingKey;
      return Event::collection_start(EventKind::MappingStart, std::nullopt, std::nullopt, true, token->start_mark,
                                     token->end_mark, true);
    }
    if (!scanner_.check_token({TokenKind::FlowSequenceEnd})) {
      states_.push_back(State::FlowSequenceEntry);
      return parse_node(false);
    }
  }
  Token token = scanner_.get_token();
  state_ = pop_state();
  marks_.pop_back();
  return Event(EventKind::SequenceEnd, token.start_mark, token.end_mark, token.comment);
}

Event Parser::parse_flow_sequence_entry_mapping_key() {
  Token token = scanner_.get_token();
  if (!scanner_.check_token({TokenKind::Value, TokenKind::FlowEntry, TokenKind::FlowSequenceEnd})) {
    states_.push_back(State::FlowSequenceEntryMappingValue);
    return parse_node(false);
  }
  state_ = State::FlowSequenceEntryMappingValue;
  return process_empty_scalar(token.end_mark);
}

Event Parser::parse_flow_sequence_entry_mapping_value() {
  if (!scanner_.check_token({TokenKind::Value})) {
    state_ = State::FlowSequenceEntryMappingEnd;
    return process_empty_scalar(scanner_.peek_token()->start_mark);
  }
  Token token = scanner_.get_token();
  if (!scanner_.check_token({TokenKind::FlowEntry, TokenKind::FlowSequenceEnd})) {
    states_.push_back(State::FlowSequenceEntryMappingEnd);
    return parse_node(false);
  }
  state_ = State::FlowSequenceEntryMappingEnd;
  return process_empty_scalar(token.end_mark);
}

Event Parser::parse_flow_sequence_entry_mapping_end() {
  state_ = State::FlowSequenceEntry;
  Mark mark = scanner_.peek_token()->start_mark;
  return Event(EventKind::MappingEnd, mark, mark);
}

Event Parser::parse_flow_mapping_first_key() {
  Token token = scanner_.get_token();
  marks_.push_back(token.start_mark);
  return parse_flow_mapping_key(true);
}

Event Parser::parse_flow_mapping_key(bool first) {
  if (!scanner_.check_token({TokenKind::FlowMappingEnd})) {
    if (!first) {
      if (scanner_.check_token({TokenKind::FlowEntry})) {
        scanner_.get_token();
      } else {
        const Token *token = scanner_.peek_token();
        throw ParserError("while parsing a flow mapping", marks_.back(),
                          "expected ',' or '}', but got " + quoted_id(*token), token->start_mark);
      }
    }
    if (scanner_.check_token({TokenKind::Key})) {
      Token token = scanner_.get_token();
      if (!scanner_.check_token({TokenKind::Value, TokenKind::FlowEntry, TokenKind::FlowMappingEnd})) {
        states_.push_back(State::FlowMappingValue);
        return parse_node(false);
      }
      state_ = State::FlowMappingValue;
      return process_empty_scalar(token.end_mark);
    }
    if (scanner_.processing_version() > VersionInfo{1, 1} && scanner_.check_token({TokenKind::Value})) {
      state_ = State::FlowMappingValue;
      return process_empty_scalar(scanner_.peek_token()->end_mark);
    }
    if (!scanner_.check_token({TokenKind::FlowMappingEnd})) {
      states_.push_back(State::FlowMappingEmptyValue);
      return parse_node(false);
    }
  }
  Token token = scanner_.get_token();
  state_ = pop_state();
  marks_.pop_back();
  return Event(EventKind::MappingEnd, token.start_mark, token.end_mark, token.comment);
}

Event Parser::parse_flow_mapping_value() {
  if (!scanner_.check_token({TokenKind::Value})) {
    state_ = State::FlowMappingKey;
    return process_empty_scalar(scanner_.peek_token()->start_mark);
  }
  Token token = scanner_.get_token();
  if (!scanner_.check_token({TokenKind::FlowEntry, TokenKind::FlowMappingEnd})) {
    states_.push_back(State::FlowMappingKey);
    return parse_node(false);
  }
  state_ = State::FlowMappingKey;
  return process_empty_scalar(token.end_mark);
}

Event Parser::parse_flow_mapping_empty_value() {
  state_ = State::FlowMappingKey;
  return process_empty_scalar(scanner_.peek_token()->start_mark);
}

Event Parser::process_empty_scalar(const Mark &mark, CommentSlots comment) {
  return Event::scalar(std::nullopt, std::nullopt, ScalarImplicit{true, false}, "", mark, mark, ScalarStyle::Plain,
                       std::move(comment));
}

void Parser::move_token_comment(Token &, Token *, bool) {}

void RoundTripParser::move_token_comment(Token &token, Token *next, bool empty) {
  if (!next) {
    next = scanner_.peek_token();
  }
  if (next) {
    token.move_old_comment(*next, empty);
  }
}

} // namespace rtyaml
