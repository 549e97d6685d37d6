#pragma once

#include "./events.hh"
#include "./scanner.hh"

#include <initializer_list>
#include <optional>
#include <vector>

namespace rtyaml {

// Turns tokens into events following the YAML grammar
//
//   stream   ::= STREAM-START implicit_document? explicit_document* STREAM-END
//   document ::= DIRECTIVE* DOCUMENT-START block_node? DOCUMENT-END*
//   node     ::= ALIAS | properties? (block_content | flow_content)
//
// The grammar is run as a state machine: `state_` is the production to continue with, `states_`
// holds where to go once the current node is complete.
class Parser {
protected:
  enum class State {
    StreamStart,
    ImplicitDocumentStart,
    DocumentStart,
    DocumentEnd,
    DocumentContent,
    BlockNode,
    BlockSequenceFirstEntry,
    BlockSequenceEntry,
    IndentlessSequenceEntry,
    BlockMappingFirstKey,
    BlockMappingKey,
    BlockMappingValue,
    FlowSequenceFirstEntry,
    FlowSequenceEntry,
    FlowSequenceEntryMappingKey,
    FlowSequenceEntryMappingValue,
    FlowSequenceEntryMappingEnd,
    FlowMappingFirstKey,
    FlowMappingKey,
    FlowMappingValue,
    FlowMappingEmptyValue,
    End,
  };

  Scanner &scanner_;
  WarningHandler warning_handler_;

  std::optional<Event> current_event_;
  State state_ = State::StreamStart;
  std::vector<State> states_;
  std::vector<Mark> marks_;
  TagHandles tag_handles_;

  // %TAG handles and %YAML version as found in the directives, for dumping with the same header
  TagHandles loaded_tags_;
  std::optional<VersionInfo> loaded_version_;

  bool fill_current_event();
  Event next_event();
  State pop_state();

  Event parse_stream_start();
  Event parse_implicit_document_start();
  Event parse_document_start();
  Event parse_document_end();
  Event parse_document_content();
  std::pair<std::optional<VersionInfo>, TagHandles> process_directives();

  Event parse_node(bool block, bool indentless_sequence = false);
  Event parse_block_sequence_first_entry();
  Event parse_block_sequence_entry();
  Event parse_indentless_sequence_entry();
  Event parse_block_mapping_first_key();
  Event parse_block_mapping_key();
  Event parse_block_mapping_value();
  Event parse_flow_sequence_first_entry();
  Event parse_flow_sequence_entry(bool first = false);
  Event parse_flow_sequence_entry_mapping_key();
  Event parse_flow_sequence_entry_mapping_value();
  Event parse_flow_sequence_entry_mapping_end();
  Event parse_flow_mapping_first_key();
  Event parse_flow_mapping_key(bool first = false);
  Event parse_flow_mapping_value();
  Event parse_flow_mapping_empty_value();

  static Event process_empty_scalar(const Mark &mark, CommentSlots comment = {});

  // Hand the comment of a consumed token on to `next`, or to the next token in the queue
  virtual void move_token_comment(Token &token, Token *next = nullptr, bool empty = false);

public:
  explicit Parser(Scanner &scanner, WarningHandler warning_handler = default_warning_handler);
  virtual ~Parser() = default;

  Parser(const Parser &) = delete;
  Parser &operator=(const Parser &) = delete;

  // Whether there is a next event, or one of `kinds`
  bool check_event();
  bool check_event(std::initializer_list<EventKind> kinds);

  // The next event without consuming it, nullptr after the stream end
  Event *peek_event();

  // Consume the next event, throws ParserError after the stream end
  Event get_event();

  const TagHandles &loaded_tags() const noexcept { return loaded_tags_; }
  const std::optional<VersionInfo> &loaded_version() const noexcept { return loaded_version_; }

  Scanner &scanner() noexcept { return scanner_; }
};

// Parser that threads comments from token to token, so each ends up on the event it belongs to
class RoundTripParser : public Parser {
protected:
  void move_token_comment(Token &token, Token *next = nullptr, bool empty = false) override;

public:
  using Parser::Parser;
};

} // namespace rtyaml
