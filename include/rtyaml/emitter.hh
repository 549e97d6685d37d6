#pragma once

#include "./events.hh"

#include <deque>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace rtyaml {

// Writes an event stream as YAML text
//
//   stream   ::= STREAM-START document* STREAM-END
//   document ::= DOCUMENT-START node DOCUMENT-END
//   node     ::= SCALAR | sequence | mapping
//
// Like the parser this is a state machine with a stack of states for nested collections. A
// collection start is held back until enough events are queued to tell whether it is empty, and
// whether a mapping has a single entry. Columns count code points; the comments carried by the
// events are written at their original column where the output still allows it.
class Emitter {
public:
  struct Options {
    bool canonical = false;
    // requested indent, also the mapping and sequence indent when between 2 and 9
    std::optional<int> indent;
    std::optional<int> map_indent;
    std::optional<int> sequence_indent;
    // spaces before the dash of a block sequence item
    int sequence_dash_offset = 0;
    std::optional<int> width;
    bool allow_unicode = true;
    // "\r", "\n" or "\r\n"
    std::string line_break = "\n";
    // column for the colon of top level keys
    std::optional<int> top_level_colon_align;
    // written before every colon that separates a key from its value
    std::string prefix_colon;
    // `[{a: 1}]` instead of `[a: 1]`
    bool brace_single_entry_mapping_in_flow_sequence = false;
    // `- - a` instead of a nested sequence on its own line
    bool compact_seq_seq = true;
    // `- a: 1` instead of a mapping on its own line
    bool compact_seq_map = true;
    // a root scalar goes on the `---` line
    bool scalar_after_indicator = true;
    // version the output is written for, 1.1 treats `?` as a flow indicator
    std::optional<VersionInfo> version;
  };

protected:
  enum class State {
    StreamStart,
    FirstDocumentStart,
    DocumentStart,
    DocumentEnd,
    DocumentRoot,
    Nothing,
    FirstFlowSequenceItem,
    FlowSequenceItem,
    FirstFlowMappingKey,
    FlowMappingKey,
    FlowMappingSimpleValue,
    FlowMappingValue,
    FirstBlockSequenceItem,
    BlockSequenceItem,
    FirstBlockMappingKey,
    BlockMappingKey,
    BlockMappingSimpleValue,
    BlockMappingValue,
  };

  // Indentation levels, each remembering whether it was opened by a sequence
  class Indents {
  private:
    std::vector<std::pair<std::optional<int>, bool>> values_;

  public:
    void push(std::optional<int> indent, bool seq) { values_.emplace_back(indent, seq); }
    std::optional<int> pop() {
      std::optional<int> indent = values_.back().first;
      values_.pop_back();
      return indent;
    }
    bool empty() const noexcept { return values_.empty(); }
    bool top_seq() const noexcept { return !values_.empty() && values_.back().second; }
    // whether the level below the top one was opened by a sequence
    bool last_seq() const noexcept { return values_.size() >= 2 && values_[values_.size() - 2].second; }
    // extra spaces before a flow sequence or mapping that follows a dash
    int seq_flow_align(int seq_indent, int column, bool pre_comment = false) const;
  };

  struct ScalarAnalysis {
    std::u32string scalar;
    bool empty = false;
    bool multiline = false;
    bool allow_flow_plain = false;
    bool allow_block_plain = false;
    bool allow_single_quoted = false;
    bool allow_double_quoted = false;
    bool allow_block = false;
  };

  std::ostream &stream_;
  Options options_;
  std::string encoding_;

  State state_ = State::StreamStart;
  std::vector<State> states_;

  std::deque<Event> events_;
  std::optional<Event> event_;

  Indents indents_;
  std::optional<int> indent_;

  // '[' or '{' for each open flow collection, '' for a single entry mapping without braces
  std::vector<std::u32string> flow_context_;

  bool root_context_ = false;
  bool sequence_context_ = false;
  bool mapping_context_ = false;
  bool simple_key_context_ = false;

  int line_ = 0;
  int column_ = 0;
  bool whitespace_ = true;
  bool indention_ = true;
  bool no_newline_ = false; // set right after `- `
  bool open_ended_ = false; // the document needs an explicit end marker

  std::u32string colon_ = U":";
  std::u32string prefixed_colon_;
  std::u32string best_line_break_;
  int best_sequence_indent_ = 2;
  int best_map_indent_ = 2;
  int best_width_ = 80;
  std::optional<int> requested_indent_;

  std::map<std::string, std::string> tag_prefixes_; // prefix -> handle

  std::optional<std::u32string> prepared_anchor_;
  std::optional<std::u32string> prepared_tag_;
  std::optional<ScalarAnalysis> analysis_;
  std::optional<ScalarStyle> style_;

  std::u32string alt_null_ = U"null";

  int flow_level() const noexcept { return static_cast<int>(flow_context_.size()); }

  bool need_more_events() const;
  bool need_events(std::size_t count) const;
  void increase_indent(bool flow = false, bool sequence = false, bool indentless = false);
  State pop_state();
  void run_state();

  void expect_stream_start();
  void expect_nothing();
  void expect_document_start(bool first = false);
  void expect_document_end();
  void expect_document_root();
  void expect_node(bool root = false, bool sequence = false, bool mapping = false, bool simple_key = false);
  void expect_alias();
  void expect_scalar();
  void expect_flow_sequence(bool force_flow_indent = false);
  void expect_first_flow_sequence_item();
  void expect_flow_sequence_item();
  void expect_flow_mapping(bool single = false, bool force_flow_indent = false);
  void expect_flow_mapping_key(bool first = false);
  void expect_flow_mapping_simple_value();
  void expect_flow_mapping_value();
  void expect_block_sequence();
  void expect_block_sequence_item(bool first = false);
  void expect_block_mapping();
  void expect_block_mapping_key(bool first = false);
  void expect_block_mapping_simple_value();
  void expect_block_mapping_value();

  bool check_empty_sequence() const;
  bool check_empty_mapping() const;
  bool check_empty_document() const;
  bool check_simple_key();

  bool process_anchor(std::u32string_view indicator);
  void process_tag();
  ScalarStyle choose_scalar_style();
  void process_scalar();

  std::u32string prepare_version(const VersionInfo &version) const;
  std::u32string prepare_tag_handle(const std::string &handle) const;
  std::u32string prepare_tag_prefix(const std::string &prefix) const;
  std::u32string prepare_tag(const std::string &tag) const;
  std::u32string prepare_anchor(const std::string &anchor) const;
  ScalarAnalysis analyze_scalar(const std::string &scalar) const;

  void stream_write(std::u32string_view data);
  void flush_stream();
  void write_stream_start();
  void write_stream_end();
  void write_indicator(std::u32string_view indicator, bool need_whitespace, bool whitespace = false,
                       bool indention = false);
  void write_indent();
  void write_line_break(std::optional<char32_t> data = std::nullopt);
  void write_version_directive(std::u32string_view version_text);
  void write_tag_directive(std::u32string_view handle_text, std::u32string_view prefix_text);
  void write_root_break();
  void write_single_quoted(const std::u32string &text, bool split = true);
  void write_double_quoted(const std::u32string &text, bool split = true);
  // `hints`, the indent to use for the content, and the chomping indicator
  std::tuple<std::u32string, int, char32_t> determine_block_hints(const std::u32string &text) const;
  void write_folded(const std::u32string &text);
  void write_literal(const std::u32string &text, const std::string &header_comment);
  void write_plain(const std::u32string &text, bool split = true);
  void write_comment(const CommentToken &comment, bool pre = false);
  bool write_pre_comment(const Event &event);
  bool write_post_comment(const Event &event);

public:
  explicit Emitter(std::ostream &stream) : Emitter(stream, Options()) {}
  Emitter(std::ostream &stream, Options options);
  virtual ~Emitter() = default;

  Emitter(const Emitter &) = delete;
  Emitter &operator=(const Emitter &) = delete;

  const Options &options() const noexcept { return options_; }

  // Queue `event` and write out whatever the queued events allow
  void emit(Event event);
};

} // namespace rtyaml
