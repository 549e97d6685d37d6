#include "rtyaml/emitter.hh"
#include "rtyaml/unicode.hh"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iterator>

namespace rtyaml {

namespace {

constexpr std::size_t kMaxSimpleKeyLength = 128;

// '\n\x85\u2028\u2029', a carriage return is not a break inside a scalar
constexpr bool is_break(char32_t ch) noexcept {
  return ch == U'\n' || ch == U'\x85' || ch == U'\u2028' || ch == U'\u2029';
}

constexpr bool is_uri_char(char ch) noexcept {
  return (ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
         std::string_view("-;/?:@&=+$,_.~*'()[]").find(ch) != std::string_view::npos;
}

std::u32string ascii(std::string_view s) { return std::u32string(s.begin(), s.end()); }

std::u32string spaces(int n) { return std::u32string(n > 0 ? n : 0, U' '); }

std::string hex_escape(const char *format, unsigned value) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), format, value);
  return buf;
}

// %-escape every byte outside the URI characters
std::string uri_encode(std::string_view text, bool allow_hash, bool allow_bang) {
  std::string out;
  for (char ch : text) {
    if (is_uri_char(ch) || (allow_hash && ch == '#') || (allow_bang && ch == '!')) {
      out += ch;
    } else {
      out += hex_escape("%%%02X", static_cast<unsigned char>(ch));
    }
  }
  return out;
}

const std::map<char32_t, char32_t> &escape_replacements() {
  static const std::map<char32_t, char32_t> replacements{
      {U'\0', U'0'},   {U'\x07', U'a'}, {U'\x08', U'b'},   {U'\x09', U't'},   {U'\x0A', U'n'},
      {U'\x0B', U'v'}, {U'\x0C', U'f'}, {U'\x0D', U'r'},   {U'\x1B', U'e'},   {U'"', U'"'},
      {U'\\', U'\\'},  {U'\x85', U'N'}, {U'\xA0', U'_'},   {U'\u2028', U'L'}, {U'\u2029', U'P'},
  };
  return replacements;
}

bool is_space(char32_t ch) noexcept {
  return ch == U' ' || ch == U'\t' || ch == U'\n' || ch == U'\r' || ch == U'\v' || ch == U'\f' || is_break(ch);
}

} // namespace

int Emitter::Indents::seq_flow_align(int seq_indent, int column, bool pre_comment) const {
  if (values_.size() < 2 || !values_.back().second) {
    if (values_.empty() || !pre_comment) {
      return 0;
    }
  }
  int base = values_.back().first.value_or(0);
  if (pre_comment) {
    return base + seq_indent;
  }
  // -1 for the dash
  return base + seq_indent - column - 1;
}

Emitter::Emitter(std::ostream &stream, Options options) : stream_(stream), options_(std::move(options)) {
  prefixed_colon_ = from_utf8(options_.prefix_colon) + colon_;
  requested_indent_ = options_.indent;
  if (options_.indent && *options_.indent > 1 && *options_.indent < 10) {
    best_sequence_indent_ = *options_.indent;
  }
  best_map_indent_ = best_sequence_indent_;
  if (options_.map_indent) {
    best_map_indent_ = *options_.map_indent;
  }
  if (options_.sequence_indent) {
    best_sequence_indent_ = *options_.sequence_indent;
  }
  if (options_.width && *options_.width > best_sequence_indent_ * 2) {
    best_width_ = *options_.width;
  }
  best_line_break_ = U"\n";
  if (options_.line_break == "\r" || options_.line_break == "\n" || options_.line_break == "\r\n") {
    best_line_break_ = ascii(options_.line_break);
  }
}

void Emitter::emit(Event event) {
  events_.push_back(std::move(event));
  while (!need_more_events()) {
    event_.emplace(std::move(events_.front()));
    events_.pop_front();
    run_state();
    event_.reset();
  }
}

bool Emitter::need_more_events() const {
  if (events_.empty()) {
    return true;
  }
  switch (events_.front().kind) {
  case EventKind::DocumentStart:
    return need_events(1);
  case EventKind::SequenceStart:
    return need_events(2);
  case EventKind::MappingStart:
    return need_events(3);
  default:
    return false;
  }
}

bool Emitter::need_events(std::size_t count) const {
  int level = 0;
  for (auto it = std::next(events_.begin()); it != events_.end(); ++it) {
    switch (it->kind) {
    case EventKind::DocumentStart:
    case EventKind::SequenceStart:
    case EventKind::MappingStart:
      ++level;
      break;
    case EventKind::DocumentEnd:
    case EventKind::SequenceEnd:
    case EventKind::MappingEnd:
      --level;
      break;
    case EventKind::StreamEnd:
      level = -1;
      break;
    default:
      break;
    }
    if (level < 0) {
      return false;
    }
  }
  return events_.size() < count + 1;
}

void Emitter::increase_indent(bool flow, bool sequence, bool indentless) {
  indents_.push(indent_, sequence);
  if (!indent_) {
    // top level
    if (flow) {
      indent_ = requested_indent_;
    } else {
      indent_ = 0;
    }
  } else if (!indentless) {
    *indent_ += indents_.last_seq() ? best_sequence_indent_ : best_map_indent_;
  }
}

Emitter::State Emitter::pop_state() {
  State state = states_.back();
  states_.pop_back();
  return state;
}

void Emitter::run_state() {
  switch (state_) {
  case State::StreamStart:
    return expect_stream_start();
  case State::FirstDocumentStart:
    return expect_document_start(true);
  case State::DocumentStart:
    return expect_document_start();
  case State::DocumentEnd:
    return expect_document_end();
  case State::DocumentRoot:
    return expect_document_root();
  case State::Nothing:
    return expect_nothing();
  case State::FirstFlowSequenceItem:
    return expect_first_flow_sequence_item();
  case State::FlowSequenceItem:
    return expect_flow_sequence_item();
  case State::FirstFlowMappingKey:
    return expect_flow_mapping_key(true);
  case State::FlowMappingKey:
    return expect_flow_mapping_key();
  case State::FlowMappingSimpleValue:
    return expect_flow_mapping_simple_value();
  case State::FlowMappingValue:
    return expect_flow_mapping_value();
  case State::FirstBlockSequenceItem:
    return expect_block_sequence_item(true);
  case State::BlockSequenceItem:
    return expect_block_sequence_item();
  case State::FirstBlockMappingKey:
    return expect_block_mapping_key(true);
  case State::BlockMappingKey:
    return expect_block_mapping_key();
  case State::BlockMappingSimpleValue:
    return expect_block_mapping_simple_value();
  case State::BlockMappingValue:
    return expect_block_mapping_value();
  }
}

// Stream handlers

void Emitter::expect_stream_start() {
  if (!event_->is(EventKind::StreamStart)) {
    throw EmitterError(std::string("expected StreamStartEvent, but got ") + event_name(event_->kind));
  }
  if (!event_->encoding.empty()) {
    encoding_ = event_->encoding;
  }
  if (!encoding_.empty() && encoding_ != "utf-8" && encoding_ != "utf8" && !encoding_.starts_with("utf-16")) {
    throw EmitterError("unsupported output encoding: " + encoding_);
  }
  write_stream_start();
  state_ = State::FirstDocumentStart;
}

void Emitter::expect_nothing() {
  throw EmitterError(std::string("expected nothing, but got ") + event_name(event_->kind));
}

// Document handlers

void Emitter::expect_document_start(bool first) {
  if (event_->is(EventKind::DocumentStart)) {
    if ((event_->version || !event_->tags.empty()) && open_ended_) {
      write_indicator(U"...", true);
      write_indent();
    }
    if (event_->version) {
      write_version_directive(prepare_version(*event_->version));
    }
    tag_prefixes_ = {{"!", "!"}, {std::string(kYamlTagPrefix), "!!"}};
    for (const auto &[handle, prefix] : event_->tags) {
      tag_prefixes_[prefix] = handle;
      write_tag_directive(prepare_tag_handle(handle), prepare_tag_prefix(prefix));
    }
    bool implicit = first && !event_->explicit_ && !options_.canonical && !event_->version &&
                    event_->tags.empty() && !check_empty_document();
    if (!implicit) {
      write_indent();
      write_indicator(U"---", true);
      if (options_.canonical) {
        write_indent();
      }
    }
    state_ = State::DocumentRoot;
  } else if (event_->is(EventKind::StreamEnd)) {
    if (open_ended_) {
      write_indicator(U"...", true);
      write_indent();
    }
    write_stream_end();
    state_ = State::Nothing;
  } else {
    throw EmitterError(std::string("expected DocumentStartEvent, but got ") + event_name(event_->kind));
  }
}

void Emitter::expect_document_end() {
  if (!event_->is(EventKind::DocumentEnd)) {
    throw EmitterError(std::string("expected DocumentEndEvent, but got ") + event_name(event_->kind));
  }
  write_indent();
  if (event_->explicit_) {
    write_indicator(U"...", true);
    write_indent();
  }
  flush_stream();
  state_ = State::DocumentStart;
}

void Emitter::expect_document_root() {
  states_.push_back(State::DocumentEnd);
  expect_node(true);
}

// Node handlers

void Emitter::expect_node(bool root, bool sequence, bool mapping, bool simple_key) {
  root_context_ = root;
  sequence_context_ = sequence;
  mapping_context_ = mapping;
  simple_key_context_ = simple_key;
  bool force_flow_indent = false;
  if (event_->is(EventKind::Alias)) {
    expect_alias();
    return;
  }
  if (!event_->is(EventKind::Scalar) && !event_->is_collection_start()) {
    throw EmitterError(std::string("expected NodeEvent, but got ") + event_name(event_->kind));
  }
  if (process_anchor(U"&") && event_->is(EventKind::Scalar) && sequence_context_) {
    sequence_context_ = false;
  }
  if (root && event_->is(EventKind::Scalar) && !options_.scalar_after_indicator) {
    write_indent();
  }
  process_tag();
  if (event_->is(EventKind::Scalar)) {
    expect_scalar();
  } else if (event_->is(EventKind::SequenceStart)) {
    bool indention = indention_;
    if (!event_->comment.empty()) {
      if (event_->flow_style == false && write_post_comment(*event_)) {
        indention_ = false;
        no_newline_ = true;
      }
      int column = column_;
      if (write_pre_comment(*event_)) {
        if (event_->flow_style == true) {
          force_flow_indent = !indents_.top_seq() && !indents_.empty();
        }
        indention_ = indention;
        no_newline_ = !indention_;
      }
      if (event_->flow_style == true) {
        column_ = column;
      }
    }
    if (flow_level() || options_.canonical || event_->flow_style == true || check_empty_sequence()) {
      expect_flow_sequence(force_flow_indent);
    } else {
      expect_block_sequence();
    }
  } else {
    if (event_->flow_style == false && !event_->comment.empty()) {
      write_post_comment(*event_);
    }
    if (!comment_slot(event_->comment, 1).empty()) {
      write_pre_comment(*event_);
      if (event_->flow_style == true) {
        force_flow_indent = !indents_.top_seq() && !indents_.empty();
      }
    }
    if (flow_level() || options_.canonical || event_->flow_style == true || check_empty_mapping()) {
      expect_flow_mapping(event_->nr_items == std::size_t(1), force_flow_indent);
    } else {
      expect_block_mapping();
    }
  }
}

void Emitter::expect_alias() {
  if (!event_->anchor) {
    throw EmitterError("anchor is not specified for alias");
  }
  process_anchor(U"*");
  state_ = pop_state();
}

void Emitter::expect_scalar() {
  increase_indent(true);
  process_scalar();
  indent_ = indents_.pop();
  state_ = pop_state();
}

// Flow sequence handlers

void Emitter::expect_flow_sequence(bool force_flow_indent) {
  if (force_flow_indent) {
    increase_indent(true, true);
  }
  int ind = indents_.seq_flow_align(best_sequence_indent_, column_, force_flow_indent);
  write_indicator(spaces(ind) + U"[", true, true);
  if (!force_flow_indent) {
    increase_indent(true, true);
  }
  flow_context_.push_back(U"[");
  state_ = State::FirstFlowSequenceItem;
}

void Emitter::expect_first_flow_sequence_item() {
  if (event_->is(EventKind::SequenceEnd)) {
    indent_ = indents_.pop();
    flow_context_.pop_back();
    write_indicator(U"]", false);
    if (!comment_slot(event_->comment, 0).empty()) {
      // eol comment on an empty flow sequence
      write_post_comment(*event_);
    } else if (flow_level() == 0) {
      write_line_break();
    }
    state_ = pop_state();
  } else {
    if (options_.canonical || column_ > best_width_) {
      write_indent();
    }
    states_.push_back(State::FlowSequenceItem);
    expect_node(false, true);
  }
}

void Emitter::expect_flow_sequence_item() {
  if (event_->is(EventKind::SequenceEnd)) {
    indent_ = indents_.pop();
    flow_context_.pop_back();
    if (options_.canonical) {
      write_indicator(U",", false);
      write_indent();
    }
    write_indicator(U"]", false);
    if (!comment_slot(event_->comment, 0).empty()) {
      write_post_comment(*event_);
    } else {
      no_newline_ = false;
    }
    state_ = pop_state();
  } else {
    write_indicator(U",", false);
    if (options_.canonical || column_ > best_width_) {
      write_indent();
    }
    states_.push_back(State::FlowSequenceItem);
    expect_node(false, true);
  }
}

// Flow mapping handlers

void Emitter::expect_flow_mapping(bool single, bool force_flow_indent) {
  if (force_flow_indent) {
    increase_indent(true, false);
  }
  int ind = indents_.seq_flow_align(best_sequence_indent_, column_, force_flow_indent);
  std::u32string map_init = U"{";
  if (single && flow_level() && flow_context_.back() == U"[" && !options_.canonical &&
      !options_.brace_single_entry_mapping_in_flow_sequence) {
    // a single entry mapping in a flow sequence needs no braces
    map_init.clear();
  }
  write_indicator(spaces(ind) + map_init, true, true);
  flow_context_.push_back(map_init);
  if (!force_flow_indent) {
    increase_indent(true, false);
  }
  state_ = State::FirstFlowMappingKey;
}

void Emitter::expect_flow_mapping_key(bool first) {
  if (event_->is(EventKind::MappingEnd)) {
    indent_ = indents_.pop();
    std::u32string popped = flow_context_.back();
    flow_context_.pop_back();
    if (first) {
      write_indicator(U"}", false);
      if (!comment_slot(event_->comment, 0).empty()) {
        write_post_comment(*event_);
      } else if (flow_level() == 0) {
        write_line_break();
      }
    } else {
      if (options_.canonical) {
        write_indicator(U",", false);
        write_indent();
      }
      if (!popped.empty()) {
        write_indicator(U"}", false);
      }
      if (!comment_slot(event_->comment, 0).empty()) {
        write_post_comment(*event_);
      } else {
        no_newline_ = false;
      }
    }
    state_ = pop_state();
    return;
  }
  if (!first) {
    write_indicator(U",", false);
  }
  if (options_.canonical || column_ > best_width_) {
    write_indent();
  }
  if (!options_.canonical && check_simple_key()) {
    states_.push_back(State::FlowMappingSimpleValue);
    expect_node(false, false, true, true);
  } else {
    write_indicator(U"?", true);
    states_.push_back(State::FlowMappingValue);
    expect_node(false, false, true);
  }
}

void Emitter::expect_flow_mapping_simple_value() {
  write_indicator(prefixed_colon_, false);
  states_.push_back(State::FlowMappingKey);
  expect_node(false, false, true);
}

void Emitter::expect_flow_mapping_value() {
  if (options_.canonical || column_ > best_width_) {
    write_indent();
  }
  write_indicator(prefixed_colon_, true);
  states_.push_back(State::FlowMappingKey);
  expect_node(false, false, true);
}

// Block sequence handlers

void Emitter::expect_block_sequence() {
  bool indentless = false;
  if (mapping_context_) {
    indentless = !indention_;
  } else if (!options_.compact_seq_seq && column_ != 0) {
    write_line_break();
  }
  increase_indent(false, true, indentless);
  state_ = State::FirstBlockSequenceItem;
}

void Emitter::expect_block_sequence_item(bool first) {
  if (!first && event_->is(EventKind::SequenceEnd)) {
    if (!comment_slot(event_->comment, 1).empty()) {
      // final comments of a block sequence, e.g. empty lines
      write_pre_comment(*event_);
    }
    indent_ = indents_.pop();
    state_ = pop_state();
    no_newline_ = false;
    return;
  }
  if (!comment_slot(event_->comment, 1).empty()) {
    write_pre_comment(*event_);
  }
  bool nonl = column_ == 0 ? no_newline_ : false;
  write_indent();
  write_indicator(spaces(options_.sequence_dash_offset) + U"-", true, false, true);
  if (nonl || options_.sequence_dash_offset + 2 > best_sequence_indent_) {
    no_newline_ = true;
  }
  states_.push_back(State::BlockSequenceItem);
  expect_node(false, true);
}

// Block mapping handlers

void Emitter::expect_block_mapping() {
  if (!mapping_context_ && !(options_.compact_seq_map || column_ == 0)) {
    write_line_break();
  }
  increase_indent(false, false);
  state_ = State::FirstBlockMappingKey;
}

void Emitter::expect_block_mapping_key(bool first) {
  if (!first && event_->is(EventKind::MappingEnd)) {
    if (!comment_slot(event_->comment, 1).empty()) {
      // final comments of a block mapping
      write_pre_comment(*event_);
    }
    indent_ = indents_.pop();
    state_ = pop_state();
    return;
  }
  if (!comment_slot(event_->comment, 1).empty()) {
    write_pre_comment(*event_);
  }
  write_indent();
  if (check_simple_key()) {
    if (!event_->is_collection_start() && event_->style == ScalarStyle::ExplicitKey) {
      write_indicator(U"?", true, false, true);
    }
    states_.push_back(State::BlockMappingSimpleValue);
    expect_node(false, false, true, true);
    // an alias key needs a space before the colon, set members take none
    if (event_->is(EventKind::Alias) && event_->style != ScalarStyle::ExplicitKey) {
      stream_write(U" ");
      ++column_;
    }
  } else {
    write_indicator(U"?", true, false, true);
    states_.push_back(State::BlockMappingValue);
    expect_node(false, false, true);
  }
}

void Emitter::expect_block_mapping_simple_value() {
  if (event_->style != ScalarStyle::ExplicitKey) {
    if (indent_ == 0 && options_.top_level_colon_align) {
      write_indicator(spaces(*options_.top_level_colon_align - column_) + colon_, false);
    } else {
      write_indicator(prefixed_colon_, false);
    }
  }
  states_.push_back(State::BlockMappingKey);
  expect_node(false, false, true);
}

void Emitter::expect_block_mapping_value() {
  write_indent();
  write_indicator(prefixed_colon_, true, false, true);
  states_.push_back(State::BlockMappingKey);
  expect_node(false, false, true);
}

// Checkers

bool Emitter::check_empty_sequence() const {
  return event_->is(EventKind::SequenceStart) && !events_.empty() && events_.front().is(EventKind::SequenceEnd);
}

bool Emitter::check_empty_mapping() const {
  return event_->is(EventKind::MappingStart) && !events_.empty() && events_.front().is(EventKind::MappingEnd);
}

bool Emitter::check_empty_document() const {
  if (!event_->is(EventKind::DocumentStart) || events_.empty()) {
    return false;
  }
  const Event &event = events_.front();
  return event.is(EventKind::Scalar) && !event.anchor && !event.tag && event.value.empty();
}

bool Emitter::check_simple_key() {
  std::size_t length = 0;
  if (event_->is_node() && event_->anchor) {
    if (!prepared_anchor_) {
      prepared_anchor_ = prepare_anchor(*event_->anchor);
    }
    length += prepared_anchor_->size();
  }
  if ((event_->is(EventKind::Scalar) || event_->is_collection_start()) && event_->tag) {
    if (!prepared_tag_) {
      prepared_tag_ = prepare_tag(event_->tag->value());
    }
    length += prepared_tag_->size();
  }
  if (event_->is(EventKind::Scalar)) {
    if (!analysis_) {
      analysis_ = analyze_scalar(event_->value);
    }
    length += analysis_->scalar.size();
  }
  if (length >= kMaxSimpleKeyLength) {
    return false;
  }
  switch (event_->kind) {
  case EventKind::Alias:
    return true;
  case EventKind::SequenceStart:
    return event_->flow_style == true || check_empty_sequence();
  case EventKind::MappingStart:
    return event_->flow_style == true || check_empty_mapping();
  case EventKind::Scalar: {
    // an empty scalar with a block style cannot be a simple key
    bool block_styled = style_ && *style_ != ScalarStyle::Plain && *style_ != ScalarStyle::SingleQuoted &&
                        *style_ != ScalarStyle::DoubleQuoted;
    return !(analysis_->empty && block_styled) && !analysis_->multiline;
  }
  default:
    return false;
  }
}

// Anchor, tag and scalar processors

bool Emitter::process_anchor(std::u32string_view indicator) {
  if (!event_->anchor) {
    prepared_anchor_.reset();
    return false;
  }
  if (!prepared_anchor_) {
    prepared_anchor_ = prepare_anchor(*event_->anchor);
  }
  if (!prepared_anchor_->empty()) {
    write_indicator(std::u32string(indicator) + *prepared_anchor_, true);
    no_newline_ = false;
  }
  prepared_anchor_.reset();
  return true;
}

void Emitter::process_tag() {
  std::optional<std::string> tag;
  if (event_->tag) {
    tag = event_->tag->value();
  }
  if (event_->is(EventKind::Scalar)) {
    if (!style_) {
      style_ = choose_scalar_style();
      if (event_->value.empty() && style_ == ScalarStyle::SingleQuoted && tag == yaml_tag("null") &&
          !alt_null_.empty()) {
        event_->value = to_utf8(alt_null_);
        analysis_.reset();
        style_ = choose_scalar_style();
      }
    }
    const ScalarImplicit &implicit = event_->scalar_implicit;
    if ((!options_.canonical || !tag) &&
        ((style_ == ScalarStyle::Plain && implicit.plain) || (style_ != ScalarStyle::Plain && implicit.quoted))) {
      prepared_tag_.reset();
      return;
    }
    if (implicit.plain && !tag) {
      tag = "!";
      prepared_tag_.reset();
    }
  } else if ((!options_.canonical || !tag) && event_->implicit) {
    prepared_tag_.reset();
    return;
  }
  if (!tag) {
    throw EmitterError("tag is not specified");
  }
  if (!prepared_tag_) {
    prepared_tag_ = prepare_tag(*tag);
  }
  if (!prepared_tag_->empty()) {
    write_indicator(*prepared_tag_, true);
    if (sequence_context_ && !flow_level() && event_->is(EventKind::Scalar)) {
      no_newline_ = true;
    }
  }
  prepared_tag_.reset();
}

ScalarStyle Emitter::choose_scalar_style() {
  if (!analysis_) {
    analysis_ = analyze_scalar(event_->value);
  }
  const ScalarStyle style = event_->style;
  const ScalarImplicit &implicit = event_->scalar_implicit;
  if (style == ScalarStyle::DoubleQuoted || options_.canonical) {
    return ScalarStyle::DoubleQuoted;
  }
  if ((style == ScalarStyle::Plain || style == ScalarStyle::ExplicitKey) && (implicit.plain || !implicit.standard)) {
    if (!(simple_key_context_ && (analysis_->empty || analysis_->multiline)) &&
        ((flow_level() && analysis_->allow_flow_plain) || (!flow_level() && analysis_->allow_block_plain))) {
      return ScalarStyle::Plain;
    }
  }
  analysis_->allow_block = true;
  if (style == ScalarStyle::Literal || style == ScalarStyle::Folded) {
    if (!flow_level() && !simple_key_context_ && analysis_->allow_block) {
      return style;
    }
  }
  if (style == ScalarStyle::Plain && analysis_->allow_double_quoted) {
    if (event_->value.find_first_of("'\n") != std::string::npos) {
      return ScalarStyle::DoubleQuoted;
    }
  }
  if (style == ScalarStyle::Plain || style == ScalarStyle::SingleQuoted) {
    if (analysis_->allow_single_quoted && !(simple_key_context_ && analysis_->multiline)) {
      return ScalarStyle::SingleQuoted;
    }
  }
  return ScalarStyle::DoubleQuoted;
}

void Emitter::process_scalar() {
  if (!analysis_) {
    analysis_ = analyze_scalar(event_->value);
  }
  if (!style_) {
    style_ = choose_scalar_style();
  }
  bool split = !simple_key_context_;
  if (sequence_context_ && !flow_level()) {
    write_indent();
  }
  // an eol comment after a block scalar must be dedented below its content
  auto dedent_comment = [this] {
    if (CommentRef c = comment_at(event_->comment, 0)) {
      int indent = indent_.value_or(0);
      if (static_cast<int>(c->start_mark.column) >= indent) {
        c->start_mark.column = indent > 0 ? indent - 1 : 0;
      }
    }
  };
  switch (*style_) {
  case ScalarStyle::DoubleQuoted:
    write_double_quoted(analysis_->scalar, split);
    break;
  case ScalarStyle::SingleQuoted:
    write_single_quoted(analysis_->scalar, split);
    break;
  case ScalarStyle::Folded:
    write_folded(analysis_->scalar);
    dedent_comment();
    break;
  case ScalarStyle::Literal: {
    CommentRef header = comment_at(event_->comment, 1);
    write_literal(analysis_->scalar, header && header->block_header ? header->value : std::string());
    dedent_comment();
    break;
  }
  default:
    write_plain(analysis_->scalar, split);
    break;
  }
  analysis_.reset();
  style_.reset();
  if (!event_->comment.empty()) {
    write_post_comment(*event_);
  }
}

// Analyzers

std::u32string Emitter::prepare_version(const VersionInfo &version) const {
  std::string text = std::to_string(version.major) + "." + std::to_string(version.minor);
  if (version.major != 1) {
    throw EmitterError("unsupported YAML version: " + text);
  }
  return ascii(text);
}

std::u32string Emitter::prepare_tag_handle(const std::string &handle) const {
  if (handle.empty()) {
    throw EmitterError("tag handle must not be empty");
  }
  if (handle.front() != '!' || handle.back() != '!') {
    throw EmitterError("tag handle must start and end with '!': " + repr_str(handle));
  }
  for (std::size_t i = 1; i + 1 < handle.size(); ++i) {
    char ch = handle[i];
    if (!is_ascii_alnum(static_cast<unsigned char>(ch)) && ch != '-' && ch != '_') {
      throw EmitterError("invalid character " + repr_char(static_cast<unsigned char>(ch)) +
                         " in the tag handle: " + repr_str(handle));
    }
  }
  return from_utf8(handle);
}

std::u32string Emitter::prepare_tag_prefix(const std::string &prefix) const {
  if (prefix.empty()) {
    throw EmitterError("tag prefix must not be empty");
  }
  bool allow_hash = !options_.version || !(*options_.version < VersionInfo{1, 2});
  std::size_t start = prefix.front() == '!' ? 1 : 0;
  return from_utf8(prefix.substr(0, start) + uri_encode(std::string_view(prefix).substr(start), allow_hash, false));
}

std::u32string Emitter::prepare_tag(const std::string &tag) const {
  if (tag.empty()) {
    throw EmitterError("tag must not be empty");
  }
  if (tag == "!") {
    return U"!";
  }
  std::optional<std::string> handle;
  std::string_view suffix = tag;
  // the longest matching prefix sorts last
  for (const auto &[prefix, prefix_handle] : tag_prefixes_) {
    if (tag.starts_with(prefix) && (prefix == "!" || prefix.size() < tag.size())) {
      handle = prefix_handle;
      suffix = std::string_view(tag).substr(prefix.size());
    }
  }
  bool allow_hash = !options_.version || !(*options_.version < VersionInfo{1, 2});
  std::string suffix_text = uri_encode(suffix, allow_hash, handle != "!");
  if (handle && !handle->empty()) {
    return from_utf8(*handle + suffix_text);
  }
  return from_utf8("!<" + suffix_text + ">");
}

std::u32string Emitter::prepare_anchor(const std::string &anchor) const {
  if (anchor.empty()) {
    throw EmitterError("anchor must not be empty");
  }
  std::u32string text = from_utf8(anchor);
  for (char32_t ch : text) {
    if (!check_anchorname_char(ch)) {
      throw EmitterError("invalid character " + repr_char(ch) + " in the anchor: " + repr_str(anchor));
    }
  }
  return text;
}

Emitter::ScalarAnalysis Emitter::analyze_scalar(const std::string &text) const {
  ScalarAnalysis analysis;
  analysis.scalar = from_utf8(text);
  const std::u32string &scalar = analysis.scalar;
  if (scalar.empty()) {
    analysis.empty = true;
    analysis.allow_block_plain = true;
    analysis.allow_single_quoted = true;
    analysis.allow_double_quoted = true;
    return analysis;
  }
  const bool version_1_1 = options_.version && *options_.version == VersionInfo{1, 1};

  bool block_indicators = false;
  bool flow_indicators = false;
  bool line_breaks = false;
  bool special_characters = false;

  bool leading_space = false;
  bool leading_break = false;
  bool trailing_space = false;
  bool trailing_break = false;
  bool break_space = false;
  bool space_break = false;

  // document indicators
  if (scalar.starts_with(U"---") || scalar.starts_with(U"...")) {
    block_indicators = true;
    flow_indicators = true;
  }

  bool preceded_by_whitespace = true;
  bool followed_by_whitespace = scalar.size() == 1 || is_blank_or_break_z(scalar[1]);
  bool previous_space = false;
  bool previous_break = false;

  for (std::size_t index = 0; index < scalar.size(); ++index) {
    const char32_t ch = scalar[index];
    if (index == 0) {
      // leading indicators are special characters
      if (std::u32string_view(U"#,[]{}&*!|>'\"%@`").find(ch) != std::u32string_view::npos) {
        flow_indicators = true;
        block_indicators = true;
      }
      if (ch == U'?' || ch == U':') {
        if (version_1_1 || scalar.size() == 1) {
          flow_indicators = true;
        }
        if (followed_by_whitespace) {
          block_indicators = true;
        }
      }
      if (ch == U'-' && followed_by_whitespace) {
        flow_indicators = true;
        block_indicators = true;
      }
    } else {
      if (std::u32string_view(U",[]{}").find(ch) != std::u32string_view::npos) {
        flow_indicators = true;
      }
      if (ch == U'?' && version_1_1) {
        flow_indicators = true;
      }
      if (ch == U':' && followed_by_whitespace) {
        flow_indicators = true;
        block_indicators = true;
      }
      if (ch == U'#' && preceded_by_whitespace) {
        flow_indicators = true;
        block_indicators = true;
      }
    }

    if (is_break(ch)) {
      line_breaks = true;
    }
    if (!(ch == U'\n' || (ch >= U'\x20' && ch <= U'\x7E'))) {
      if ((ch == U'\x85' || (ch >= U'\xA0' && ch <= U'\uD7FF') || (ch >= U'\uE000' && ch <= U'\uFFFD') ||
           (ch >= U'\U00010000' && ch <= U'\U0010FFFF')) &&
          ch != U'\uFEFF') {
        if (!options_.allow_unicode) {
          special_characters = true;
        }
      } else {
        special_characters = true;
      }
    }

    if (ch == U' ') {
      if (index == 0) {
        leading_space = true;
      }
      if (index == scalar.size() - 1) {
        trailing_space = true;
      }
      if (previous_break) {
        break_space = true;
      }
      previous_space = true;
      previous_break = false;
    } else if (is_break(ch)) {
      if (index == 0) {
        leading_break = true;
      }
      if (index == scalar.size() - 1) {
        trailing_break = true;
      }
      if (previous_space) {
        space_break = true;
      }
      previous_space = false;
      previous_break = true;
    } else {
      previous_space = false;
      previous_break = false;
    }

    preceded_by_whitespace = is_blank_or_break_z(ch);
    followed_by_whitespace = index + 2 >= scalar.size() || is_blank_or_break_z(scalar[index + 2]);
  }

  bool allow_flow_plain = true;
  bool allow_block_plain = true;
  bool allow_single_quoted = true;
  bool allow_double_quoted = true;
  bool allow_block = true;

  // leading and trailing whitespace is lost in plain scalars
  if (leading_space || leading_break || trailing_space || trailing_break) {
    allow_flow_plain = allow_block_plain = false;
  }
  if (trailing_space) {
    allow_block = false;
  }
  // spaces at the start of a line survive in block scalars only
  if (break_space) {
    allow_flow_plain = allow_block_plain = allow_single_quoted = false;
  }
  if (special_characters) {
    allow_flow_plain = allow_block_plain = allow_single_quoted = allow_block = false;
  } else if (space_break) {
    allow_flow_plain = allow_block_plain = allow_single_quoted = false;
    allow_block = false;
  }
  // multiline plain scalars are never written
  if (line_breaks) {
    allow_flow_plain = allow_block_plain = false;
  }
  if (flow_indicators) {
    allow_flow_plain = false;
  }
  if (block_indicators) {
    allow_block_plain = false;
  }

  analysis.multiline = line_breaks;
  analysis.allow_flow_plain = allow_flow_plain;
  analysis.allow_block_plain = allow_block_plain;
  analysis.allow_single_quoted = allow_single_quoted;
  analysis.allow_double_quoted = allow_double_quoted;
  analysis.allow_block = allow_block;
  return analysis;
}

// Writers

void Emitter::stream_write(std::u32string_view data) {
  if (encoding_.starts_with("utf-16")) {
    const bool big_endian = encoding_ == "utf-16-be";
    std::string out;
    out.reserve(data.size() * 2);
    auto unit = [&](std::uint32_t u) {
      char hi = static_cast<char>((u >> 8) & 0xFF), lo = static_cast<char>(u & 0xFF);
      out += big_endian ? hi : lo;
      out += big_endian ? lo : hi;
    };
    for (char32_t ch : data) {
      if (ch >= 0x10000) {
        std::uint32_t v = ch - 0x10000;
        unit(0xD800 + (v >> 10));
        unit(0xDC00 + (v & 0x3FF));
      } else {
        unit(ch);
      }
    }
    stream_.write(out.data(), static_cast<std::streamsize>(out.size()));
  } else {
    stream_ << to_utf8(data);
  }
  if (!stream_) {
    throw StreamError("failed writing to the output stream");
  }
}

void Emitter::flush_stream() { stream_.flush(); }

void Emitter::write_stream_start() {
  if (encoding_.starts_with("utf-16")) {
    stream_write(U"\uFEFF");
  }
}

void Emitter::write_stream_end() { flush_stream(); }

void Emitter::write_indicator(std::u32string_view indicator, bool need_whitespace, bool whitespace,
                              bool indention) {
  std::u32string data;
  if (!whitespace_ && need_whitespace) {
    data = U" ";
  }
  data += indicator;
  whitespace_ = whitespace;
  indention_ = indention_ && indention;
  column_ += static_cast<int>(data.size());
  open_ended_ = false;
  stream_write(data);
}

void Emitter::write_indent() {
  int indent = indent_.value_or(0);
  if (!indention_ || column_ > indent || (column_ == indent && !whitespace_)) {
    if (no_newline_) {
      no_newline_ = false;
    } else {
      write_line_break();
    }
  }
  if (column_ < indent) {
    whitespace_ = true;
    std::u32string data = spaces(indent - column_);
    column_ = indent;
    stream_write(data);
  }
}

void Emitter::write_line_break(std::optional<char32_t> data) {
  whitespace_ = true;
  indention_ = true;
  ++line_;
  column_ = 0;
  if (data) {
    stream_write(std::u32string(1, *data));
  } else {
    stream_write(best_line_break_);
  }
}

void Emitter::write_version_directive(std::u32string_view version_text) {
  stream_write(U"%YAML " + std::u32string(version_text));
  write_line_break();
}

void Emitter::write_tag_directive(std::u32string_view handle_text, std::u32string_view prefix_text) {
  stream_write(U"%TAG " + std::u32string(handle_text) + U" " + std::u32string(prefix_text));
  write_line_break();
}

// A root scalar starts on its own line when an indent was requested
void Emitter::write_root_break() {
  if (root_context_ && requested_indent_) {
    write_line_break();
    if (*requested_indent_ != 0) {
      write_indent();
    }
  }
}

void Emitter::write_single_quoted(const std::u32string &text, bool split) {
  write_root_break();
  write_indicator(U"'", true);
  bool spaces_run = false;
  bool breaks = false;
  std::size_t start = 0, end = 0;
  while (end <= text.size()) {
    std::optional<char32_t> ch;
    if (end < text.size()) {
      ch = text[end];
    }
    if (spaces_run) {
      if (!ch || *ch != U' ') {
        if (start + 1 == end && column_ > best_width_ && split && start != 0 && end != text.size()) {
          write_indent();
        } else {
          column_ += static_cast<int>(end - start);
          stream_write(std::u32string_view(text).substr(start, end - start));
        }
        start = end;
      }
    } else if (breaks) {
      if (!ch || !is_break(*ch)) {
        if (text[start] == U'\n') {
          write_line_break();
        }
        for (std::size_t i = start; i < end; ++i) {
          if (text[i] == U'\n') {
            write_line_break();
          } else {
            write_line_break(text[i]);
          }
        }
        write_indent();
        start = end;
      }
    } else if (!ch || *ch == U' ' || is_break(*ch) || *ch == U'\'') {
      if (start < end) {
        column_ += static_cast<int>(end - start);
        stream_write(std::u32string_view(text).substr(start, end - start));
        start = end;
      }
    }
    if (ch == U'\'') {
      column_ += 2;
      stream_write(U"''");
      start = end + 1;
    }
    if (ch) {
      spaces_run = *ch == U' ';
      breaks = is_break(*ch);
    }
    ++end;
  }
  write_indicator(U"'", false);
}

void Emitter::write_double_quoted(const std::u32string &text, bool split) {
  write_root_break();
  write_indicator(U"\"", true);
  std::size_t start = 0, end = 0;
  while (end <= text.size()) {
    std::optional<char32_t> ch;
    if (end < text.size()) {
      ch = text[end];
    }
    if (!ch || std::u32string_view(U"\"\\\x85\u2028\u2029\uFEFF").find(*ch) != std::u32string_view::npos ||
        !((*ch >= U'\x20' && *ch <= U'\x7E') ||
          (options_.allow_unicode &&
           ((*ch >= U'\xA0' && *ch <= U'\uD7FF') || (*ch >= U'\uE000' && *ch <= U'\uFFFD'))))) {
      if (start < end) {
        column_ += static_cast<int>(end - start);
        stream_write(std::u32string_view(text).substr(start, end - start));
        start = end;
      }
      if (ch) {
        std::string data;
        auto it = escape_replacements().find(*ch);
        if (it != escape_replacements().end()) {
          data = std::string("\\") + static_cast<char>(it->second);
        } else if (*ch <= U'\xFF') {
          data = hex_escape("\\x%02X", *ch);
        } else if (*ch <= U'\uFFFF') {
          data = hex_escape("\\u%04X", *ch);
        } else {
          data = hex_escape("\\U%08X", *ch);
        }
        column_ += static_cast<int>(data.size());
        stream_write(ascii(data));
        start = end + 1;
      }
    }
    if (end > 0 && end + 1 < text.size() && (ch == U' ' || start >= end) &&
        column_ + static_cast<int>(end - start) > best_width_ && split) {
      std::u32string data = text.substr(start, end > start ? end - start : 0) + U"\\";
      if (start < end) {
        start = end;
      }
      column_ += static_cast<int>(data.size());
      stream_write(data);
      write_indent();
      whitespace_ = false;
      indention_ = false;
      if (text[start] == U' ') {
        column_ += 1;
        stream_write(U"\\");
      }
    }
    ++end;
  }
  write_indicator(U"\"", false);
}

std::tuple<std::u32string, int, char32_t> Emitter::determine_block_hints(const std::u32string &text) const {
  int indent = 0;
  char32_t indicator = 0;
  std::u32string hints;
  if (!text.empty()) {
    if (text.front() == U' ' || is_break(text.front())) {
      indent = best_sequence_indent_;
      hints += ascii(std::to_string(indent));
    } else if (root_context_) {
      // content that would read as a document marker needs an indent
      long pos = -1;
      for (std::u32string_view marker : {std::u32string_view(U"\n---"), std::u32string_view(U"\n...")}) {
        std::size_t from = 0;
        pos = -1;
        while (true) {
          std::size_t found = text.find(marker, from);
          if (found == std::u32string::npos) {
            break;
          }
          if (found + 4 < text.size() && std::u32string_view(U" \r\n").find(text[found + 4]) != std::u32string::npos) {
            pos = static_cast<long>(found);
            break;
          }
          from = found + 1;
        }
        if (pos > -1) {
          break;
        }
      }
      if (pos > 0) {
        indent = best_sequence_indent_;
      }
    }
    if (!is_break(text.back())) {
      indicator = U'-';
    } else if (text.size() == 1 || is_break(text[text.size() - 2])) {
      indicator = U'+';
    }
  }
  if (indicator) {
    hints += indicator;
  }
  return {hints, indent, indicator};
}

void Emitter::write_folded(const std::u32string &text) {
  auto [hints, hint_indent, indicator] = determine_block_hints(text);
  write_indicator(U">" + hints, true);
  if (indicator == U'+') {
    open_ended_ = true;
  }
  write_line_break();
  bool leading_space = true;
  bool spaces_run = false;
  bool breaks = true;
  std::size_t start = 0, end = 0;
  while (end <= text.size()) {
    std::optional<char32_t> ch;
    if (end < text.size()) {
      ch = text[end];
    }
    if (breaks) {
      if (!ch || !(is_break(*ch) || *ch == U'\a')) {
        if (!leading_space && ch && *ch != U' ' && text[start] == U'\n') {
          write_line_break();
        }
        leading_space = ch == U' ';
        for (std::size_t i = start; i < end; ++i) {
          if (text[i] == U'\n') {
            write_line_break();
          } else {
            write_line_break(text[i]);
          }
        }
        if (ch) {
          write_indent();
        }
        start = end;
      }
    } else if (spaces_run) {
      if (ch != U' ') {
        if (start + 1 == end && column_ > best_width_) {
          write_indent();
        } else {
          column_ += static_cast<int>(end - start);
          stream_write(std::u32string_view(text).substr(start, end - start));
        }
        start = end;
      }
    } else if (!ch || *ch == U' ' || is_break(*ch) || *ch == U'\a') {
      column_ += static_cast<int>(end - start);
      stream_write(std::u32string_view(text).substr(start, end - start));
      if (ch == U'\a') {
        // a kept fold: the marker and the space that was folded are replaced by a line break
        if (end + 2 < text.size() && !is_space(text[end + 2])) {
          write_line_break();
          write_indent();
          end += 2;
        } else {
          throw EmitterError("unexpected fold indicator \\a before space");
        }
      }
      if (!ch) {
        write_line_break();
      }
      start = end;
    }
    if (ch) {
      breaks = is_break(*ch);
      spaces_run = *ch == U' ';
    }
    ++end;
  }
}

void Emitter::write_literal(const std::u32string &text, const std::string &header_comment) {
  auto [hints, hint_indent, indicator] = determine_block_hints(text);
  write_indicator(U"|" + hints + from_utf8(header_comment), true);
  if (indicator == U'+') {
    open_ended_ = true;
  }
  write_line_break();
  bool breaks = true;
  std::size_t start = 0, end = 0;
  while (end <= text.size()) {
    std::optional<char32_t> ch;
    if (end < text.size()) {
      ch = text[end];
    }
    if (breaks) {
      if (!ch || !is_break(*ch)) {
        for (std::size_t i = start; i < end; ++i) {
          if (text[i] == U'\n') {
            write_line_break();
          } else {
            write_line_break(text[i]);
          }
        }
        if (ch) {
          if (root_context_) {
            int width = hint_indent + indent_.value_or(0);
            column_ += width;
            stream_write(spaces(width));
          } else {
            write_indent();
          }
        }
        start = end;
      }
    } else if (!ch || is_break(*ch)) {
      column_ += static_cast<int>(end - start);
      stream_write(std::u32string_view(text).substr(start, end - start));
      if (!ch) {
        write_line_break();
      }
      start = end;
    }
    if (ch) {
      breaks = is_break(*ch);
    }
    ++end;
  }
}

void Emitter::write_plain(const std::u32string &text, bool split) {
  if (root_context_) {
    if (requested_indent_) {
      write_line_break();
      if (*requested_indent_ != 0) {
        write_indent();
      }
    } else {
      open_ended_ = true;
    }
  }
  if (text.empty()) {
    return;
  }
  if (!whitespace_) {
    column_ += 1;
    stream_write(U" ");
  }
  whitespace_ = false;
  indention_ = false;
  bool spaces_run = false;
  bool breaks = false;
  std::size_t start = 0, end = 0;
  while (end <= text.size()) {
    std::optional<char32_t> ch;
    if (end < text.size()) {
      ch = text[end];
    }
    if (spaces_run) {
      if (ch != U' ') {
        if (start + 1 == end && column_ > best_width_ && split) {
          write_indent();
          whitespace_ = false;
          indention_ = false;
        } else {
          column_ += static_cast<int>(end - start);
          stream_write(std::u32string_view(text).substr(start, end - start));
        }
        start = end;
      }
    } else if (breaks) {
      if (!ch || !is_break(*ch)) {
        if (text[start] == U'\n') {
          write_line_break();
        }
        for (std::size_t i = start; i < end; ++i) {
          if (text[i] == U'\n') {
            write_line_break();
          } else {
            write_line_break(text[i]);
          }
        }
        write_indent();
        whitespace_ = false;
        indention_ = false;
        start = end;
      }
    } else if (!ch || *ch == U' ' || is_break(*ch)) {
      column_ += static_cast<int>(end - start);
      stream_write(std::u32string_view(text).substr(start, end - start));
      start = end;
    }
    if (ch) {
      spaces_run = *ch == U' ';
      breaks = is_break(*ch);
    }
    ++end;
  }
}

void Emitter::write_comment(const CommentToken &comment, bool pre) {
  std::u32string value = from_utf8(comment.value);
  if (!pre && !value.empty() && value.back() == U'\n') {
    value.pop_back();
  }
  int col = static_cast<int>(comment.start_mark.column);
  if (!value.empty() && value.front() == U'\n') {
    // blank lines, not a real comment: no spaces in front
    col = column_;
  } else if (!pre && comment.gap > 0) {
    // a grown value pushes the comment right, keeping its distance
    col = std::max(col, column_ + static_cast<int>(comment.gap));
  }
  int nr_spaces = col - column_;
  bool blank = std::all_of(value.begin(), value.end(), is_space);
  if (column_ && !blank && nr_spaces < 1 && value.front() != U'\n') {
    nr_spaces = 1;
  }
  stream_write(spaces(nr_spaces) + value);
  if (!pre) {
    write_line_break();
  }
}

bool Emitter::write_pre_comment(const Event &event) {
  const CommentGroup &comments = comment_slot(event.comment, 1);
  if (comments.empty()) {
    return false;
  }
  const bool start_event = event.is_collection_start();
  for (const CommentRef &comment : comments) {
    if (start_event && comment->pre_done) {
      continue;
    }
    if (column_ != 0) {
      write_line_break();
    }
    write_comment(*comment, true);
    if (start_event) {
      comment->pre_done = true;
    }
  }
  return true;
}

bool Emitter::write_post_comment(const Event &event) {
  const CommentGroup &comments = comment_slot(event.comment, 0);
  if (comments.empty()) {
    return false;
  }
  for (const CommentRef &comment : comments) {
    write_comment(*comment);
  }
  return true;
}

} // namespace rtyaml
