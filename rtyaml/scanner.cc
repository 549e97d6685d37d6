#include "rtyaml/scanner.hh"
#include "rtyaml/unicode.hh"

#include <algorithm>

namespace rtyaml {

namespace {

bool is_flow_indicator(char32_t ch) noexcept {
  return ch == U',' || ch == U'[' || ch == U']' || ch == U'{' || ch == U'}';
}

// The characters a plain scalar may not start with, unless followed by a non-space
bool is_plain_stopper(char32_t ch) noexcept {
  if (is_blank_or_break_z(ch)) {
    return true;
  }
  switch (ch) {
  case U'-':
  case U'?':
  case U':':
  case U',':
  case U'[':
  case U']':
  case U'{':
  case U'}':
  case U'#':
  case U'&':
  case U'*':
  case U'!':
  case U'|':
  case U'>':
  case U'\'':
  case U'"':
  case U'%':
  case U'@':
  case U'`':
    return true;
  default:
    return false;
  }
}

bool is_uri_char(char32_t ch) noexcept {
  if (is_ascii_alnum(ch)) {
    return true;
  }
  switch (ch) {
  case U'-':
  case U';':
  case U'/':
  case U'?':
  case U':':
  case U'@':
  case U'&':
  case U'=':
  case U'+':
  case U'$':
  case U',':
  case U'_':
  case U'.':
  case U'!':
  case U'~':
  case U'*':
  case U'\'':
  case U'(':
  case U')':
  case U'[':
  case U']':
  case U'%':
    return true;
  default:
    return false;
  }
}

bool is_break_z_or_space(char32_t ch) noexcept { return ch == U' ' || is_break_z(ch); }

std::optional<char32_t> escape_replacement(char32_t ch) noexcept {
  switch (ch) {
  case U'0':
    return U'\0';
  case U'a':
    return U'\x07';
  case U'b':
    return U'\x08';
  case U't':
  case U'\t':
    return U'\x09';
  case U'n':
    return U'\x0A';
  case U'v':
    return U'\x0B';
  case U'f':
    return U'\x0C';
  case U'r':
    return U'\x0D';
  case U'e':
    return U'\x1B';
  case U' ':
    return U' ';
  case U'"':
    return U'"';
  case U'/':
    return U'/';
  case U'\\':
    return U'\\';
  case U'N':
    return U'\x85';
  case U'_':
    return U'\xA0';
  case U'L':
    return U'\u2028';
  case U'P':
    return U'\u2029';
  default:
    return std::nullopt;
  }
}

std::size_t escape_code_length(char32_t ch) noexcept {
  switch (ch) {
  case U'x':
    return 2;
  case U'u':
    return 4;
  case U'U':
    return 8;
  default:
    return 0;
  }
}

std::uint32_t parse_hex(std::u32string_view digits) noexcept {
  std::uint32_t code = 0;
  for (char32_t ch : digits) {
    code <<= 4;
    if (ch >= U'0' && ch <= U'9') {
      code |= ch - U'0';
    } else if (ch >= U'a' && ch <= U'f') {
      code |= ch - U'a' + 10;
    } else {
      code |= ch - U'A' + 10;
    }
  }
  return code;
}

std::string hex_byte(unsigned value) {
  static const char digits[] = "0123456789abcdef";
  std::string out = "0x";
  out += digits[(value >> 4) & 0xF];
  out += digits[value & 0xF];
  return out;
}

} // namespace

Scanner::Scanner(Reader &reader, std::optional<VersionInfo> version) : reader_(reader), configured_version_(version) {
  fetch_stream_start();
}

// Public methods ------------------------------------------------------------

bool Scanner::check_token() {
  prepare_tokens();
  return !tokens_.empty();
}

bool Scanner::check_token(std::initializer_list<TokenKind> kinds) {
  prepare_tokens();
  if (tokens_.empty()) {
    return false;
  }
  return std::find(kinds.begin(), kinds.end(), tokens_.front().kind) != kinds.end();
}

Token *Scanner::peek_token() {
  prepare_tokens();
  return tokens_.empty() ? nullptr : &tokens_.front();
}

Token Scanner::get_token() {
  prepare_tokens();
  if (tokens_.empty()) {
    Mark mark = reader_.get_mark();
    return Token(TokenKind::StreamEnd, mark, mark);
  }
  ++tokens_taken_;
  Token token = std::move(tokens_.front());
  tokens_.pop_front();
  return token;
}

// Token queue ---------------------------------------------------------------

void Scanner::prepare_tokens() {
  while (need_more_tokens()) {
    fetch_more_tokens();
  }
}

bool Scanner::need_more_tokens() {
  if (done_) {
    return false;
  }
  if (tokens_.empty()) {
    return true;
  }
  // the head token may still become a simple key
  stale_possible_simple_keys();
  auto next = next_possible_simple_key();
  return next && *next == tokens_taken_;
}

void Scanner::fetch_comment(ScannedComment) {}

void Scanner::fetch_more_tokens() {
  if (auto comment = scan_to_next_token()) {
    fetch_comment(std::move(*comment));
    return;
  }
  stale_possible_simple_keys();
  unwind_indent(static_cast<int>(reader_.column()));

  char32_t ch = reader_.peek();
  if (ch == U'\0') {
    return fetch_stream_end();
  }
  if (ch == U'%' && check_directive()) {
    return fetch_directive();
  }
  if (ch == U'-' && check_document_start()) {
    return fetch_document_indicator(TokenKind::DocumentStart);
  }
  if (ch == U'.' && check_document_end()) {
    return fetch_document_indicator(TokenKind::DocumentEnd);
  }

  switch (ch) {
  case U'[':
    return fetch_flow_collection_start(TokenKind::FlowSequenceStart, '[');
  case U'{':
    return fetch_flow_collection_start(TokenKind::FlowMappingStart, '{');
  case U']':
    return fetch_flow_collection_end(TokenKind::FlowSequenceEnd);
  case U'}':
    return fetch_flow_collection_end(TokenKind::FlowMappingEnd);
  case U',':
    return fetch_flow_entry();
  default:
    break;
  }
  if (ch == U'-' && check_block_entry()) {
    return fetch_block_entry();
  }
  if (ch == U'?' && check_key()) {
    return fetch_key();
  }
  if (ch == U':' && check_value()) {
    return fetch_value();
  }
  switch (ch) {
  case U'*':
    return fetch_alias();
  case U'&':
    return fetch_anchor();
  case U'!':
    return fetch_tag();
  case U'|':
    if (!flow_level())
      return fetch_block_scalar(ScalarStyle::Literal);
    break;
  case U'>':
    if (!flow_level())
      return fetch_block_scalar(ScalarStyle::Folded);
    break;
  case U'\'':
    return fetch_flow_scalar(ScalarStyle::SingleQuoted);
  case U'"':
    return fetch_flow_scalar(ScalarStyle::DoubleQuoted);
  default:
    break;
  }
  if (check_plain()) {
    return fetch_plain();
  }
  throw ScannerError("while scanning for the next token", std::nullopt,
                     "found character " + repr_char(ch) + " that cannot start any token", reader_.get_mark());
}

// Simple keys ---------------------------------------------------------------

std::optional<std::size_t> Scanner::next_possible_simple_key() const {
  std::optional<std::size_t> min_token_number;
  for (const auto &[level, key] : possible_simple_keys_) {
    if (!min_token_number || key.token_number < *min_token_number) {
      min_token_number = key.token_number;
    }
  }
  return min_token_number;
}

void Scanner::stale_possible_simple_keys() {
  // a simple key is limited to a single line and 1024 characters
  for (auto it = possible_simple_keys_.begin(); it != possible_simple_keys_.end();) {
    const SimpleKey &key = it->second;
    if (key.line != reader_.line() || reader_.index() - key.index > 1024) {
      if (key.required) {
        throw ScannerError("while scanning a simple key", key.mark, "could not find expected ':'", reader_.get_mark());
      }
      it = possible_simple_keys_.erase(it);
    } else {
      ++it;
    }
  }
}

void Scanner::save_possible_simple_key() {
  bool required = !flow_level() && indent_ == static_cast<int>(reader_.column());
  if (allow_simple_key_) {
    remove_possible_simple_key();
    std::size_t token_number = tokens_taken_ + tokens_.size();
    possible_simple_keys_.insert_or_assign(flow_level(), SimpleKey{token_number, required, reader_.index(),
                                                                   reader_.line(), reader_.column(),
                                                                   reader_.get_mark()});
  }
}

void Scanner::remove_possible_simple_key() {
  auto it = possible_simple_keys_.find(flow_level());
  if (it == possible_simple_keys_.end()) {
    return;
  }
  if (it->second.required) {
    throw ScannerError("while scanning a simple key", it->second.mark, "could not find expected ':'",
                       reader_.get_mark());
  }
  possible_simple_keys_.erase(it);
}

// Indentation ---------------------------------------------------------------

void Scanner::unwind_indent(int column) {
  // indentation is ignored in flow context
  if (flow_level()) {
    return;
  }
  while (indent_ > column) {
    Mark mark = reader_.get_mark();
    indent_ = indents_.back();
    indents_.pop_back();
    tokens_.emplace_back(TokenKind::BlockEnd, mark, mark);
  }
}

bool Scanner::add_indent(int column) {
  if (indent_ < column) {
    indents_.push_back(indent_);
    indent_ = column;
    return true;
  }
  return false;
}

// Fetchers ------------------------------------------------------------------

void Scanner::fetch_stream_start() {
  Mark mark = reader_.get_mark();
  Token token(TokenKind::StreamStart, mark, mark);
  token.encoding = reader_.encoding();
  tokens_.push_back(std::move(token));
}

void Scanner::fetch_stream_end() {
  unwind_indent(-1);
  remove_possible_simple_key();
  allow_simple_key_ = false;
  possible_simple_keys_.clear();
  Mark mark = reader_.get_mark();
  tokens_.emplace_back(TokenKind::StreamEnd, mark, mark);
  done_ = true;
}

void Scanner::fetch_directive() {
  unwind_indent(-1);
  remove_possible_simple_key();
  allow_simple_key_ = false;
  tokens_.push_back(scan_directive());
}

void Scanner::fetch_document_indicator(TokenKind kind) {
  unwind_indent(-1);
  // no block collection can follow '---'
  remove_possible_simple_key();
  allow_simple_key_ = false;
  Mark start_mark = reader_.get_mark();
  reader_.forward(3);
  tokens_.emplace_back(kind, start_mark, reader_.get_mark());
}

void Scanner::fetch_flow_collection_start(TokenKind kind, char to_push) {
  save_possible_simple_key();
  flow_context_.push_back(to_push);
  allow_simple_key_ = true;
  Mark start_mark = reader_.get_mark();
  reader_.forward();
  tokens_.emplace_back(kind, start_mark, reader_.get_mark());
}

void Scanner::fetch_flow_collection_end(TokenKind kind) {
  remove_possible_simple_key();
  // an unbalanced close is left for the parser to report
  if (!flow_context_.empty()) {
    flow_context_.pop_back();
  }
  allow_simple_key_ = false;
  Mark start_mark = reader_.get_mark();
  reader_.forward();
  tokens_.emplace_back(kind, start_mark, reader_.get_mark());
}

void Scanner::fetch_flow_entry() {
  allow_simple_key_ = true;
  remove_possible_simple_key();
  Mark start_mark = reader_.get_mark();
  reader_.forward();
  tokens_.emplace_back(TokenKind::FlowEntry, start_mark, reader_.get_mark());
}

void Scanner::fetch_block_entry() {
  if (!flow_level()) {
    if (!allow_simple_key_) {
      throw ScannerError("", std::nullopt, "sequence entries are not allowed here", reader_.get_mark());
    }
    if (add_indent(static_cast<int>(reader_.column()))) {
      Mark mark = reader_.get_mark();
      tokens_.emplace_back(TokenKind::BlockSequenceStart, mark, mark);
    }
  }
  // a '-' in flow context is reported by the parser
  allow_simple_key_ = true;
  remove_possible_simple_key();
  Mark start_mark = reader_.get_mark();
  reader_.forward();
  tokens_.emplace_back(TokenKind::BlockEntry, start_mark, reader_.get_mark());
}

void Scanner::fetch_key() {
  if (!flow_level()) {
    if (!allow_simple_key_) {
      throw ScannerError("", std::nullopt, "mapping keys are not allowed here", reader_.get_mark());
    }
    if (add_indent(static_cast<int>(reader_.column()))) {
      Mark mark = reader_.get_mark();
      tokens_.emplace_back(TokenKind::BlockMappingStart, mark, mark);
    }
  }
  allow_simple_key_ = !flow_level();
  remove_possible_simple_key();
  Mark start_mark = reader_.get_mark();
  reader_.forward();
  tokens_.emplace_back(TokenKind::Key, start_mark, reader_.get_mark());
}

void Scanner::fetch_value() {
  auto it = possible_simple_keys_.find(flow_level());
  if (it != possible_simple_keys_.end()) {
    SimpleKey key = it->second;
    possible_simple_keys_.erase(it);
    auto pos = static_cast<std::ptrdiff_t>(key.token_number - tokens_taken_);
    tokens_.insert(tokens_.begin() + pos, Token(TokenKind::Key, key.mark, key.mark));
    if (!flow_level() && add_indent(static_cast<int>(key.column))) {
      tokens_.insert(tokens_.begin() + pos, Token(TokenKind::BlockMappingStart, key.mark, key.mark));
    }
    // no two simple keys in a row
    allow_simple_key_ = false;
  } else {
    // part of a complex key
    if (!flow_level()) {
      if (!allow_simple_key_) {
        throw ScannerError("", std::nullopt, "mapping values are not allowed here", reader_.get_mark());
      }
      if (add_indent(static_cast<int>(reader_.column()))) {
        Mark mark = reader_.get_mark();
        tokens_.emplace_back(TokenKind::BlockMappingStart, mark, mark);
      }
    }
    allow_simple_key_ = !flow_level();
    remove_possible_simple_key();
  }
  Mark start_mark = reader_.get_mark();
  reader_.forward();
  tokens_.emplace_back(TokenKind::Value, start_mark, reader_.get_mark());
}

void Scanner::fetch_alias() {
  save_possible_simple_key();
  allow_simple_key_ = false;
  tokens_.push_back(scan_anchor(TokenKind::Alias));
}

void Scanner::fetch_anchor() {
  save_possible_simple_key();
  allow_simple_key_ = false;
  tokens_.push_back(scan_anchor(TokenKind::Anchor));
}

void Scanner::fetch_tag() {
  save_possible_simple_key();
  allow_simple_key_ = false;
  tokens_.push_back(scan_tag());
}

void Scanner::fetch_block_scalar(ScalarStyle style) {
  // a simple key may follow a block scalar
  allow_simple_key_ = true;
  remove_possible_simple_key();
  tokens_.push_back(scan_block_scalar(style, round_trip()));
}

void Scanner::fetch_flow_scalar(ScalarStyle style) {
  save_possible_simple_key();
  allow_simple_key_ = false;
  tokens_.push_back(scan_flow_scalar(style));
}

void Scanner::fetch_plain() {
  save_possible_simple_key();
  // scan_plain turns this back on when the scalar ends at a line start
  allow_simple_key_ = false;
  tokens_.push_back(scan_plain());
}

// Checkers ------------------------------------------------------------------

bool Scanner::check_directive() const { return reader_.column() == 0; }

bool Scanner::check_document_start() const {
  return reader_.column() == 0 && reader_.prefix(3) == U"---" && is_blank_or_break_z(reader_.peek(3));
}

bool Scanner::check_document_end() const {
  return reader_.column() == 0 && reader_.prefix(3) == U"..." && is_blank_or_break_z(reader_.peek(3));
}

bool Scanner::check_block_entry() const { return is_blank_or_break_z(reader_.peek(1)); }

bool Scanner::check_key() const { return flow_level() || is_blank_or_break_z(reader_.peek(1)); }

bool Scanner::check_value() const {
  if (processing_version() == VersionInfo{1, 1}) {
    if (flow_level()) {
      return true;
    }
  } else if (flow_level()) {
    if (flow_context_.back() == '[') {
      if (!is_blank_or_break_z(reader_.peek(1))) {
        return false;
      }
    } else if (!tokens_.empty() && tokens_.back().kind == TokenKind::Value) {
      // scanning the value of a flow mapping entry
      if (!is_blank_or_break_z(reader_.peek(1))) {
        return false;
      }
    }
    return true;
  }
  return is_blank_or_break_z(reader_.peek(1));
}

bool Scanner::check_plain() const {
  char32_t ch = reader_.peek();
  char32_t ch1 = reader_.peek(1);
  bool key_or_value = !flow_level() && (ch == U'?' || ch == U':');
  if (processing_version() == VersionInfo{1, 1}) {
    return !is_plain_stopper(ch) || (!is_blank_or_break_z(ch1) && (ch == U'-' || key_or_value));
  }
  if (!is_plain_stopper(ch)) {
    return true;
  }
  if (ch == U'-' && !is_blank_or_break_z(ch1)) {
    return true;
  }
  if (ch == U':' && flow_level() && ch1 != U' ' && ch1 != U'\t') {
    return true;
  }
  return !is_blank_or_break_z(ch1) && (ch == U'-' || key_or_value);
}

// Scanners ------------------------------------------------------------------

std::optional<Scanner::ScannedComment> Scanner::scan_to_next_token() {
  if (reader_.index() == 0 && reader_.peek() == U'\uFEFF') {
    reader_.forward();
  }
  while (true) {
    while (reader_.peek() == U' ' || (flow_level() && reader_.peek() == U'\t')) {
      reader_.forward();
    }
    if (reader_.peek() == U'#') {
      while (!is_break_z(reader_.peek())) {
        reader_.forward();
      }
    }
    if (scan_line_break().empty()) {
      return std::nullopt;
    }
    if (!flow_level()) {
      allow_simple_key_ = true;
    }
  }
}

Token Scanner::scan_directive() {
  Mark start_mark = reader_.get_mark();
  reader_.forward();
  Token token(TokenKind::Directive, start_mark, start_mark);
  token.value = scan_directive_name(start_mark);
  if (token.value == "YAML") {
    token.version = scan_yaml_directive_value(start_mark);
    token.end_mark = reader_.get_mark();
  } else if (token.value == "TAG") {
    token.tag_directive = scan_tag_directive_value(start_mark);
    token.end_mark = reader_.get_mark();
  } else {
    token.end_mark = reader_.get_mark();
    while (!is_break_z(reader_.peek())) {
      reader_.forward();
    }
  }
  scan_directive_ignored_line(start_mark);
  return token;
}

std::string Scanner::scan_directive_name(const Mark &start_mark) {
  std::size_t length = 0;
  char32_t ch = reader_.peek(length);
  while (is_ascii_alnum(ch) || ch == U'-' || ch == U'_' || ch == U':' || ch == U'.') {
    ++length;
    ch = reader_.peek(length);
  }
  if (!length) {
    throw ScannerError("while scanning a directive", start_mark,
                       "expected alphabetic or numeric character, but found " + repr_char(ch), reader_.get_mark());
  }
  std::string value = to_utf8(reader_.prefix(length));
  reader_.forward(length);
  ch = reader_.peek();
  if (!is_break_z_or_space(ch)) {
    throw ScannerError("while scanning a directive", start_mark,
                       "expected alphabetic or numeric character, but found " + repr_char(ch), reader_.get_mark());
  }
  return value;
}

VersionInfo Scanner::scan_yaml_directive_value(const Mark &start_mark) {
  while (reader_.peek() == U' ') {
    reader_.forward();
  }
  int major = scan_yaml_directive_number(start_mark);
  if (reader_.peek() != U'.') {
    throw ScannerError("while scanning a directive", start_mark,
                       "expected a digit or '.', but found " + repr_char(reader_.peek()), reader_.get_mark());
  }
  reader_.forward();
  int minor = scan_yaml_directive_number(start_mark);
  if (!is_break_z_or_space(reader_.peek())) {
    throw ScannerError("while scanning a directive", start_mark,
                       "expected a digit or '.', but found " + repr_char(reader_.peek()), reader_.get_mark());
  }
  yaml_version_ = VersionInfo{major, minor};
  return *yaml_version_;
}

int Scanner::scan_yaml_directive_number(const Mark &start_mark) {
  char32_t ch = reader_.peek();
  if (!(ch >= U'0' && ch <= U'9')) {
    throw ScannerError("while scanning a directive", start_mark, "expected a digit, but found " + repr_char(ch),
                       reader_.get_mark());
  }
  int value = 0;
  std::size_t length = 0;
  for (ch = reader_.peek(length); ch >= U'0' && ch <= U'9'; ch = reader_.peek(++length)) {
    if (value < 100000) {
      value = value * 10 + static_cast<int>(ch - U'0');
    }
  }
  reader_.forward(length);
  return value;
}

std::pair<std::string, std::string> Scanner::scan_tag_directive_value(const Mark &start_mark) {
  while (reader_.peek() == U' ') {
    reader_.forward();
  }
  std::u32string handle = scan_tag_directive_handle(start_mark);
  while (reader_.peek() == U' ') {
    reader_.forward();
  }
  std::u32string prefix = scan_tag_directive_prefix(start_mark);
  return {to_utf8(handle), to_utf8(prefix)};
}

std::u32string Scanner::scan_tag_directive_handle(const Mark &start_mark) {
  std::u32string value = scan_tag_handle("directive", start_mark);
  char32_t ch = reader_.peek();
  if (ch != U' ') {
    throw ScannerError("while scanning a directive", start_mark, "expected ' ', but found " + repr_char(ch),
                       reader_.get_mark());
  }
  return value;
}

std::u32string Scanner::scan_tag_directive_prefix(const Mark &start_mark) {
  std::u32string value = scan_tag_uri("directive", start_mark);
  char32_t ch = reader_.peek();
  if (!is_break_z_or_space(ch)) {
    throw ScannerError("while scanning a directive", start_mark, "expected ' ', but found " + repr_char(ch),
                       reader_.get_mark());
  }
  return value;
}

void Scanner::scan_directive_ignored_line(const Mark &start_mark) {
  while (reader_.peek() == U' ') {
    reader_.forward();
  }
  if (reader_.peek() == U'#') {
    while (!is_break_z(reader_.peek())) {
      reader_.forward();
    }
  }
  char32_t ch = reader_.peek();
  if (!is_break_z(ch)) {
    throw ScannerError("while scanning a directive", start_mark,
                       "expected a comment or a line break, but found " + repr_char(ch), reader_.get_mark());
  }
  scan_line_break();
}

Token Scanner::scan_anchor(TokenKind kind) {
  Mark start_mark = reader_.get_mark();
  std::string name = reader_.peek() == U'*' ? "alias" : "anchor";
  reader_.forward();
  std::size_t length = 0;
  char32_t ch = reader_.peek(length);
  while (check_anchorname_char(ch)) {
    ++length;
    ch = reader_.peek(length);
  }
  if (!length) {
    throw ScannerError("while scanning an " + name, start_mark,
                       "expected alphabetic or numeric character, but found " + repr_char(ch), reader_.get_mark());
  }
  std::string value = to_utf8(reader_.prefix(length));
  reader_.forward(length);
  bool valid_end = is_blank_or_break_z(ch) || is_flow_indicator(ch) || ch == U'?' || ch == U':' || ch == U'%' ||
                   ch == U'@' || ch == U'`';
  if (!valid_end) {
    throw ScannerError("while scanning an " + name, start_mark,
                       "expected alphabetic or numeric character, but found " + repr_char(ch), reader_.get_mark());
  }
  Token token(kind, start_mark, reader_.get_mark());
  token.value = std::move(value);
  return token;
}

Token Scanner::scan_tag() {
  Mark start_mark = reader_.get_mark();
  char32_t ch = reader_.peek(1);
  std::u32string short_handle = U"!";
  if (ch == U'!') {
    short_handle = U"!!";
    reader_.forward();
    ch = reader_.peek(1);
  }

  std::optional<std::u32string> handle;
  std::u32string suffix;
  if (ch == U'<') {
    // verbatim tag
    reader_.forward(2);
    suffix = scan_tag_uri("tag", start_mark);
    if (reader_.peek() != U'>') {
      throw ScannerError("while parsing a tag", start_mark, "expected '>' but found " + repr_char(reader_.peek()),
                         reader_.get_mark());
    }
    reader_.forward();
  } else if (is_blank_or_break_z(ch)) {
    // the non-specific tag
    suffix = short_handle;
    reader_.forward();
  } else {
    std::size_t length = 1;
    bool use_handle = false;
    while (!is_break_z_or_space(ch)) {
      if (ch == U'!') {
        use_handle = true;
        break;
      }
      ++length;
      ch = reader_.peek(length);
    }
    if (use_handle) {
      handle = scan_tag_handle("tag", start_mark);
    } else {
      handle = short_handle;
      reader_.forward();
    }
    suffix = scan_tag_uri("tag", start_mark);
  }
  ch = reader_.peek();
  if (!is_break_z_or_space(ch)) {
    throw ScannerError("while scanning a tag", start_mark, "expected ' ', but found " + repr_char(ch),
                       reader_.get_mark());
  }
  Token token(TokenKind::Tag, start_mark, reader_.get_mark());
  if (handle) {
    token.tag_handle = to_utf8(*handle);
  }
  token.tag_suffix = to_utf8(suffix);
  return token;
}

Token Scanner::scan_block_scalar(ScalarStyle style, bool rt) {
  bool folded = style == ScalarStyle::Folded;
  std::u32string chunks;
  Mark start_mark = reader_.get_mark();

  // header
  reader_.forward();
  auto [chomping, increment] = scan_block_scalar_indicators(start_mark);
  // e.g. `|+  # comment text`
  std::optional<std::u32string> block_scalar_comment = scan_block_scalar_ignored_line(start_mark);

  // indentation, a top level block scalar may start in column 0
  int min_indent = indent_ + 1;
  int indent;
  std::u32string breaks;
  Mark end_mark;
  if (!increment) {
    int max_indent = 0;
    breaks = scan_block_scalar_indentation(max_indent, end_mark);
    indent = std::max(min_indent, max_indent);
  } else {
    if (min_indent < 1) {
      min_indent = 1;
    }
    indent = min_indent + *increment - 1;
    breaks = scan_block_scalar_breaks(indent, end_mark);
  }

  std::u32string line_break;
  while (static_cast<int>(reader_.column()) == indent && reader_.peek() != U'\0') {
    chunks += breaks;
    bool leading_non_space = reader_.peek() != U' ' && reader_.peek() != U'\t';
    std::size_t length = 0;
    while (!is_break_z(reader_.peek(length))) {
      ++length;
    }
    chunks += reader_.prefix(length);
    reader_.forward(length);
    line_break = scan_line_break();
    breaks = scan_block_scalar_breaks(indent, end_mark);
    if (min_indent == 0 && (check_document_start() || check_document_end())) {
      break;
    }
    if (static_cast<int>(reader_.column()) == indent && reader_.peek() != U'\0') {
      // fold positions are marked with '\a' so the folding survives a round trip
      if (rt && folded && line_break == U"\n") {
        chunks += U'\a';
      }
      if (folded && line_break == U"\n" && leading_non_space && reader_.peek() != U' ' && reader_.peek() != U'\t') {
        if (breaks.empty()) {
          chunks += U' ';
        }
      } else {
        chunks += line_break;
      }
    } else {
      break;
    }
  }

  // chomping: clip keeps the last break, keep keeps all trailing breaks, strip drops them
  std::u32string trailing;
  if (!chomping || *chomping) {
    chunks += line_break;
  }
  if (chomping && *chomping) {
    chunks += breaks;
  } else {
    trailing += breaks;
  }

  Token token(TokenKind::Scalar, start_mark, end_mark);
  token.value = to_utf8(chunks);
  token.plain = false;
  token.style = style;
  if (keep_comments() && block_scalar_comment) {
    CommentRef header = make_comment(to_utf8(*block_scalar_comment), start_mark);
    header->block_header = true;
    token.add_pre_comments({header});
  }
  if (!trailing.empty()) {
    // the dropped line breaks and the comments that follow them
    while (auto comment = scan_to_next_token()) {
      trailing.append(comment->start_mark.column, U' ');
      trailing += comment->value;
    }
    if (keep_comments()) {
      token.add_post_comment(make_comment(to_utf8(trailing), end_mark, reader_.get_mark()));
    }
  }
  return token;
}

std::pair<std::optional<bool>, std::optional<int>> Scanner::scan_block_scalar_indicators(const Mark &start_mark) {
  std::optional<bool> chomping;
  std::optional<int> increment;
  auto scan_increment = [&] {
    char32_t ch = reader_.peek();
    if (ch >= U'0' && ch <= U'9') {
      if (ch == U'0') {
        throw ScannerError("while scanning a block scalar", start_mark,
                           "expected indentation indicator in the range 1-9, but found 0", reader_.get_mark());
      }
      increment = static_cast<int>(ch - U'0');
      reader_.forward();
    }
  };
  auto scan_chomping = [&] {
    char32_t ch = reader_.peek();
    if (ch == U'+' || ch == U'-') {
      chomping = ch == U'+';
      reader_.forward();
    }
  };
  char32_t ch = reader_.peek();
  if (ch == U'+' || ch == U'-') {
    scan_chomping();
    scan_increment();
  } else if (ch >= U'0' && ch <= U'9') {
    scan_increment();
    scan_chomping();
  }
  ch = reader_.peek();
  if (!is_break_z_or_space(ch)) {
    throw ScannerError("while scanning a block scalar", start_mark,
                       "expected chomping or indentation indicators, but found " + repr_char(ch), reader_.get_mark());
  }
  return {chomping, increment};
}

std::optional<std::u32string> Scanner::scan_block_scalar_ignored_line(const Mark &start_mark) {
  std::u32string prefix;
  std::optional<std::u32string> comment;
  while (reader_.peek() == U' ') {
    prefix += U' ';
    reader_.forward();
  }
  if (reader_.peek() == U'#') {
    comment = prefix;
    while (!is_break_z(reader_.peek())) {
      *comment += reader_.peek();
      reader_.forward();
    }
  }
  char32_t ch = reader_.peek();
  if (!is_break_z(ch)) {
    throw ScannerError("while scanning a block scalar", start_mark,
                       "expected a comment or a line break, but found " + repr_char(ch), reader_.get_mark());
  }
  scan_line_break();
  return comment;
}

std::u32string Scanner::scan_block_scalar_indentation(int &max_indent, Mark &end_mark) {
  std::u32string chunks;
  int first_indent = -1;
  max_indent = 0;
  end_mark = reader_.get_mark();
  while (reader_.peek() == U' ' || is_line_break(reader_.peek())) {
    if (reader_.peek() != U' ') {
      if (first_indent < 0) {
        first_indent = static_cast<int>(reader_.column());
      }
      chunks += scan_line_break();
      end_mark = reader_.get_mark();
    } else {
      reader_.forward();
      max_indent = std::max(max_indent, static_cast<int>(reader_.column()));
    }
  }
  if (first_indent > 0 && max_indent > first_indent) {
    throw ScannerError("more indented follow up line than first in a block scalar", reader_.get_mark(), "",
                       std::nullopt);
  }
  return chunks;
}

std::u32string Scanner::scan_block_scalar_breaks(int indent, Mark &end_mark) {
  std::u32string chunks;
  end_mark = reader_.get_mark();
  auto skip_indent = [&] {
    while (static_cast<int>(reader_.column()) < indent && reader_.peek() == U' ') {
      reader_.forward();
    }
  };
  skip_indent();
  while (is_line_break(reader_.peek())) {
    chunks += scan_line_break();
    end_mark = reader_.get_mark();
    skip_indent();
  }
  return chunks;
}

Token Scanner::scan_flow_scalar(ScalarStyle style) {
  // quoted scalars ignore indentation, only document separators are checked
  bool dbl = style == ScalarStyle::DoubleQuoted;
  std::u32string chunks;
  Mark start_mark = reader_.get_mark();
  char32_t quote = reader_.peek();
  reader_.forward();
  scan_flow_scalar_non_spaces(dbl, start_mark, chunks);
  while (reader_.peek() != quote) {
    scan_flow_scalar_spaces(dbl, start_mark, chunks);
    scan_flow_scalar_non_spaces(dbl, start_mark, chunks);
  }
  reader_.forward();
  Token token(TokenKind::Scalar, start_mark, reader_.get_mark());
  token.value = to_utf8(chunks);
  token.plain = false;
  token.style = style;
  return token;
}

void Scanner::scan_flow_scalar_non_spaces(bool dbl, const Mark &start_mark, std::u32string &chunks) {
  auto is_special = [](char32_t ch) {
    return ch == U' ' || ch == U'\t' || ch == U'\'' || ch == U'"' || ch == U'\\' || is_break_z(ch);
  };
  while (true) {
    std::size_t length = 0;
    while (!is_special(reader_.peek(length))) {
      ++length;
    }
    if (length) {
      chunks += reader_.prefix(length);
      reader_.forward(length);
    }
    char32_t ch = reader_.peek();
    if (!dbl && ch == U'\'' && reader_.peek(1) == U'\'') {
      chunks += U'\'';
      reader_.forward(2);
    } else if ((dbl && ch == U'\'') || (!dbl && (ch == U'"' || ch == U'\\'))) {
      chunks += ch;
      reader_.forward();
    } else if (dbl && ch == U'\\') {
      reader_.forward();
      ch = reader_.peek();
      if (auto replacement = escape_replacement(ch)) {
        chunks += *replacement;
        reader_.forward();
      } else if (std::size_t code_length = escape_code_length(ch)) {
        reader_.forward();
        for (std::size_t k = 0; k < code_length; ++k) {
          if (!is_hex_digit(reader_.peek(k))) {
            throw ScannerError("while scanning a double-quoted scalar", start_mark,
                               "expected escape sequence of " + std::to_string(code_length) +
                                   " hexdecimal numbers, but found " + repr_char(reader_.peek(k)),
                               reader_.get_mark());
          }
        }
        std::uint32_t code = parse_hex(reader_.prefix(code_length));
        if (code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
          throw ScannerError("while scanning a double-quoted scalar", start_mark,
                             "found escape of an invalid code point", reader_.get_mark());
        }
        chunks += static_cast<char32_t>(code);
        reader_.forward(code_length);
      } else if (is_line_break(ch)) {
        scan_line_break();
        scan_flow_scalar_breaks(start_mark, chunks);
      } else {
        throw ScannerError("while scanning a double-quoted scalar", start_mark,
                           "found unknown escape character " + repr_char(ch), reader_.get_mark());
      }
    } else {
      return;
    }
  }
}

void Scanner::scan_flow_scalar_spaces(bool, const Mark &start_mark, std::u32string &chunks) {
  std::size_t length = 0;
  while (reader_.peek(length) == U' ' || reader_.peek(length) == U'\t') {
    ++length;
  }
  std::u32string whitespaces = reader_.prefix(length);
  reader_.forward(length);
  char32_t ch = reader_.peek();
  if (ch == U'\0') {
    throw ScannerError("while scanning a quoted scalar", start_mark, "found unexpected end of stream",
                       reader_.get_mark());
  }
  if (is_line_break(ch)) {
    std::u32string line_break = scan_line_break();
    std::u32string breaks;
    scan_flow_scalar_breaks(start_mark, breaks);
    if (line_break != U"\n") {
      chunks += line_break;
    } else if (breaks.empty()) {
      chunks += U' ';
    }
    chunks += breaks;
  } else {
    chunks += whitespaces;
  }
}

void Scanner::scan_flow_scalar_breaks(const Mark &start_mark, std::u32string &chunks) {
  while (true) {
    std::u32string prefix = reader_.prefix(3);
    if ((prefix == U"---" || prefix == U"...") && is_blank_or_break_z(reader_.peek(3))) {
      throw ScannerError("while scanning a quoted scalar", start_mark, "found unexpected document separator",
                         reader_.get_mark());
    }
    while (reader_.peek() == U' ' || reader_.peek() == U'\t') {
      reader_.forward();
    }
    if (!is_line_break(reader_.peek())) {
      return;
    }
    chunks += scan_line_break();
  }
}

Token Scanner::scan_plain() {
  // in flow context ',', ':' and '?' end a plain scalar, indentation is not checked
  std::u32string chunks;
  Mark start_mark = reader_.get_mark();
  Mark end_mark = start_mark;
  int indent = indent_ + 1;
  bool version_1_1 = processing_version() == VersionInfo{1, 1};
  std::u32string spaces;
  while (true) {
    std::size_t length = 0;
    if (reader_.peek() == U'#') {
      break;
    }
    char32_t ch;
    while (true) {
      ch = reader_.peek(length);
      if (ch == U':' && !is_blank_or_break_z(reader_.peek(length + 1))) {
        // part of the scalar
      } else if (ch == U'?' && !version_1_1) {
        // part of the scalar
      } else if (is_blank_or_break_z(ch) ||
                 (!flow_level() && ch == U':' && is_blank_or_break_z(reader_.peek(length + 1))) ||
                 (flow_level() && (ch == U':' || ch == U'?' || is_flow_indicator(ch)))) {
        break;
      }
      ++length;
    }
    if (flow_level() && ch == U':') {
      char32_t next = reader_.peek(length + 1);
      if (!is_blank_or_break_z(next) && !is_flow_indicator(next)) {
        reader_.forward(length);
        throw ScannerError("while scanning a plain scalar", start_mark, "found unexpected ':'", reader_.get_mark(),
                           "Please check http://pyyaml.org/wiki/YAMLColonInFlowContext for details.");
      }
    }
    if (length == 0) {
      break;
    }
    allow_simple_key_ = false;
    chunks += spaces;
    chunks += reader_.prefix(length);
    reader_.forward(length);
    end_mark = reader_.get_mark();
    spaces = scan_plain_spaces(indent);
    if (spaces.empty() || reader_.peek() == U'#' ||
        (!flow_level() && static_cast<int>(reader_.column()) < indent)) {
      break;
    }
  }

  Token token(TokenKind::Scalar, start_mark, end_mark);
  token.value = to_utf8(chunks);
  token.plain = true;
  // the line breaks after the scalar keep the blank lines that follow it
  if (keep_comments() && !spaces.empty() && spaces.front() == U'\n') {
    token.add_post_comment(make_comment(to_utf8(spaces) + "\n", start_mark, end_mark));
  }
  return token;
}

std::u32string Scanner::scan_plain_spaces(int) {
  // tabs are not allowed in plain scalars
  std::u32string chunks;
  std::size_t length = 0;
  while (reader_.peek(length) == U' ') {
    ++length;
  }
  std::u32string whitespaces = reader_.prefix(length);
  reader_.forward(length);
  auto at_separator = [this] {
    std::u32string prefix = reader_.prefix(3);
    return (prefix == U"---" || prefix == U"...") && is_blank_or_break_z(reader_.peek(3));
  };
  char32_t ch = reader_.peek();
  if (is_line_break(ch)) {
    std::u32string line_break = scan_line_break();
    allow_simple_key_ = true;
    if (at_separator()) {
      return {};
    }
    std::u32string breaks;
    while (reader_.peek() == U' ' || is_line_break(reader_.peek())) {
      if (reader_.peek() == U' ') {
        reader_.forward();
      } else {
        breaks += scan_line_break();
        if (at_separator()) {
          return {};
        }
      }
    }
    if (line_break != U"\n") {
      chunks += line_break;
    } else if (breaks.empty()) {
      chunks += U' ';
    }
    chunks += breaks;
  } else if (!whitespaces.empty()) {
    chunks += whitespaces;
  }
  return chunks;
}

std::u32string Scanner::scan_tag_handle(const std::string &name, const Mark &start_mark) {
  // '_' is accepted in tag handles as well
  char32_t ch = reader_.peek();
  if (ch != U'!') {
    throw ScannerError("while scanning an " + name, start_mark, "expected '!', but found " + repr_char(ch),
                       reader_.get_mark());
  }
  std::size_t length = 1;
  ch = reader_.peek(length);
  if (ch != U' ') {
    while (is_ascii_alnum(ch) || ch == U'-' || ch == U'_') {
      ++length;
      ch = reader_.peek(length);
    }
    if (ch != U'!') {
      reader_.forward(length);
      throw ScannerError("while scanning an " + name, start_mark, "expected '!' but found " + repr_char(ch),
                         reader_.get_mark());
    }
    ++length;
  }
  std::u32string value = reader_.prefix(length);
  reader_.forward(length);
  return value;
}

std::u32string Scanner::scan_tag_uri(const std::string &name, const Mark &start_mark) {
  // the URI is not checked for well-formedness
  bool allow_hash = processing_version() > VersionInfo{1, 1};
  std::u32string chunks;
  std::size_t length = 0;
  char32_t ch = reader_.peek(length);
  while (is_uri_char(ch) || (allow_hash && ch == U'#')) {
    if (ch == U'%') {
      chunks += reader_.prefix(length);
      reader_.forward(length);
      length = 0;
      chunks += scan_uri_escapes(name, start_mark);
    } else {
      ++length;
    }
    ch = reader_.peek(length);
  }
  if (length) {
    chunks += reader_.prefix(length);
    reader_.forward(length);
  }
  if (chunks.empty()) {
    throw ScannerError("while parsing an " + name, start_mark, "expected URI, but found " + repr_char(ch),
                       reader_.get_mark());
  }
  return chunks;
}

std::u32string Scanner::scan_uri_escapes(const std::string &name, const Mark &start_mark) {
  std::string code_bytes;
  Mark mark = reader_.get_mark();
  while (reader_.peek() == U'%') {
    reader_.forward();
    for (std::size_t k = 0; k < 2; ++k) {
      if (!is_hex_digit(reader_.peek(k))) {
        throw ScannerError("while scanning an " + name, start_mark,
                           "expected URI escape sequence of 2 hexdecimal numbers, but found " +
                               repr_char(reader_.peek(k)),
                           reader_.get_mark());
      }
    }
    code_bytes.push_back(static_cast<char>(parse_hex(reader_.prefix(2))));
    reader_.forward(2);
  }
  std::u32string value;
  std::size_t bad = decode_utf8(code_bytes, value);
  if (bad != std::string::npos) {
    throw ScannerError("while scanning an " + name, start_mark,
                       "'utf-8' codec can't decode byte " + hex_byte(static_cast<unsigned char>(code_bytes[bad])) +
                           " in position " + std::to_string(bad) + ": invalid start byte",
                       mark);
  }
  return value;
}

std::u32string Scanner::scan_line_break(bool empty_line) {
  char32_t ch = reader_.peek();
  if (ch == U'\r' || ch == U'\n' || ch == U'\x85') {
    if (ch == U'\r' && reader_.peek(1) == U'\n') {
      reader_.forward(2);
    } else {
      reader_.forward();
    }
    return U"\n";
  }
  if (ch == U'\u2028' || ch == U'\u2029') {
    reader_.forward();
    return std::u32string(1, ch);
  }
  if (empty_line && (ch == U'\t' || ch == U' ')) {
    reader_.forward();
    return std::u32string(1, ch);
  }
  return {};
}

// RoundTripScanner ----------------------------------------------------------

void RoundTripScanner::prepare_tokens() {
  Scanner::prepare_tokens();
  gather_comments();
}

void RoundTripScanner::gather_comments() {
  CommentGroup comments;
  auto take_leading_comments = [&] {
    while (!tokens_.empty() && tokens_.front().kind == TokenKind::Comment) {
      ++tokens_taken_;
      comments.push_back(std::move(tokens_.front().comment_token));
      tokens_.pop_front();
    }
  };
  take_leading_comments();
  while (need_more_tokens()) {
    fetch_more_tokens();
    take_leading_comments();
  }
  if (tokens_.empty()) {
    return;
  }
  if (!comments.empty()) {
    tokens_.front().add_pre_comments(std::move(comments));
  }
  // pull in a post comment, e.g. on ':'
  if (!done_ && tokens_.size() < 2) {
    fetch_more_tokens();
  }
}

Token RoundTripScanner::get_token() {
  prepare_tokens();
  if (tokens_.empty()) {
    Mark mark = reader_.get_mark();
    return Token(TokenKind::StreamEnd, mark, mark);
  }

  auto comment_follows = [this] { return tokens_.size() > 1 && tokens_[1].kind == TokenKind::Comment; };
  // append the comments directly following the one just taken
  auto absorb_following = [&](CommentToken &c) {
    if (!done_) {
      fetch_more_tokens();
    }
    while (comment_follows()) {
      ++tokens_taken_;
      CommentRef c1 = std::move(tokens_[1].comment_token);
      tokens_.erase(tokens_.begin() + 1);
      c.value += std::string(c1->column(), ' ') + c1->value;
      if (!done_) {
        fetch_more_tokens();
      }
    }
  };

  if (comment_follows()) {
    TokenKind kind = tokens_.front().kind;
    std::size_t head_line = tokens_.front().end_mark.line;
    std::size_t comment_line = tokens_[1].start_mark.line;
    bool eol_capable = kind == TokenKind::Scalar || kind == TokenKind::Value || kind == TokenKind::FlowSequenceEnd ||
                       kind == TokenKind::FlowMappingEnd;
    // only single line tokens take a post comment, the others leave it as pre comment of what follows
    if (eol_capable && head_line == comment_line) {
      ++tokens_taken_;
      CommentRef c = std::move(tokens_[1].comment_token);
      tokens_.erase(tokens_.begin() + 1);
      std::size_t head_end = tokens_.front().end_mark.column;
      c->gap = c->column() > head_end ? c->column() - head_end : 0;
      absorb_following(*c);
      tokens_.front().add_post_comment(std::move(c));
    } else if (kind == TokenKind::Scalar && head_line != comment_line) {
      ++tokens_taken_;
      CommentRef c = std::move(tokens_[1].comment_token);
      tokens_.erase(tokens_.begin() + 1);
      c->value = std::string(c->start_mark.line - head_line, '\n') + std::string(c->column(), ' ') + c->value;
      tokens_.front().add_post_comment(c);
      absorb_following(*c);
    }
  }
  ++tokens_taken_;
  Token token = std::move(tokens_.front());
  tokens_.pop_front();
  return token;
}

void RoundTripScanner::fetch_comment(ScannedComment comment) {
  // blank lines within an indented mapping leave trailing spaces
  std::u32string &value = comment.value;
  while (!value.empty() && value.back() == U' ') {
    value.pop_back();
  }
  Token token(TokenKind::Comment, comment.start_mark, comment.end_mark);
  token.comment_token = make_comment(to_utf8(value), comment.start_mark, comment.end_mark);
  tokens_.push_back(std::move(token));
}

std::optional<Scanner::ScannedComment> RoundTripScanner::scan_to_next_token() {
  if (reader_.index() == 0 && reader_.peek() == U'\uFEFF') {
    reader_.forward();
  }
  while (true) {
    while (reader_.peek() == U' ' || (flow_level() && reader_.peek() == U'\t')) {
      reader_.forward();
    }
    char32_t ch = reader_.peek();
    if (ch == U'#') {
      Mark start_mark = reader_.get_mark();
      std::u32string comment(1, ch);
      reader_.forward();
      while (!is_break_z(ch)) {
        ch = reader_.peek();
        if (ch == U'\0') {
          // a stream should end with a line break
          comment += U'\n';
          break;
        }
        comment += ch;
        reader_.forward();
      }
      // blank lines following the comment belong to it
      for (std::u32string lb = scan_line_break(); !lb.empty(); lb = scan_line_break()) {
        comment += lb;
      }
      if (!flow_level()) {
        allow_simple_key_ = true;
      }
      return ScannedComment{std::move(comment), std::move(start_mark), reader_.get_mark()};
    }
    if (scan_line_break().empty()) {
      return std::nullopt;
    }
    if (!flow_level()) {
      allow_simple_key_ = true;
    }
    if (reader_.peek() == U'\n') {
      // empty lines
      Mark start_mark = reader_.get_mark();
      std::u32string comment;
      for (std::u32string part = scan_line_break(true); !part.empty(); part = scan_line_break(true)) {
        comment += part;
      }
      if (reader_.peek() == U'#') {
        // the indentation of the comment line that follows stays with that comment
        auto pos = comment.rfind(U'\n');
        if (pos != std::u32string::npos) {
          comment.erase(pos);
        }
        comment += U'\n';
      }
      return ScannedComment{std::move(comment), std::move(start_mark), reader_.get_mark()};
    }
  }
}

std::u32string RoundTripScanner::scan_uri_escapes(const std::string &name, const Mark &start_mark) {
  // %-escapes are kept as written, only checked for valid UTF-8
  std::u32string chunk;
  std::string code_bytes;
  Mark mark = reader_.get_mark();
  while (reader_.peek() == U'%') {
    chunk += U'%';
    reader_.forward();
    for (std::size_t k = 0; k < 2; ++k) {
      if (!is_hex_digit(reader_.peek(k))) {
        throw ScannerError("while scanning an " + name, start_mark,
                           "expected URI escape sequence of 2 hexdecimal numbers, but found " +
                               repr_char(reader_.peek(k)),
                           reader_.get_mark());
      }
    }
    code_bytes.push_back(static_cast<char>(parse_hex(reader_.prefix(2))));
    chunk += reader_.prefix(2);
    reader_.forward(2);
  }
  std::u32string decoded;
  std::size_t bad = decode_utf8(code_bytes, decoded);
  if (bad != std::string::npos) {
    throw ScannerError("while scanning an " + name, start_mark,
                       "'utf-8' codec can't decode byte " + hex_byte(static_cast<unsigned char>(code_bytes[bad])) +
                           " in position " + std::to_string(bad) + ": invalid start byte",
                       mark);
  }
  return chunk;
}

} // namespace rtyaml
