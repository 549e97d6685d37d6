#pragma once

#include "./reader.hh"
#include "./tokens.hh"

#include <deque>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rtyaml {

// Turns the character stream into tokens
//
// Tokens are produced on demand. A token that may turn out to be a simple key (a scalar, alias,
// anchor, tag or flow collection start followed by ':' on the same line) keeps the queue from
// being drained until the key is resolved, so KEY and BLOCK-MAPPING-START can be inserted before it.
class Scanner {
protected:
  struct SimpleKey {
    std::size_t token_number;
    bool required;
    std::size_t index;
    std::size_t line;
    std::size_t column;
    Mark mark;
  };

  // Comment text with the marks it spans, as found by scan_to_next_token
  struct ScannedComment {
    std::u32string value;
    Mark start_mark;
    Mark end_mark;
  };

  Reader &reader_;

  bool done_ = false;
  std::string flow_context_; // one '[' or '{' per unclosed flow collection
  std::deque<Token> tokens_;
  std::size_t tokens_taken_ = 0;
  int indent_ = -1;
  std::vector<int> indents_;
  bool allow_simple_key_ = true;
  std::map<std::size_t, SimpleKey> possible_simple_keys_; // by flow level

  std::optional<VersionInfo> yaml_version_;       // from %YAML of the current document
  std::optional<VersionInfo> configured_version_; // pinned by the loader

  std::size_t flow_level() const noexcept { return flow_context_.size(); }

  // Fill the queue until the head token is settled
  virtual void prepare_tokens();

  bool need_more_tokens();
  void fetch_more_tokens();
  virtual void fetch_comment(ScannedComment comment);

  std::optional<std::size_t> next_possible_simple_key() const;
  void stale_possible_simple_keys();
  void save_possible_simple_key();
  void remove_possible_simple_key();

  void unwind_indent(int column);
  bool add_indent(int column);

  void fetch_stream_start();
  void fetch_stream_end();
  void fetch_directive();
  void fetch_document_indicator(TokenKind kind);
  void fetch_flow_collection_start(TokenKind kind, char to_push);
  void fetch_flow_collection_end(TokenKind kind);
  void fetch_flow_entry();
  void fetch_block_entry();
  void fetch_key();
  void fetch_value();
  void fetch_alias();
  void fetch_anchor();
  void fetch_tag();
  void fetch_block_scalar(ScalarStyle style);
  void fetch_flow_scalar(ScalarStyle style);
  void fetch_plain();

  bool check_directive() const;
  bool check_document_start() const;
  bool check_document_end() const;
  bool check_block_entry() const;
  bool check_key() const;
  bool check_value() const;
  bool check_plain() const;

  // Skip whitespace, line breaks and comments; the round-trip scanner returns comments and blank lines
  virtual std::optional<ScannedComment> scan_to_next_token();

  Token scan_directive();
  std::string scan_directive_name(const Mark &start_mark);
  VersionInfo scan_yaml_directive_value(const Mark &start_mark);
  int scan_yaml_directive_number(const Mark &start_mark);
  std::pair<std::string, std::string> scan_tag_directive_value(const Mark &start_mark);
  std::u32string scan_tag_directive_handle(const Mark &start_mark);
  std::u32string scan_tag_directive_prefix(const Mark &start_mark);
  void scan_directive_ignored_line(const Mark &start_mark);
  Token scan_anchor(TokenKind kind);
  Token scan_tag();

  Token scan_block_scalar(ScalarStyle style, bool rt);
  std::pair<std::optional<bool>, std::optional<int>> scan_block_scalar_indicators(const Mark &start_mark);
  std::optional<std::u32string> scan_block_scalar_ignored_line(const Mark &start_mark);
  std::u32string scan_block_scalar_indentation(int &max_indent, Mark &end_mark);
  std::u32string scan_block_scalar_breaks(int indent, Mark &end_mark);

  Token scan_flow_scalar(ScalarStyle style);
  void scan_flow_scalar_non_spaces(bool dbl, const Mark &start_mark, std::u32string &chunks);
  void scan_flow_scalar_spaces(bool dbl, const Mark &start_mark, std::u32string &chunks);
  void scan_flow_scalar_breaks(const Mark &start_mark, std::u32string &chunks);

  Token scan_plain();
  // Empty when no more of the scalar follows, e.g. before a document separator
  std::u32string scan_plain_spaces(int indent);

  std::u32string scan_tag_handle(const std::string &name, const Mark &start_mark);
  std::u32string scan_tag_uri(const std::string &name, const Mark &start_mark);
  virtual std::u32string scan_uri_escapes(const std::string &name, const Mark &start_mark);

  // '\r\n', '\r', '\n' and '\x85' become '\n'; '\u2028' and '\u2029' are returned as is.
  // With `empty_line`, a space or tab is consumed as well. Empty when no break was found.
  std::u32string scan_line_break(bool empty_line = false);

  // Blank lines and comments are turned into comment tokens
  virtual bool keep_comments() const noexcept { return false; }
  virtual bool round_trip() const noexcept { return false; }

public:
  explicit Scanner(Reader &reader, std::optional<VersionInfo> version = std::nullopt);
  virtual ~Scanner() = default;

  Scanner(const Scanner &) = delete;
  Scanner &operator=(const Scanner &) = delete;

  // Whether the next token is any token, or one of `kinds`
  bool check_token();
  bool check_token(std::initializer_list<TokenKind> kinds);

  // The next token without consuming it, nullptr past the stream end
  Token *peek_token();

  // Consume the next token, a STREAM-END token past the end
  virtual Token get_token();

  // Version of the document being scanned: %YAML, else the pinned version, else 1.2
  VersionInfo processing_version() const noexcept {
    if (yaml_version_)
      return *yaml_version_;
    if (configured_version_)
      return *configured_version_;
    return VersionInfo{1, 2};
  }

  const std::optional<VersionInfo> &yaml_version() const noexcept { return yaml_version_; }
  void set_yaml_version(std::optional<VersionInfo> version) noexcept { yaml_version_ = version; }
  const std::optional<VersionInfo> &configured_version() const noexcept { return configured_version_; }

  const Reader &reader() const noexcept { return reader_; }
};

// Scanner that keeps comments and blank lines
//
// Comment tokens never reach the parser: runs of them are attached as pre comments to the next
// token, and a comment on the same line as a scalar, ':' or flow collection end becomes that
// token's post comment. Comments on the lines following a scalar are folded into its post comment.
class RoundTripScanner : public Scanner {
protected:
  void prepare_tokens() override;
  void gather_comments();
  void fetch_comment(ScannedComment comment) override;
  std::optional<ScannedComment> scan_to_next_token() override;
  std::u32string scan_uri_escapes(const std::string &name, const Mark &start_mark) override;

  bool keep_comments() const noexcept override { return true; }
  bool round_trip() const noexcept override { return true; }

public:
  using Scanner::Scanner;

  Token get_token() override;
};

} // namespace rtyaml
