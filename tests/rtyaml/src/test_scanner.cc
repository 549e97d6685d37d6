#include "../test_output_utils.hh"
#include "rtyaml/reader.hh"
#include "rtyaml/scanner.hh"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rtyaml;

namespace {

std::vector<Token> scan_all(std::string_view input, bool round_trip = false) {
  Reader reader(input, "<test>");
  std::unique_ptr<Scanner> scanner;
  if (round_trip) {
    scanner = std::make_unique<RoundTripScanner>(reader);
  } else {
    scanner = std::make_unique<Scanner>(reader);
  }
  std::vector<Token> tokens;
  while (true) {
    tokens.push_back(scanner->get_token());
    if (tokens.back().kind == TokenKind::StreamEnd)
      break;
  }
  return tokens;
}

std::string ids(const std::vector<Token> &tokens) {
  std::string s;
  for (const auto &t : tokens) {
    if (!s.empty())
      s += " ";
    s += t.id();
  }
  return s;
}

void testBlockMapping() {
  TestLogger::log_test("block mapping tokens");
  auto tokens = scan_all("a: 1\nb: [x, y]\n");
  TEST_ASSERT_STR(ids(tokens), "<stream start> <block mapping start> ? <scalar> : <scalar> ? <scalar> : [ <scalar> , "
                               "<scalar> ] <block end> <stream end>",
                  "token kinds");
  TEST_ASSERT(tokens[3].value == "a", "first key text");
  TEST_ASSERT(tokens[3].plain, "plain key");
  TEST_ASSERT(tokens[5].value == "1", "first value text");
  TEST_ASSERT(tokens[7].start_mark.line == 1 && tokens[7].start_mark.column == 0, "second key position");
  TestLogger::log_pass("Block mapping tokens");
}

void testBlockSequenceAndIndentation() {
  TestLogger::log_test("block sequence tokens");
  auto tokens = scan_all("- a\n- - b\n  - c\n");
  TEST_ASSERT_STR(ids(tokens),
                  "<stream start> <block sequence start> - <scalar> - <block sequence start> - <scalar> - <scalar> "
                  "<block end> <block end> <stream end>",
                  "nested sequences unwind with two block ends");
  TestLogger::log_pass("Block sequence tokens");
}

void testQuotedScalars() {
  TestLogger::log_test("quoted scalars");
  auto tokens = scan_all("- 'it''s'\n- \"tab\\there \\u00e9\"\n- \"line\n  folded\"\n");
  TEST_ASSERT(tokens[3].value == "it's", "single quote escape");
  TEST_ASSERT(tokens[3].style == ScalarStyle::SingleQuoted, "single quoted style");
  TEST_ASSERT(tokens[5].value == "tab\there \xc3\xa9", "double quoted escapes");
  TEST_ASSERT(tokens[5].style == ScalarStyle::DoubleQuoted, "double quoted style");
  TEST_ASSERT(tokens[7].value == "line folded", "line break in quotes folds to a space");
  TestLogger::log_pass("Quoted scalars");
}

void testBlockScalars() {
  TestLogger::log_test("block scalars and chomping");
  auto tokens = scan_all("a: |\n  one\n   two\n\nb: |-\n  x\n\nc: |+\n  y\n\nd: >\n  p\n  q\n\n  r\n");
  std::vector<std::string> values;
  for (const auto &t : tokens) {
    if (t.kind == TokenKind::Scalar)
      values.push_back(t.value);
  }
  TEST_ASSERT(values.size() == 8, "four keys and four values");
  TEST_ASSERT_STR(values[1], "one\n two\n", "clip keeps a single line break, more indented text kept");
  TEST_ASSERT_STR(values[3], "x", "strip drops the final line break");
  TEST_ASSERT_STR(values[5], "y\n\n", "keep holds trailing blank lines");
  TEST_ASSERT_STR(values[7], "p q\nr\n", "folding joins lines, a blank line becomes a break");
  TestLogger::log_pass("Block scalars and chomping");
}

void testAnchorsTagsAndDirectives() {
  TestLogger::log_test("anchors, aliases, tags, directives");
  auto tokens = scan_all("%YAML 1.2\n%TAG !e! tag:example.com,2000:\n---\n- &a !e!thing x\n- *a\n...\n");
  TEST_ASSERT(tokens[1].kind == TokenKind::Directive, "YAML directive");
  TEST_ASSERT(tokens[1].version && *tokens[1].version == (VersionInfo{1, 2}), "version parsed");
  TEST_ASSERT(tokens[2].kind == TokenKind::Directive, "TAG directive");
  TEST_ASSERT(tokens[2].tag_directive.first == "!e!", "tag handle");
  TEST_ASSERT(tokens[2].tag_directive.second == "tag:example.com,2000:", "tag prefix");
  TEST_ASSERT(tokens[3].kind == TokenKind::DocumentStart, "document start");
  TEST_ASSERT(tokens[6].kind == TokenKind::Anchor && tokens[6].value == "a", "anchor");
  TEST_ASSERT(tokens[7].kind == TokenKind::Tag, "tag");
  TEST_ASSERT(tokens[7].tag_handle && *tokens[7].tag_handle == "!e!", "tag handle kept");
  TEST_ASSERT(tokens[7].tag_suffix == "thing", "tag suffix");
  TEST_ASSERT(tokens[10].kind == TokenKind::Alias && tokens[10].value == "a", "alias");
  TEST_ASSERT(tokens[12].kind == TokenKind::DocumentEnd, "document end");
  TestLogger::log_pass("Anchors, aliases, tags, directives");
}

void testScannerErrors() {
  TestLogger::log_test("scanner errors");
  TEST_ASSERT_THROWS(scan_all("a: \"unterminated\n"), ScannerError, "unterminated double quotes");
  TEST_ASSERT_THROWS(scan_all("a: \"\\q\"\n"), ScannerError, "unknown escape");
  TEST_ASSERT_THROWS(scan_all("a: |0\n  x\n"), ScannerError, "indentation indicator 0");
  TEST_ASSERT_THROWS(scan_all("a: 1\n\tb: 2\n"), ScannerError, "tab cannot start a token");
  TEST_ASSERT_THROWS(scan_all("a: b: c\n"), ScannerError, "mapping values are not allowed here");

  try {
    scan_all("key: \"\\q\"\n");
    throw std::runtime_error("no error for an unknown escape");
  } catch (const ScannerError &e) {
    TEST_ASSERT(e.problem().find("found unknown escape character") != std::string::npos, "problem text");
    TEST_ASSERT(e.problem_mark() && e.problem_mark()->line == 0, "problem line");
    TEST_ASSERT(e.context_mark() && e.context_mark()->column == 5, "context starts at the quote");
  }

  try {
    scan_all("a: 1\nb\nc: 2\n");
    throw std::runtime_error("no error for a key without ':'");
  } catch (const ScannerError &e) {
    TEST_ASSERT_STR(e.context(), "while scanning a simple key", "context text");
    TEST_ASSERT_STR(e.problem(), "could not find expected ':'", "problem text");
    TEST_ASSERT(e.context_mark() && e.context_mark()->line == 1 && e.context_mark()->column == 0, "key position");
    TEST_ASSERT(e.problem_mark() && e.problem_mark()->line == 2, "detected on the next line");
  }
  TestLogger::log_pass("Scanner errors");
}

void testRoundTripComments() {
  TestLogger::log_test("round-trip comment tokens");
  auto tokens = scan_all("# head\na: 1  # eol\nb: 2\n", true);
  for (const auto &t : tokens) {
    TEST_ASSERT(t.kind != TokenKind::Comment, "comments never surface as tokens");
  }
  bool found_eol = false, found_head = false;
  for (const auto &t : tokens) {
    if (t.kind == TokenKind::Scalar && t.value == "1") {
      CommentRef eol = comment_at(t.comment, 0);
      TEST_ASSERT(eol != nullptr, "eol comment on the value scalar");
      TEST_ASSERT(eol->value.starts_with("# eol"), "eol comment text");
      TEST_ASSERT(eol->column() == 6, "eol comment column");
      found_eol = true;
    }
    for (const auto &c : comment_slot(t.comment, 1)) {
      if (c->value.starts_with("# head"))
        found_head = true;
    }
  }
  TEST_ASSERT(found_eol, "eol comment found");
  TEST_ASSERT(found_head, "leading comment kept as pre comment");

  auto plain = scan_all("a: 1  # eol\n");
  for (const auto &t : plain) {
    TEST_ASSERT(!has_comment(t.comment), "the base scanner drops comments");
  }
  TestLogger::log_pass("Round-trip comment tokens");
}

void testVersionAwareScanning() {
  TestLogger::log_test("processing version");
  Reader reader(std::string_view("%YAML 1.1\n--- a\n"), "<test>");
  Scanner scanner(reader);
  TEST_ASSERT(scanner.processing_version() == (VersionInfo{1, 2}), "1.2 before any directive");
  while (scanner.get_token().kind != TokenKind::DocumentStart) {
  }
  TEST_ASSERT(scanner.processing_version() == (VersionInfo{1, 1}), "%YAML 1.1 in effect");

  Reader pinned_reader(std::string_view("a\n"), "<test>");
  Scanner pinned(pinned_reader, VersionInfo{1, 1});
  TEST_ASSERT(pinned.processing_version() == (VersionInfo{1, 1}), "pinned version");
  TestLogger::log_pass("Processing version");
}

void testReaderEncodings() {
  TestLogger::log_test("reader encodings");
  // UTF-16 LE with BOM: "a: 1\n"
  std::string utf16le("\xff\xfe" "a\0:\0 \0" "1\0\n\0", 12);
  auto tokens = scan_all(utf16le);
  TEST_ASSERT(tokens[3].value == "a" && tokens[5].value == "1", "utf-16-le decoded");

  std::string utf16be("\xfe\xff" "\0a\0:\0 \0" "1\0\n", 12);
  tokens = scan_all(utf16be);
  TEST_ASSERT(tokens[3].value == "a" && tokens[5].value == "1", "utf-16-be decoded");

  TEST_ASSERT_THROWS(Reader(std::string_view("a: \x01\n"), "<test>"), ReaderError, "control character rejected");
  TEST_ASSERT_THROWS(Reader(std::string_view("a: \xff\n"), "<test>"), ReaderError, "invalid utf-8 rejected");
  TestLogger::log_pass("Reader encodings");
}

} // namespace

int main() {
  TestLogger::log_header("Scanner Tests");
  TestRunner runner;
  runner.run("Block mapping", testBlockMapping);
  runner.run("Block sequence", testBlockSequenceAndIndentation);
  runner.run("Quoted scalars", testQuotedScalars);
  runner.run("Block scalars", testBlockScalars);
  runner.run("Anchors and tags", testAnchorsTagsAndDirectives);
  runner.run("Scanner errors", testScannerErrors);
  runner.run("Round-trip comments", testRoundTripComments);
  runner.run("Processing version", testVersionAwareScanning);
  runner.run("Reader encodings", testReaderEncodings);
  return runner.finish("scanner tests");
}
