#include "../test_output_utils.hh"
#include "rtyaml/parser.hh"
#include "rtyaml/reader.hh"

#include <string>
#include <vector>

using namespace rtyaml;

namespace {

// Test suite notation of every event, one per line
std::string parse_events(std::string_view input, std::vector<MarkedWarning> *warnings = nullptr) {
  Reader reader(input, "<test>");
  RoundTripScanner scanner(reader);
  WarningHandler handler = [warnings](const MarkedWarning &w) {
    if (warnings)
      warnings->push_back(w);
  };
  RoundTripParser parser(scanner, handler);
  std::string out;
  while (parser.check_event()) {
    out += parser.get_event().compact_repr();
    out += "\n";
  }
  return out;
}

void testBlockAndFlowEvents() {
  TestLogger::log_test("block and flow collection events");
  TEST_ASSERT_STR(parse_events("a: [1, {b: c}]\nd:\n"),
                  "+STR\n+DOC\n+MAP\n=VAL :a\n+SEQ []\n=VAL :1\n+MAP {}\n=VAL :b\n=VAL :c\n-MAP\n-SEQ\n=VAL :d\n"
                  "=VAL :\n-MAP\n-DOC\n-STR\n",
                  "events of a mixed document");
  TEST_ASSERT_STR(parse_events("- a\n- - b\n"), "+STR\n+DOC\n+SEQ\n=VAL :a\n+SEQ\n=VAL :b\n-SEQ\n-SEQ\n-DOC\n-STR\n",
                  "nested block sequences");
  TEST_ASSERT_STR(parse_events("key:\n- x\n"), "+STR\n+DOC\n+MAP\n=VAL :key\n+SEQ\n=VAL :x\n-SEQ\n-MAP\n-DOC\n-STR\n",
                  "indentless sequence as mapping value");
  TestLogger::log_pass("Block and flow collection events");
}

void testScalarStylesAndProperties() {
  TestLogger::log_test("scalar styles, anchors and tags");
  TEST_ASSERT_STR(parse_events("--- &x !!str text\n...\n"),
                  "+STR\n+DOC ---\n=VAL &x <tag:yaml.org,2002:str> :text\n-DOC ...\n-STR\n", "explicit document");
  TEST_ASSERT_STR(parse_events("- 'q'\n- \"d\"\n- |\n  l\n- *a\n"),
                  "+STR\n+DOC\n+SEQ\n=VAL 'q\n=VAL \"d\n=VAL |l\\n\n=ALI *a\n-SEQ\n-DOC\n-STR\n",
                  "quoted, literal and alias");
  TEST_ASSERT_STR(parse_events("%TAG !e! tag:example.com,2000:\n--- !e!point {x: 1}\n"),
                  "+STR\n+DOC ---\n+MAP {} <tag:example.com,2000:point>\n=VAL :x\n=VAL :1\n-MAP\n-DOC\n-STR\n",
                  "tag expanded through a %TAG handle");
  TEST_ASSERT_STR(parse_events("!local x\n"), "+STR\n+DOC\n=VAL <!local> :x\n-DOC\n-STR\n", "local tag");
  TestLogger::log_pass("Scalar styles, anchors and tags");
}

void testMultipleDocuments() {
  TestLogger::log_test("multiple documents");
  TEST_ASSERT_STR(parse_events("a\n---\nb\n...\n--- c\n"),
                  "+STR\n+DOC\n=VAL :a\n-DOC\n+DOC ---\n=VAL :b\n-DOC ...\n+DOC ---\n=VAL :c\n-DOC\n-STR\n",
                  "three documents");
  TEST_ASSERT_STR(parse_events(""), "+STR\n-STR\n", "empty stream has no document");
  TestLogger::log_pass("Multiple documents");
}

void testDirectives() {
  TestLogger::log_test("directives");
  Reader reader(std::string_view("%YAML 1.1\n%TAG !e! tag:example.com,2000:\n--- a\n"), "<test>");
  RoundTripScanner scanner(reader);
  RoundTripParser parser(scanner);
  parser.get_event();
  Event doc = parser.get_event();
  TEST_ASSERT(doc.kind == EventKind::DocumentStart && doc.explicit_, "explicit document start");
  TEST_ASSERT(doc.version && *doc.version == (VersionInfo{1, 1}), "version on the event");
  TEST_ASSERT(doc.tags.count("!e!") == 1, "%TAG handle on the event");
  TEST_ASSERT(parser.loaded_version() && *parser.loaded_version() == (VersionInfo{1, 1}), "loaded version");
  TEST_ASSERT(parser.loaded_tags().at("!e!") == "tag:example.com,2000:", "loaded tags");

  TEST_ASSERT_THROWS(parse_events("%YAML 2.0\n--- a\n"), ParserError, "major version 2 rejected");
  TEST_ASSERT_THROWS(parse_events("%YAML 1.2\n%YAML 1.2\n--- a\n"), ParserError, "duplicate %YAML");
  TEST_ASSERT_THROWS(parse_events("%TAG !e! a:\n%TAG !e! b:\n--- x\n"), ParserError, "duplicate %TAG handle");
  TEST_ASSERT_THROWS(parse_events("!x!y a\n"), ParserError, "undefined tag handle");

  std::vector<MarkedWarning> warnings;
  parse_events("%YAML 1.3\n--- a\n", &warnings);
  TEST_ASSERT(warnings.size() == 1 && warnings[0].kind == WarningKind::Version, "minor version above 2 warns");
  TestLogger::log_pass("Directives");
}

void testParserErrors() {
  TestLogger::log_test("parser errors");
  TEST_ASSERT_THROWS(parse_events("[1, 2\n"), ParserError, "unterminated flow sequence");
  TEST_ASSERT_THROWS(parse_events("{a: 1\n"), ParserError, "unterminated flow mapping");
  TEST_ASSERT_THROWS(parse_events("a: 1\n- b\n"), ParserError, "sequence entry inside a mapping");
  try {
    parse_events("[1, 2\n");
  } catch (const ParserError &e) {
    TEST_ASSERT(e.context() == "while parsing a flow sequence", "context");
    TEST_ASSERT(e.problem().find("expected ',' or ']'") != std::string::npos, "problem");
    TEST_ASSERT(e.context_mark() && e.context_mark()->column == 0, "context mark at '['");
  }
  TestLogger::log_pass("Parser errors");
}

void testCommentsOnEvents() {
  TestLogger::log_test("comments on events");
  Reader reader(std::string_view("# top\na: 1  # one\n"), "<test>");
  RoundTripScanner scanner(reader);
  RoundTripParser parser(scanner);
  bool eol_found = false, pre_found = false;
  while (parser.check_event()) {
    Event ev = parser.get_event();
    for (const auto &group : ev.comment) {
      for (const auto &c : group) {
        if (c->value.starts_with("# top"))
          pre_found = true;
      }
    }
    if (ev.kind == EventKind::Scalar && ev.value == "1") {
      CommentRef c = comment_at(ev.comment, 0);
      TEST_ASSERT(c && c->value.starts_with("# one"), "eol comment travels with the value");
      eol_found = true;
    }
  }
  TEST_ASSERT(eol_found, "value event seen");
  TEST_ASSERT(pre_found, "leading comment on an event");
  TestLogger::log_pass("Comments on events");
}

void testPeekAndCheck() {
  TestLogger::log_test("peek and check");
  Reader reader(std::string_view("a"), "<test>");
  Scanner scanner(reader);
  Parser parser(scanner);
  TEST_ASSERT(parser.check_event({EventKind::StreamStart}), "stream start first");
  TEST_ASSERT(parser.peek_event()->kind == EventKind::StreamStart, "peek does not consume");
  parser.get_event();
  TEST_ASSERT(!parser.check_event({EventKind::Scalar}), "document start before the scalar");
  while (parser.check_event()) {
    parser.get_event();
  }
  TEST_ASSERT(parser.peek_event() == nullptr, "nothing after the stream end");
  TEST_ASSERT_THROWS(parser.get_event(), ParserError, "get_event after the stream end");
  TestLogger::log_pass("Peek and check");
}

} // namespace

int main() {
  TestLogger::log_header("Parser Tests");
  TestRunner runner;
  runner.run("Collection events", testBlockAndFlowEvents);
  runner.run("Scalar properties", testScalarStylesAndProperties);
  runner.run("Multiple documents", testMultipleDocuments);
  runner.run("Directives", testDirectives);
  runner.run("Parser errors", testParserErrors);
  runner.run("Comments on events", testCommentsOnEvents);
  runner.run("Peek and check", testPeekAndCheck);
  return runner.finish("parser tests");
}
