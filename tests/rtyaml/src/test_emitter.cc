#include "../test_output_utils.hh"
#include "rtyaml.hh"
#include "rtyaml/emitter.hh"
#include "rtyaml/serializer.hh"

#include <sstream>
#include <string>
#include <vector>

using namespace rtyaml;

namespace {

Value sample() {
  Value m = Value::map();
  m.asMap().set(Value("a"), Value(1));
  return m;
}

std::string emit_all(std::vector<Event> events, Emitter::Options options = {}) {
  std::ostringstream out;
  Emitter emitter(out, std::move(options));
  for (auto &ev : events) {
    emitter.emit(std::move(ev));
  }
  return out.str();
}

Event plain(std::string text) {
  return Event::scalar(std::nullopt, std::nullopt, ScalarImplicit{true, false}, std::move(text), Mark(), Mark());
}

void testSerializerLifecycle() {
  TestLogger::log_test("serializer open and close");
  std::ostringstream out;
  Emitter emitter(out);
  Resolver resolver;
  Serializer serializer(emitter, resolver);
  NodePtr node = Node::scalar(Tag(yaml_tag("str")), "x");
  TEST_ASSERT_THROWS(serializer.serialize(node), SerializerError, "serialize before open");
  TEST_ASSERT_THROWS(serializer.close(), SerializerError, "close before open");
  serializer.open();
  TEST_ASSERT_THROWS(serializer.open(), SerializerError, "open twice");
  serializer.serialize(node);
  serializer.close();
  serializer.close();
  TEST_ASSERT_THROWS(serializer.serialize(node), SerializerError, "serialize after close");
  TEST_ASSERT_THROWS(serializer.open(), SerializerError, "open after close");
  TEST_ASSERT_STR(out.str(), "x\n...\n", "document written once");
  TestLogger::log_pass("Serializer lifecycle");
}

void testEventsToText() {
  TestLogger::log_test("events to text");
  std::vector<Event> events;
  events.push_back(Event::stream_start(Mark(), Mark()));
  events.push_back(Event::document_start(Mark(), Mark(), false));
  events.push_back(
      Event::collection_start(EventKind::SequenceStart, std::nullopt, std::nullopt, true, Mark(), Mark(), true));
  events.push_back(plain("a"));
  events.push_back(plain("b"));
  events.push_back(Event(EventKind::SequenceEnd));
  events.push_back(Event::document_end(Mark(), Mark(), false));
  events.push_back(Event(EventKind::StreamEnd));
  TEST_ASSERT_STR(emit_all(std::move(events)), "[a, b]\n", "flow sequence");

  std::vector<Event> bad;
  bad.push_back(Event::document_start(Mark(), Mark(), false));
  bad.push_back(plain("x"));
  TEST_ASSERT_THROWS(emit_all(std::move(bad)), EmitterError, "stream start required first");

  std::vector<Event> bad_anchor;
  bad_anchor.push_back(Event::stream_start(Mark(), Mark()));
  bad_anchor.push_back(Event::document_start(Mark(), Mark(), false));
  bad_anchor.push_back(Event::scalar(std::string("not ok"), std::nullopt, ScalarImplicit{true, false}, "x", Mark(),
                                     Mark()));
  TEST_ASSERT_THROWS(emit_all(std::move(bad_anchor)), EmitterError, "space in an anchor");
  TestLogger::log_pass("Events to text");
}

void testDocumentMarkers() {
  TestLogger::log_test("document markers and directives");
  YAML yaml;
  yaml.explicit_start = true;
  TEST_ASSERT_STR(yaml.dump(sample()), "---\na: 1\n", "explicit start");
  yaml.explicit_start = false;
  yaml.explicit_end = true;
  TEST_ASSERT_STR(yaml.dump(sample()), "a: 1\n...\n", "explicit end");

  YAML versioned;
  versioned.version = VersionInfo{1, 1};
  TEST_ASSERT_STR(versioned.dump(sample()), "%YAML 1.1\n---\na: 1\n", "version directive");

  YAML tagged;
  tagged.tags = {{"!e!", "tag:example.com,2000:"}};
  std::string out = tagged.dump(sample());
  TEST_ASSERT(out.find("%TAG !e! tag:example.com,2000:\n---\n") == 0, "tag directive");

  YAML bad_version;
  bad_version.version = VersionInfo{2, 0};
  TEST_ASSERT_THROWS(bad_version.dump(sample()), EmitterError, "unsupported version");

  YAML multi;
  TEST_ASSERT_STR(multi.dump_all({sample(), sample()}), "a: 1\n---\na: 1\n", "second document marked");
  TestLogger::log_pass("Document markers");
}

void testIndentation() {
  TestLogger::log_test("indentation");
  YAML yaml;
  Value doc = yaml.load("a:\n  b: 1\nl:\n- 1\n- 2\n");
  yaml.indent(4, 4, 2);
  TEST_ASSERT_STR(yaml.dump(doc), "a:\n    b: 1\nl:\n  - 1\n  - 2\n", "mapping 4, sequence 4, offset 2");
  yaml.indent(2, 2, 0);
  TEST_ASSERT_STR(yaml.dump(doc), "a:\n  b: 1\nl:\n- 1\n- 2\n", "default layout");
  TestLogger::log_pass("Indentation");
}

void testWidth() {
  TestLogger::log_test("line width");
  YAML yaml;
  yaml.width = 20;
  const std::string text = "alpha beta gamma delta epsilon zeta eta theta";
  Value m = Value::map();
  m.asMap().set(Value("t"), Value(text));
  std::string out = yaml.dump(m);
  TEST_ASSERT(out.find('\n') + 1 < out.size(), "long plain scalar folded");
  TEST_ASSERT_STR(yaml.load(out)["t"].asString(), text, "folded text reads back the same");
  TestLogger::log_pass("Line width");
}

void testStyles() {
  TestLogger::log_test("output styles");
  YAML safe(YAML::Kind::Safe);
  Value doc = safe.load("b: [1, 2]\na: 1\n");
  safe.default_flow_style = true;
  TEST_ASSERT_STR(safe.dump(doc), "{a: 1, b: [1, 2]}\n", "flow style");

  YAML canonical(YAML::Kind::Safe);
  canonical.canonical = true;
  std::string out = canonical.dump(sample());
  TEST_ASSERT(out.find("!!map {") != std::string::npos, "canonical mapping");
  TEST_ASSERT(out.find("? !!str \"a\"") != std::string::npos, "canonical key");
  TEST_ASSERT(canonical.load(out)["a"].asInt64() == 1, "canonical output reads back");

  YAML yaml;
  Value m = Value::map();
  m.asMap().set(Value("desc"), Value::string("line1\nline2\n", ScalarStyle::Literal));
  TEST_ASSERT_STR(yaml.dump(m), "desc: |\n  line1\n  line2\n", "literal block");
  Value q = Value::map();
  q.asMap().set(Value("s"), Value::string("it's", ScalarStyle::SingleQuoted));
  TEST_ASSERT_STR(yaml.dump(q), "s: 'it''s'\n", "single quote doubled");
  Value t = Value::map();
  t.asMap().set(Value("n"), Value("123"));
  t.asMap().set(Value("e"), Value(""));
  TEST_ASSERT_STR(yaml.dump(t), "n: '123'\ne: ''\n", "strings that would resolve differently are quoted");
  TestLogger::log_pass("Output styles");
}

void testEncodings() {
  TestLogger::log_test("output encodings");
  YAML yaml;
  yaml.encoding = "utf-16-le";
  std::string out = yaml.dump(sample());
  const std::string expected("\xff\xfe"
                             "a\0:\0 \0"
                             "1\0\n\0",
                             12);
  TEST_ASSERT(out == expected, "utf-16 with a byte order mark");
  YAML reader;
  TEST_ASSERT(reader.load(out)["a"].asInt64() == 1, "utf-16 output reads back");

  YAML bad;
  bad.encoding = "latin-1";
  TEST_ASSERT_THROWS(bad.dump(sample()), EmitterError, "unsupported encoding");
  TestLogger::log_pass("Output encodings");
}

} // namespace

int main() {
  TestLogger::log_header("Emitter Tests");
  TestRunner runner;
  runner.run("Serializer lifecycle", testSerializerLifecycle);
  runner.run("Events to text", testEventsToText);
  runner.run("Document markers", testDocumentMarkers);
  runner.run("Indentation", testIndentation);
  runner.run("Line width", testWidth);
  runner.run("Output styles", testStyles);
  runner.run("Output encodings", testEncodings);
  return runner.finish("emitter tests");
}
