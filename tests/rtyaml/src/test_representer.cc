#include "../test_output_utils.hh"
#include "rtyaml.hh"

#include <memory>
#include <string>

using namespace rtyaml;

namespace {

struct Opaque {
  int id = 0;
};

void testNulls() {
  TestLogger::log_test("null text");
  YAML yaml;
  TEST_ASSERT_STR(yaml.dump(Value()), "null\n...\n", "a null document is spelled out");
  Value m = Value::map();
  m.asMap().set(Value("a"), Value());
  TEST_ASSERT_STR(yaml.dump(m), "a:\n", "nested null is empty");

  YAML safe(YAML::Kind::Safe);
  TEST_ASSERT_STR(safe.dump(m), "a: null\n", "safe mode spells nested nulls");
  TestLogger::log_pass("Null text");
}

void testBooleans() {
  TestLogger::log_test("boolean representation");
  YAML yaml;
  Value m = Value::map();
  m.asMap().set(Value("yes_flag"), Value(true));
  m.asMap().set(Value("no_flag"), Value(false));
  TEST_ASSERT_STR(yaml.dump(m), "yes_flag: true\nno_flag: false\n", "default spelling");
  yaml.boolean_representation = {"False", "True"};
  TEST_ASSERT_STR(yaml.dump(m), "yes_flag: True\nno_flag: False\n", "custom spelling");
  TestLogger::log_pass("Boolean representation");
}

void testNumberShapes() {
  TestLogger::log_test("number shapes");
  YAML yaml;
  const std::string input = "hex: 0x1F\nlow: 0xff\noct: 0o17\nbin: 0b101\ngrp: 1_000\n"
                            "price: 1.50\nsci: 1.5e+10\n";
  Value doc = yaml.load(input);
  TEST_ASSERT_STR(yaml.dump(doc), input, "shapes survive a round trip");

  Value fresh = Value::map();
  fresh.asMap().set(Value("i"), Value(42));
  fresh.asMap().set(Value("f"), Value(0.1));
  fresh.asMap().set(Value("w"), Value(3.0));
  TEST_ASSERT_STR(yaml.dump(fresh), "i: 42\nf: 0.1\nw: 3.0\n", "host numbers use the shortest text");

  YAML old;
  old.version = VersionInfo{1, 1};
  Value octal = old.load("o: 017\n");
  std::string out = old.dump(octal);
  TEST_ASSERT(out.find("o: 017\n") != std::string::npos, "1.1 octal keeps its leading zero");
  TestLogger::log_pass("Number shapes");
}

void testCollectionsWithTags() {
  TestLogger::log_test("sets, ordered maps and tagged values");
  YAML yaml;
  const std::string set_doc = "!!set\n? a\n? b\n";
  TEST_ASSERT_STR(yaml.dump(yaml.load(set_doc)), set_doc, "set round trip");
  const std::string omap_doc = "!!omap\n- z: 1\n- a: 2\n";
  TEST_ASSERT_STR(yaml.dump(yaml.load(omap_doc)), omap_doc, "ordered map round trip");
  const std::string tagged = "x: !custom value\ny: !point {a: 1}\n";
  TEST_ASSERT_STR(yaml.dump(yaml.load(tagged)), tagged, "local tags round trip");
  TestLogger::log_pass("Tagged collections");
}

void testSharedValuesBecomeAliases() {
  TestLogger::log_test("shared values become aliases");
  YAML yaml;
  Value shared = Value::map();
  shared.asMap().set(Value("a"), Value(1));
  Value list = Value::seq();
  list.asSequence().push_back(shared);
  list.asSequence().push_back(shared);
  TEST_ASSERT_STR(yaml.dump(list), "- &id001\n  a: 1\n- *id001\n", "generated anchor");

  const std::string named = "base: &b\n  x: 1\nother: *b\n";
  TEST_ASSERT_STR(yaml.dump(yaml.load(named)), named, "loaded anchor names kept");
  TestLogger::log_pass("Shared values become aliases");
}

void testKeyOrder() {
  TestLogger::log_test("key order");
  Value m = Value::map();
  m.asMap().set(Value("b"), Value(1));
  m.asMap().set(Value("a"), Value(2));
  YAML rt;
  TEST_ASSERT_STR(rt.dump(m), "b: 1\na: 2\n", "round trip keeps insertion order");
  YAML safe(YAML::Kind::Safe);
  TEST_ASSERT_STR(safe.dump(m), "a: 2\nb: 1\n", "safe mode sorts string keys");
  safe.sort_base_mapping_type_on_output = false;
  TEST_ASSERT_STR(safe.dump(m), "b: 1\na: 2\n", "sorting can be turned off");

  Value mixed = Value::map();
  mixed.asMap().set(Value("b"), Value(1));
  mixed.asMap().set(Value(1), Value(2));
  YAML safe_mixed(YAML::Kind::Safe);
  TEST_ASSERT_STR(safe_mixed.dump(mixed), "b: 1\n1: 2\n", "mixed keys keep their order");
  TestLogger::log_pass("Key order");
}

void testUnsupportedValue() {
  TestLogger::log_test("unsupported values");
  YAML yaml;
  Value obj = Value::object(std::make_shared<Opaque>());
  TEST_ASSERT_THROWS(yaml.dump(obj), RepresenterError, "unregistered host object");
  YAML safe(YAML::Kind::Safe);
  TEST_ASSERT_THROWS(safe.dump(obj), RepresenterError, "unregistered host object in safe mode");
  TestLogger::log_pass("Unsupported values");
}

void testBinary() {
  TestLogger::log_test("binary values");
  YAML yaml;
  Value doc = yaml.load("data: !!binary aGVsbG8=\n");
  std::string out = yaml.dump(doc);
  TEST_ASSERT(out.find("!!binary") != std::string::npos, "binary tag written");
  TEST_ASSERT(out.find("aGVsbG8=") != std::string::npos, "base64 text written");
  Value again = yaml.load(out);
  TEST_ASSERT(again["data"].asBinary().bytes == "hello", "bytes survive");
  TestLogger::log_pass("Binary values");
}

} // namespace

int main() {
  TestLogger::log_header("Representer Tests");
  TestRunner runner;
  runner.run("Nulls", testNulls);
  runner.run("Booleans", testBooleans);
  runner.run("Number shapes", testNumberShapes);
  runner.run("Tagged collections", testCollectionsWithTags);
  runner.run("Aliases", testSharedValuesBecomeAliases);
  runner.run("Key order", testKeyOrder);
  runner.run("Unsupported values", testUnsupportedValue);
  runner.run("Binary", testBinary);
  return runner.finish("representer tests");
}
