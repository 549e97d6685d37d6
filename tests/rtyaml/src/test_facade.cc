#include "../test_output_utils.hh"
#include "rtyaml.hh"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace rtyaml;

namespace {

struct Point {
  std::int64_t x = 0;
  std::int64_t y = 0;
};

void testTryLoad() {
  TestLogger::log_test("try_load");
  YAML yaml;
  LoadResult good = yaml.try_load("a: 1\n");
  TEST_ASSERT(std::holds_alternative<Value>(good), "valid input gives a value");
  TEST_ASSERT(std::get<Value>(good)["a"].asInt64() == 1, "loaded value");

  LoadResult bad = yaml.try_load("a: [1, 2\n", "config.yaml");
  TEST_ASSERT(std::holds_alternative<MarkedError>(bad), "invalid input gives the error");
  const MarkedError &err = std::get<MarkedError>(bad);
  TEST_ASSERT(err.problem_mark().has_value(), "error carries a position");
  TEST_ASSERT_STR(err.problem_mark()->name, "config.yaml", "position names the input");

  LoadAllResult all = yaml.try_load_all("a: 1\n---\nb: 2\n");
  TEST_ASSERT(std::holds_alternative<std::vector<Value>>(all), "valid stream");
  TEST_ASSERT(std::get<std::vector<Value>>(all).size() == 2, "two documents");
  TestLogger::log_pass("try_load");
}

void testEmptyInput() {
  TestLogger::log_test("empty input");
  YAML yaml;
  TEST_ASSERT(yaml.load("").IsNull(), "empty document is null");
  TEST_ASSERT(yaml.load("# only a comment\n").IsNull(), "comment only document is null");
  TEST_ASSERT(yaml.load_all("").empty(), "no documents");
  TEST_ASSERT_THROWS(yaml.load("a: 1\n---\nb: 2\n"), ComposerError, "load wants a single document");
  TestLogger::log_pass("Empty input");
}

void testLoadFile() {
  TestLogger::log_test("load_file");
  YAML yaml;
  TEST_ASSERT_THROWS(yaml.load_file("does/not/exist.yaml"), StreamError, "missing file");
  const std::string path = "rtyaml_facade_test.yaml";
  {
    std::ofstream out(path, std::ios::binary);
    out << "name: file\n";
  }
  Value doc = yaml.load_file(path);
  std::remove(path.c_str());
  TEST_ASSERT_STR(doc["name"].asString(), "file", "file contents loaded");
  TestLogger::log_pass("load_file");
}

void testRegisterClass() {
  TestLogger::log_test("registered class");
  YAML yaml;
  yaml.register_class<Point>(
      "!point",
      [](BaseRepresenter &representer, const std::string &tag, const Point &p) {
        return representer.represent_pairs(Tag(tag), {{Value("x"), Value(p.x)}, {Value("y"), Value(p.y)}});
      },
      [](BaseConstructor &constructor, const NodePtr &node) {
        auto p = std::make_shared<Point>();
        for (const auto &[key, value] : constructor.construct_pairs(node, true)) {
          if (key.asString() == "x") {
            p->x = value.asInt64();
          } else if (key.asString() == "y") {
            p->y = value.asInt64();
          }
        }
        return p;
      });
  Value doc = Value::map();
  doc.asMap().set(Value("p"), Value::object(std::make_shared<Point>(Point{1, 2})));
  const std::string out = yaml.dump(doc);
  TEST_ASSERT_STR(out, "p: !point\n  x: 1\n  y: 2\n", "dumped under its tag");
  Value back = yaml.load(out);
  TEST_ASSERT(back["p"].IsObject(), "loaded back as an object");
  TEST_ASSERT(back["p"].asObject<Point>().x == 1 && back["p"].asObject<Point>().y == 2, "fields restored");
  TestLogger::log_pass("Registered class");
}

void testCustomConstructorAndResolver() {
  TestLogger::log_test("custom constructor and resolver");
  YAML yaml;
  yaml.add_constructor("!upper", [](BaseConstructor &constructor, const NodePtr &node) {
    std::string s = constructor.construct_scalar(node);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return Value(s);
  });
  TEST_ASSERT_STR(yaml.load("v: !upper abc\n")["v"].asString(), "ABC", "explicit tag");

  yaml.add_implicit_resolver("!semver", "^[0-9]+\\.[0-9]+\\.[0-9]+$",
                             {"0", "1", "2", "3", "4", "5", "6", "7", "8", "9"});
  yaml.add_constructor("!semver", [](BaseConstructor &constructor, const NodePtr &node) {
    return Value("v" + constructor.construct_scalar(node));
  });
  Value doc = yaml.load("release: 1.2.3\nratio: 1.5\n");
  TEST_ASSERT_STR(doc["release"].asString(), "v1.2.3", "implicit tag");
  TEST_ASSERT(doc["ratio"].IsFloat(), "floats unaffected");
  TestLogger::log_pass("Custom constructor and resolver");
}

void testLoadedDirectivesReused() {
  TestLogger::log_test("loaded directives reused");
  YAML yaml;
  Value doc = yaml.load("%TAG !e! tag:example.com,2000:\n---\nx: !e!foo bar\n");
  TEST_ASSERT(yaml.loaded_tags().count("!e!") == 1, "tag handle remembered");
  const std::string out = yaml.dump(doc);
  TEST_ASSERT(out.find("%TAG !e! tag:example.com,2000:\n---\n") == 0, "tag directive written again");
  TEST_ASSERT(out.find("x: !e!foo bar\n") != std::string::npos, "tag shorthand written again");

  YAML old;
  Value v = old.load("%YAML 1.1\n---\na: 1\n");
  TEST_ASSERT(old.loaded_version() && old.loaded_version()->minor == 1, "version remembered");
  TEST_ASSERT(old.dump(v).find("%YAML 1.1\n") == 0, "version directive written again");
  TestLogger::log_pass("Loaded directives reused");
}

void testRoundTripScenarios() {
  TestLogger::log_test("round trip scenarios");
  YAML yaml;
  const std::string literal = "desc: |\n  line1\n  line2\n";
  TEST_ASSERT_STR(yaml.dump(yaml.load(literal)), literal, "literal block kept");

  const std::string input = "# config\n"
                            "server:\n"
                            "  host: localhost  # name\n"
                            "  ports: [80, 443]\n"
                            "defaults: &d\n"
                            "  retries: 3\n"
                            "job:\n"
                            "  <<: *d\n"
                            "  name: 'quoted'\n";
  YAML quoted;
  quoted.preserve_quotes = true;
  const std::string once = quoted.dump(quoted.load(input));
  TEST_ASSERT_STR(once, input, "document kept byte for byte");
  TEST_ASSERT_STR(quoted.dump(quoted.load(once)), once, "second pass is stable");
  TestLogger::log_pass("Round trip scenarios");
}

void testAliasFidelity() {
  TestLogger::log_test("alias fidelity");
  YAML yaml;
  Value doc = yaml.load("base: &b\n  k: v\nuse: *b\n");
  TEST_ASSERT(doc["base"].identity() == doc["use"].identity(), "alias is the anchored value");
  doc["base"].asMap().set(Value("k"), Value("w"));
  TEST_ASSERT_STR(doc["use"]["k"].asString(), "w", "change seen through the alias");
  TEST_ASSERT_STR(yaml.dump(doc), "base: &b\n  k: w\nuse: *b\n", "alias written again");
  TestLogger::log_pass("Alias fidelity");
}

void testWarnings() {
  TestLogger::log_test("warning handler");
  YAML yaml;
  std::vector<MarkedWarning> warnings;
  yaml.warning_handler = [&warnings](const MarkedWarning &w) { warnings.push_back(w); };
  Value doc = yaml.load("a: 1\na: 2\n");
  TEST_ASSERT(warnings.size() == 1 && warnings[0].kind == WarningKind::DuplicateKey, "duplicate key reported");
  TEST_ASSERT(doc["a"].asInt64() == 2, "last value kept");
  yaml.duplicate_keys = DuplicateKeyPolicy::Error;
  TEST_ASSERT_THROWS(yaml.load("a: 1\na: 2\n"), DuplicateKeyError, "duplicate key as an error");
  TestLogger::log_pass("Warning handler");
}

} // namespace

int main() {
  TestLogger::log_header("YAML Facade Tests");
  TestRunner runner;
  runner.run("try_load", testTryLoad);
  runner.run("Empty input", testEmptyInput);
  runner.run("load_file", testLoadFile);
  runner.run("Registered class", testRegisterClass);
  runner.run("Custom constructor and resolver", testCustomConstructorAndResolver);
  runner.run("Loaded directives reused", testLoadedDirectivesReused);
  runner.run("Round trip scenarios", testRoundTripScenarios);
  runner.run("Alias fidelity", testAliasFidelity);
  runner.run("Warnings", testWarnings);
  return runner.finish("facade tests");
}
