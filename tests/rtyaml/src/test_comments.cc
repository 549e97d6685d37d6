#include "../test_output_utils.hh"
#include "rtyaml.hh"

#include <string>

using namespace rtyaml;

namespace {

void testEolCommentSurvivesValueChange() {
  TestLogger::log_test("eol comment stays after a value change");
  YAML yaml;
  Value doc = yaml.load("key: value  # comment\n");
  doc.asMap().set(Value("key"), Value("value2"));
  TEST_ASSERT_STR(yaml.dump(doc), "key: value2  # comment\n", "comment keeps its distance");

  Value aligned = yaml.load("a: 1      # one\nb: 22     # two\n");
  aligned.asMap().set(Value("a"), Value("a much longer value"));
  aligned.asMap().set(Value("b"), Value(2));
  TEST_ASSERT_STR(yaml.dump(aligned), "a: a much longer value      # one\nb: 2      # two\n",
                  "grown value moves the comment, shorter one keeps the column");
  TestLogger::log_pass("Eol comment survives a value change");
}

void testCommentsAreFound() {
  TestLogger::log_test("attached comments");
  YAML yaml;
  Value doc = yaml.load("# head\na: 1  # one\n# before b\nb:\n- x  # item\n");
  CommentedMap &m = doc.asMap();
  TEST_ASSERT(m.ca().contains("# one"), "eol comment on a value");
  TEST_ASSERT(m.ca().contains("before b"), "full line comment before a key");
  TEST_ASSERT(doc["b"].asSequence().ca().contains("# item"), "eol comment on a sequence item");
  TEST_ASSERT(!m.ca().contains("missing"), "absent text");
  TestLogger::log_pass("Attached comments are found");
}

void testRoundTripKeepsComments() {
  TestLogger::log_test("comments round trip unchanged");
  const std::string input = "# top\n"
                            "a: 1    # aligned\n"
                            "\n"
                            "# section\n"
                            "list:\n"
                            "- x     # first\n"
                            "- y\n";
  YAML yaml;
  Value doc = yaml.load(input);
  TEST_ASSERT_STR(yaml.dump(doc), input, "byte exact output");
  TestLogger::log_pass("Comments round trip");
}

void testAddEolComment() {
  TestLogger::log_test("adding eol comments");
  YAML yaml;
  Value doc = yaml.load("a: 1\nb: 2\n");
  doc.asMap().yaml_add_eol_comment("note", Value("a"), 10);
  TEST_ASSERT_STR(yaml.dump(doc), "a: 1      # note\nb: 2\n", "comment at column 10");

  Value seq = yaml.load("- 1\n- 2\n");
  seq.asSequence().yaml_add_eol_comment("# second", 1, 6);
  TEST_ASSERT_STR(yaml.dump(seq), "- 1\n- 2   # second\n", "comment on a sequence item");
  TestLogger::log_pass("Adding eol comments");
}

void testStartAndBeforeComments() {
  TestLogger::log_test("start comment and comment before a key");
  YAML yaml;
  Value doc = yaml.load("a: 1\nb: 2\n");
  doc.asMap().yaml_set_start_comment("Top\nLines");
  TEST_ASSERT_STR(yaml.dump(doc), "# Top\n# Lines\na: 1\nb: 2\n", "start comment lines prefixed");

  Value other = yaml.load("a: 1\nb: 2\n");
  other.asMap().yaml_set_comment_before_after_key(Value("b"), std::string("before b"));
  TEST_ASSERT_STR(yaml.dump(other), "a: 1\n# before b\nb: 2\n", "comment line before key");
  TestLogger::log_pass("Start and before comments");
}

void testInsertMovesComments() {
  TestLogger::log_test("comments follow items on insert");
  YAML yaml;
  Value doc = yaml.load("- a  # first\n- b\n");
  doc.asSequence().insert(0, Value("z"));
  TEST_ASSERT_STR(yaml.dump(doc), "- z\n- a  # first\n- b\n", "comment moved with its item");

  Value map = yaml.load("a: 1\nc: 3\n");
  map.asMap().insert(1, Value("b"), Value(2), "added");
  TEST_ASSERT(map.asMap().ca().contains("# added"), "insert with comment");
  std::string out = yaml.dump(map);
  TEST_ASSERT(out.find("b: 2") != std::string::npos && out.find("# added") != std::string::npos,
              "inserted key and comment dumped");
  TEST_ASSERT(out.find("a: 1\nb: 2") == 0, "inserted at position 1");
  TestLogger::log_pass("Insert moves comments");
}

void testSafeDropsComments() {
  TestLogger::log_test("safe loading drops comments");
  YAML yaml(YAML::Kind::Safe);
  Value doc = yaml.load("a: 1  # gone\n");
  TEST_ASSERT(yaml.dump(doc).find('#') == std::string::npos, "no comment in safe output");
  TestLogger::log_pass("Safe mode drops comments");
}

} // namespace

int main() {
  TestLogger::log_header("Comment Tests");
  TestRunner runner;
  runner.run("Eol comment after value change", testEolCommentSurvivesValueChange);
  runner.run("Comments are found", testCommentsAreFound);
  runner.run("Comments round trip", testRoundTripKeepsComments);
  runner.run("Add eol comment", testAddEolComment);
  runner.run("Start and before comments", testStartAndBeforeComments);
  runner.run("Insert moves comments", testInsertMovesComments);
  runner.run("Safe drops comments", testSafeDropsComments);
  return runner.finish("comment tests");
}
