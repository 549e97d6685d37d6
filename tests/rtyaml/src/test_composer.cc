#include "../test_output_utils.hh"
#include "rtyaml/composer.hh"
#include "rtyaml/reader.hh"

#include <sstream>
#include <string>
#include <vector>

using namespace rtyaml;

namespace {

// Owns the whole load pipeline up to the composer
struct ComposeFixture {
  Reader reader;
  RoundTripScanner scanner;
  RoundTripParser parser;
  Resolver resolver;
  std::vector<MarkedWarning> warnings;
  Composer composer;

  explicit ComposeFixture(std::string_view input)
      : reader(input, "<test>"), scanner(reader), parser(scanner),
        composer(parser, resolver, [this](const MarkedWarning &w) { warnings.push_back(w); }) {
    resolver.set_version_source([this] { return scanner.processing_version(); });
  }
};

void testAliasesShareNodes() {
  TestLogger::log_test("aliases share nodes");
  ComposeFixture f("base: &b {x: 1}\ncopy: *b\nlist: &l [*b]\n");
  NodePtr root = f.composer.get_single_node();
  TEST_ASSERT(root->pairs.size() == 3, "three pairs");
  NodePtr base = root->pairs[0].second;
  TEST_ASSERT(base->anchor && *base->anchor == "b", "anchor kept on the node");
  TEST_ASSERT(root->pairs[1].second == base, "alias yields the very same node");
  TEST_ASSERT(root->pairs[2].second->items[0] == base, "alias inside a flow sequence");
  TestLogger::log_pass("Aliases share nodes");
}

void testRecursiveStructure() {
  TestLogger::log_test("recursive structure");
  ComposeFixture f("&a [1, *a]\n");
  NodePtr root = f.composer.get_single_node();
  TEST_ASSERT(root->is_sequence() && root->items.size() == 2, "sequence of two");
  TEST_ASSERT(root->items[1] == root, "the alias refers back to the node being composed");
  TestLogger::log_pass("Recursive structure");
}

void testUndefinedAlias() {
  TestLogger::log_test("undefined alias");
  ComposeFixture f("a: *missing\n");
  try {
    f.composer.get_single_node();
    throw std::runtime_error("no error for an undefined alias");
  } catch (const ComposerError &e) {
    TEST_ASSERT(e.problem() == "found undefined alias 'missing'", "problem text");
    TEST_ASSERT(e.problem_mark() && e.problem_mark()->column == 3, "mark at the alias");
  }

  // anchors do not carry over into the next document
  ComposeFixture g("a: &x 1\n---\nb: *x\n");
  g.composer.get_node();
  TEST_ASSERT_THROWS(g.composer.get_node(), ComposerError, "anchor table cleared per document");
  TestLogger::log_pass("Undefined alias");
}

void testDuplicateAnchor() {
  TestLogger::log_test("duplicate anchor");
  ComposeFixture f("a: &x 1\nb: &x 2\nc: *x\n");
  NodePtr root = f.composer.get_single_node();
  TEST_ASSERT(f.warnings.size() == 1, "one warning");
  TEST_ASSERT(f.warnings[0].kind == WarningKind::ReusedAnchor, "reused anchor warning");
  TEST_ASSERT(f.warnings[0].str().find("found duplicate anchor 'x'") != std::string::npos, "warning text");
  TEST_ASSERT(root->pairs[2].second == root->pairs[1].second, "the later definition wins");
  TestLogger::log_pass("Duplicate anchor");
}

void testSingleDocument() {
  TestLogger::log_test("single document");
  ComposeFixture empty("");
  TEST_ASSERT(empty.composer.get_single_node() == nullptr, "empty stream gives no node");

  ComposeFixture two("a\n--- b\n");
  TEST_ASSERT_THROWS(two.composer.get_single_node(), ComposerError, "second document rejected");

  ComposeFixture many("a\n--- b\n--- c\n");
  int count = 0;
  while (many.composer.check_node()) {
    NodePtr node = many.composer.get_node();
    TEST_ASSERT(node && node->is_scalar(), "scalar document");
    ++count;
  }
  TEST_ASSERT(count == 3, "three documents");
  TEST_ASSERT(many.composer.get_node() == nullptr, "null past the last document");
  TestLogger::log_pass("Single document");
}

void testNodeDetails() {
  TestLogger::log_test("node details");
  ComposeFixture f("# lead\nkey: 'v'  # eol\nseq: [a, b]\nblock:\n- 1\n");
  NodePtr root = f.composer.get_single_node();
  TEST_ASSERT(root->tag == yaml_tag("map"), "mapping tag");
  TEST_ASSERT(root->flow_style == false, "block mapping");
  NodePtr value = root->pairs[0].second;
  TEST_ASSERT(value->style == ScalarStyle::SingleQuoted, "quoted style kept");
  TEST_ASSERT(value->tag == yaml_tag("str"), "quoted scalar is a string");
  TEST_ASSERT(comment_at(value->comment, 0) != nullptr, "eol comment on the value node");
  TEST_ASSERT(root->pairs[1].second->flow_style == true, "flow sequence");
  TEST_ASSERT(root->pairs[2].second->items[0]->tag == yaml_tag("int"), "resolved int");
  TEST_ASSERT(root->pairs[0].first->start_mark.line == 1, "key line");

  std::ostringstream os;
  dump_node(os, root);
  TEST_ASSERT(os.str().find("key") != std::string::npos, "tree dump shows the key");
  TestLogger::log_pass("Node details");
}

} // namespace

int main() {
  TestLogger::log_header("Composer Tests");
  TestRunner runner;
  runner.run("Aliases share nodes", testAliasesShareNodes);
  runner.run("Recursive structure", testRecursiveStructure);
  runner.run("Undefined alias", testUndefinedAlias);
  runner.run("Duplicate anchor", testDuplicateAnchor);
  runner.run("Single document", testSingleDocument);
  runner.run("Node details", testNodeDetails);
  return runner.finish("composer tests");
}
