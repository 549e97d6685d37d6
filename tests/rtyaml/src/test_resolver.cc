#include "../test_output_utils.hh"
#include "rtyaml/composer.hh"
#include "rtyaml/reader.hh"
#include "rtyaml/resolver.hh"

#include <string>

using namespace rtyaml;

namespace {

std::string resolve_plain(const Resolver &resolver, const std::string &text) {
  return resolver.resolve(NodeKind::Scalar, text, true).value();
}

void testYaml12Table() {
  TestLogger::log_test("YAML 1.2 implicit tags");
  Resolver resolver;
  TEST_ASSERT_STR(resolve_plain(resolver, "true"), yaml_tag("bool"), "true");
  TEST_ASSERT_STR(resolve_plain(resolver, "False"), yaml_tag("bool"), "False");
  TEST_ASSERT_STR(resolve_plain(resolver, "yes"), yaml_tag("str"), "yes is a string in 1.2");
  TEST_ASSERT_STR(resolve_plain(resolver, "0x1F"), yaml_tag("int"), "hex");
  TEST_ASSERT_STR(resolve_plain(resolver, "0o17"), yaml_tag("int"), "octal");
  TEST_ASSERT_STR(resolve_plain(resolver, "1_000"), yaml_tag("int"), "underscores");
  TEST_ASSERT_STR(resolve_plain(resolver, "-42"), yaml_tag("int"), "negative");
  TEST_ASSERT_STR(resolve_plain(resolver, "1.5"), yaml_tag("float"), "float");
  TEST_ASSERT_STR(resolve_plain(resolver, "1.5e+10"), yaml_tag("float"), "exponent");
  TEST_ASSERT_STR(resolve_plain(resolver, ".inf"), yaml_tag("float"), "infinity");
  TEST_ASSERT_STR(resolve_plain(resolver, ".NaN"), yaml_tag("float"), "nan");
  TEST_ASSERT_STR(resolve_plain(resolver, "1:20"), yaml_tag("str"), "no sexagesimal in 1.2");
  TEST_ASSERT_STR(resolve_plain(resolver, "~"), yaml_tag("null"), "tilde");
  TEST_ASSERT_STR(resolve_plain(resolver, ""), yaml_tag("null"), "empty");
  TEST_ASSERT_STR(resolve_plain(resolver, "2001-12-14"), yaml_tag("timestamp"), "date");
  TEST_ASSERT_STR(resolve_plain(resolver, "2001-12-14t21:59:43.10-05:00"), yaml_tag("timestamp"), "timestamp");
  TEST_ASSERT_STR(resolve_plain(resolver, "<<"), yaml_tag("merge"), "merge key");
  TEST_ASSERT_STR(resolve_plain(resolver, "hello"), yaml_tag("str"), "plain text");
  TestLogger::log_pass("YAML 1.2 implicit tags");
}

void testYaml11Table() {
  TestLogger::log_test("YAML 1.1 implicit tags");
  Resolver resolver;
  resolver.set_version_source([] { return VersionInfo{1, 1}; });
  TEST_ASSERT_STR(resolve_plain(resolver, "yes"), yaml_tag("bool"), "yes");
  TEST_ASSERT_STR(resolve_plain(resolver, "Off"), yaml_tag("bool"), "Off");
  TEST_ASSERT_STR(resolve_plain(resolver, "1:20"), yaml_tag("int"), "sexagesimal int");
  TEST_ASSERT_STR(resolve_plain(resolver, "1:20.5"), yaml_tag("float"), "sexagesimal float");
  TEST_ASSERT_STR(resolve_plain(resolver, "017"), yaml_tag("int"), "old style octal");
  TEST_ASSERT_STR(resolve_plain(resolver, "0o17"), yaml_tag("str"), "0o is not an 1.1 prefix");
  TEST_ASSERT_STR(resolve_plain(resolver, "0b101"), yaml_tag("int"), "binary");
  TestLogger::log_pass("YAML 1.1 implicit tags");
}

void testNonPlainAndCollections() {
  TestLogger::log_test("non-plain scalars and collections");
  Resolver resolver;
  TEST_ASSERT_STR(resolver.resolve(NodeKind::Scalar, "123", false).value(), yaml_tag("str"), "quoted number is str");
  TEST_ASSERT_STR(resolver.resolve(NodeKind::Sequence, "", true).value(), yaml_tag("seq"), "sequence");
  TEST_ASSERT_STR(resolver.resolve(NodeKind::Mapping, "", true).value(), yaml_tag("map"), "mapping");
  TestLogger::log_pass("Non-plain scalars and collections");
}

void testCustomImplicitResolver() {
  TestLogger::log_test("custom implicit resolver");
  Resolver resolver;
  resolver.add_implicit_resolver("!semver", "^[0-9]+\\.[0-9]+\\.[0-9]+$",
                                 {"0", "1", "2", "3", "4", "5", "6", "7", "8", "9"});
  TEST_ASSERT_STR(resolve_plain(resolver, "1.2.3"), "!semver", "semver in 1.2");
  resolver.set_version_source([] { return VersionInfo{1, 1}; });
  TEST_ASSERT_STR(resolve_plain(resolver, "10.0.1"), "!semver", "semver in 1.1");
  TEST_ASSERT_STR(resolve_plain(resolver, "1.5"), yaml_tag("float"), "standard entries still apply first");
  TestLogger::log_pass("Custom implicit resolver");
}

void testPathResolver() {
  TestLogger::log_test("path resolver");
  Resolver resolver;
  resolver.add_path_resolver("!name", {Resolver::PathElement{NodeKind::Mapping, "", std::string("name")}},
                             NodeKind::Scalar);
  Reader reader(std::string_view("name: ada\nother: bob\n"), "<test>");
  Scanner scanner(reader);
  Parser parser(scanner);
  Composer composer(parser, resolver);
  NodePtr root = composer.get_single_node();
  TEST_ASSERT(root && root->is_mapping(), "mapping root");
  TEST_ASSERT_STR(root->pairs[0].second->tag.value(), "!name", "value under `name` gets the path tag");
  TEST_ASSERT_STR(root->pairs[1].second->tag.value(), yaml_tag("str"), "other values keep their tag");
  TEST_ASSERT_STR(root->pairs[0].first->tag.value(), yaml_tag("str"), "keys are not matched");
  TestLogger::log_pass("Path resolver");
}

void testVersionFollowsDirective() {
  TestLogger::log_test("version follows %YAML");
  Reader reader(std::string_view("%YAML 1.1\n--- yes\n--- yes\n"), "<test>");
  Scanner scanner(reader);
  Parser parser(scanner);
  Resolver resolver;
  resolver.set_version_source([&scanner] { return scanner.processing_version(); });
  Composer composer(parser, resolver);
  NodePtr first = composer.get_node();
  TEST_ASSERT_STR(first->tag.value(), yaml_tag("bool"), "1.1 document");
  NodePtr second = composer.get_node();
  TEST_ASSERT_STR(second->tag.value(), yaml_tag("str"), "the next document is back to 1.2");
  TestLogger::log_pass("Version follows %YAML");
}

} // namespace

int main() {
  TestLogger::log_header("Resolver Tests");
  TestRunner runner;
  runner.run("YAML 1.2 table", testYaml12Table);
  runner.run("YAML 1.1 table", testYaml11Table);
  runner.run("Non-plain scalars", testNonPlainAndCollections);
  runner.run("Custom implicit resolver", testCustomImplicitResolver);
  runner.run("Path resolver", testPathResolver);
  runner.run("Version follows directive", testVersionFollowsDirective);
  return runner.finish("resolver tests");
}
