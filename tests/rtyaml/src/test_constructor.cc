#include "../test_output_utils.hh"
#include "rtyaml.hh"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace rtyaml;

namespace {

void testScalarsByVersion() {
  TestLogger::log_test("scalar values by version");
  YAML yaml;
  Value doc = yaml.load("n: ~\nb: true\ni: -12\nf: 2.5\ns: yes\ninf: -.inf\nnan: .nan\n");
  TEST_ASSERT(doc["n"].IsNull(), "null");
  TEST_ASSERT(doc["b"].IsBool() && doc["b"].asBool(), "bool");
  TEST_ASSERT(doc["i"].asInt64() == -12, "int");
  TEST_ASSERT(doc["f"].asDouble() == 2.5, "float");
  TEST_ASSERT(doc["s"].IsString() && doc["s"].asString() == "yes", "yes stays a string in 1.2");
  TEST_ASSERT(std::isinf(doc["inf"].asDouble()) && doc["inf"].asDouble() < 0, "negative infinity");
  TEST_ASSERT(std::isnan(doc["nan"].asDouble()), "nan");

  Value old = yaml.load("%YAML 1.1\n---\ns: yes\no: 017\nx: 1:30\nf: 1:30.5\n");
  TEST_ASSERT(old["s"].IsBool() && old["s"].asBool(), "yes is a bool in 1.1");
  TEST_ASSERT(old["o"].asInt64() == 15, "leading zero is octal in 1.1");
  TEST_ASSERT(old["x"].asInt64() == 90, "sexagesimal int");
  TEST_ASSERT(old["f"].asDouble() == 90.5, "sexagesimal float");

  YAML pinned;
  pinned.version = VersionInfo{1, 1};
  TEST_ASSERT(pinned.load("off").IsBool(), "pinned 1.1 without directive");
  TestLogger::log_pass("Scalar values by version");
}

void testIntegerFormats() {
  TestLogger::log_test("integer formats");
  YAML yaml;
  Value doc = yaml.load("hex: 0x1F\nlow: 0x1f\noct: 0o17\nbin: 0b1010\ngrp: 1_000_000\npad: 010\n");
  TEST_ASSERT(doc["hex"].asInt64() == 31 && doc["hex"].asScalarInt().base == IntBase::HexCaps, "upper case hex");
  TEST_ASSERT(doc["low"].asScalarInt().base == IntBase::Hex, "lower case hex");
  TEST_ASSERT(doc["oct"].asInt64() == 15 && doc["oct"].asScalarInt().base == IntBase::Octal, "octal");
  TEST_ASSERT(doc["bin"].asInt64() == 10 && doc["bin"].asScalarInt().base == IntBase::Binary, "binary");
  TEST_ASSERT(doc["grp"].asInt64() == 1000000, "underscores dropped from the value");
  TEST_ASSERT(doc["grp"].asScalarInt().underscore && doc["grp"].asScalarInt().underscore->group == 3,
              "underscore grouping kept");
  TEST_ASSERT(doc["pad"].asInt64() == 10 && doc["pad"].asScalarInt().width == 3, "zero padding kept in 1.2");
  TEST_ASSERT_THROWS(yaml.load("!!int abc"), ConstructorError, "bad integer");

  Value upper = yaml.load("upper: 0X1f\n");
  TEST_ASSERT(upper["upper"].IsString(), "0X is no integer prefix");
  TEST_ASSERT_STR(yaml.dump(upper), "upper: 0X1f\n", "upper case prefix written as it was");
  TestLogger::log_pass("Integer formats");
}

void testIntegersBeyondInt64() {
  TestLogger::log_test("integers beyond int64");
  YAML yaml;
  Value doc = yaml.load("a: 9223372036854775808\n"
                        "b: 18446744073709551615\n"
                        "c: 0x10000000000000000\n"
                        "d: -9223372036854775809\n"
                        "e: -9223372036854775808\n"
                        "f: 123456789012345678901234567890\n");
  TEST_ASSERT(doc["a"].asUInt64() == 9223372036854775808ULL, "just above int64");
  TEST_ASSERT(doc["b"].asUInt64() == 18446744073709551615ULL, "uint64 maximum");
  TEST_ASSERT_THROWS(doc["b"].asInt64(), RangeError, "no int64 for it");
  TEST_ASSERT_STR(doc["c"].asScalarInt().decimal(), "18446744073709551616", "hex beyond uint64");
  TEST_ASSERT_THROWS(doc["c"].asUInt64(), RangeError, "no uint64 for it");
  TEST_ASSERT_STR(doc["d"].str(), "-9223372036854775809", "negative beyond int64");
  TEST_ASSERT(!doc["e"].asScalarInt().is_big() && doc["e"].asInt64() == std::numeric_limits<std::int64_t>::min(),
              "int64 minimum fits");
  TEST_ASSERT_STR(doc["f"].str(), "123456789012345678901234567890", "any size");
  TEST_ASSERT(!(doc["a"] == doc["b"]) && doc["b"] == yaml.load("18446744073709551615"), "compared by value");

  const std::string input = "c: 0x10000000000000000\nf: 123_456_789_012_345_678_901\n";
  TEST_ASSERT_STR(yaml.dump(yaml.load(input)), input, "big integers round trip");

  YAML safe(YAML::Kind::Safe);
  TEST_ASSERT_STR(safe.dump(safe.load("0x10000000000000000")), "18446744073709551616\n...\n", "safe dump in decimal");
  TestLogger::log_pass("Integers beyond int64");
}

void testFloatsBeyondDoubleRange() {
  TestLogger::log_test("floats beyond the double range");
  YAML yaml;
  Value doc = yaml.load("a: 1e400\nb: -1e400\nc: 1e-400\nd: -1.0e-400\ne: 4.9e-324\n");
  TEST_ASSERT(std::isinf(doc["a"].asDouble()) && doc["a"].asDouble() > 0, "overflow gives infinity");
  TEST_ASSERT(std::isinf(doc["b"].asDouble()) && doc["b"].asDouble() < 0, "negative overflow");
  TEST_ASSERT(doc["c"].asDouble() == 0.0 && !std::signbit(doc["c"].asDouble()), "underflow gives zero");
  TEST_ASSERT(doc["d"].asDouble() == 0.0 && std::signbit(doc["d"].asDouble()), "negative underflow");
  TEST_ASSERT(doc["e"].asDouble() > 0.0, "smallest subnormal still loads");

  const std::string input = "a: 1e400\nb: -1e400\nc: 1e-400\nd: -1.0e-400\n";
  TEST_ASSERT_STR(yaml.dump(yaml.load(input)), input, "written as they were");

  YAML safe(YAML::Kind::Safe);
  TEST_ASSERT_STR(safe.dump(safe.load("a: 1e400\nb: -1e400\n")), "a: .inf\nb: -.inf\n", "safe dump");
  TestLogger::log_pass("Floats beyond the double range");
}

void testFloatFormats() {
  TestLogger::log_test("float formats");
  YAML yaml;
  Value doc = yaml.load("a: 1.50\nb: 1.5e+10\nc: -0.25\n");
  const ScalarFloat &a = doc["a"].asScalarFloat();
  TEST_ASSERT(a.value == 1.5 && a.width == 4 && a.prec == 1, "trailing zero kept as width");
  const ScalarFloat &b = doc["b"].asScalarFloat();
  TEST_ASSERT(b.value == 1.5e10 && b.exp == 'e' && b.e_sign, "exponent shape");
  TEST_ASSERT(doc["c"].asScalarFloat().m_sign == '-', "mantissa sign");

  std::vector<MarkedWarning> warnings;
  YAML old;
  old.warning_handler = [&warnings](const MarkedWarning &w) { warnings.push_back(w); };
  old.load("%YAML 1.1\n--- 1e3\n");
  TEST_ASSERT(warnings.size() == 1 && warnings[0].kind == WarningKind::MantissaNoDot, "mantissa warning");
  old.mantissa_policy = MantissaPolicy::Error;
  TEST_ASSERT_THROWS(old.load("%YAML 1.1\n--- 1e3\n"), ConstructorError, "mantissa error");
  TestLogger::log_pass("Float formats");
}

void testTimestampAndBinary() {
  TestLogger::log_test("timestamps and binary");
  YAML yaml;
  Value doc = yaml.load("d: 2002-12-14\nt: 2001-12-14 21:59:43.10 -5\nbin: !!binary aGVsbG8=\n");
  const TimeStamp &d = doc["d"].asTimestamp();
  TEST_ASSERT(d.year == 2002 && d.month == 12 && d.day == 14 && !d.has_time, "date only");
  const TimeStamp &t = doc["t"].asTimestamp();
  TEST_ASSERT(t.has_time && t.hour == 21 && t.minute == 59 && t.second == 43, "time of day");
  TEST_ASSERT(t.fraction == "10" && t.microsecond() == 100000, "fraction");
  TEST_ASSERT(t.tz == "-5" && t.separator == " ", "timezone and separator as written");
  TEST_ASSERT(doc["bin"].asBinary().bytes == "hello", "base64 decoded");
  TEST_ASSERT_THROWS(yaml.load("!!timestamp 2001-13-01"), ConstructorError, "month out of range");
  TEST_ASSERT_THROWS(yaml.load("!!binary a@b"), ConstructorError, "bad base64");
  TestLogger::log_pass("Timestamps and binary");
}

void testMergeKeys() {
  TestLogger::log_test("merge keys");
  const char *before = "base: &b {a: 1, b: 2}\nd:\n  <<: *b\n  a: 3\n";
  const char *after = "base: &b {a: 1, b: 2}\nd:\n  a: 3\n  <<: *b\n";
  for (YAML::Kind kind : {YAML::Kind::RoundTrip, YAML::Kind::Safe}) {
    YAML yaml(kind);
    for (const char *input : {before, after}) {
      Value doc = yaml.load(input);
      TEST_ASSERT(doc["d"]["a"].asInt64() == 3, "explicit key wins over the merge");
      TEST_ASSERT(doc["d"]["b"].asInt64() == 2, "merged key visible");
    }
  }

  YAML yaml;
  Value doc = yaml.load(before);
  CommentedMap &d = doc["d"].asMap();
  TEST_ASSERT(d.non_merged_items().size() == 1, "only `a` is an own key");
  TEST_ASSERT(d.erase(Value("a")), "own key removed");
  TEST_ASSERT(doc["d"]["a"].asInt64() == 1, "the merged value comes back");
  TestLogger::log_pass("Merge keys");
}

void testDuplicateKeys() {
  TestLogger::log_test("duplicate keys");
  std::vector<MarkedWarning> warnings;
  YAML lenient;
  lenient.warning_handler = [&warnings](const MarkedWarning &w) { warnings.push_back(w); };
  Value doc = lenient.load("{a: 1, a: 2}");
  TEST_ASSERT(doc.size() == 1 && doc["a"].asInt64() == 2, "the last value is kept");
  TEST_ASSERT(warnings.size() == 1 && warnings[0].kind == WarningKind::DuplicateKey, "one warning");

  YAML strict;
  strict.duplicate_keys = DuplicateKeyPolicy::Error;
  try {
    strict.load("a: 1\nb: 2\na: 2\n");
    throw std::runtime_error("no error for a duplicate key");
  } catch (const DuplicateKeyError &e) {
    TEST_ASSERT(e.problem().find("found duplicate key") != std::string::npos, "problem text");
    TEST_ASSERT(e.problem_mark() && e.problem_mark()->line == 2, "mark on the second key");
  }

  YAML quiet;
  quiet.duplicate_keys = DuplicateKeyPolicy::Allow;
  warnings.clear();
  quiet.warning_handler = lenient.warning_handler;
  TEST_ASSERT(quiet.load("{a: 1, a: 2}")["a"].asInt64() == 2, "allowed silently");
  TEST_ASSERT(warnings.empty(), "no warning when allowed");
  TestLogger::log_pass("Duplicate keys");
}

void testAliasIdentity() {
  TestLogger::log_test("alias identity and recursion");
  YAML yaml;
  Value doc = yaml.load("a: &x {k: v}\nb: *x\nc: &s text\nd: *s\n");
  TEST_ASSERT(doc["a"].identity() != nullptr, "maps have identity");
  TEST_ASSERT(doc["a"].identity() == doc["b"].identity(), "both paths hold the same map");
  doc["a"].asMap().set(Value("k"), Value("changed"));
  TEST_ASSERT(doc["b"]["k"].asString() == "changed", "a change shows through the alias");
  TEST_ASSERT(doc["c"].identity() == doc["d"].identity(), "anchored scalars share identity");

  Value rec = yaml.load("&r [1, *r]\n");
  TEST_ASSERT(rec[1].identity() == rec.identity(), "recursive sequence refers to itself");
  rec.asSequence().erase(1);
  TEST_ASSERT(rec.size() == 1 && rec[0].asInt64() == 1, "removing the alias breaks the cycle");
  TestLogger::log_pass("Alias identity and recursion");
}

void testCollectionTags() {
  TestLogger::log_test("collection tags");
  YAML yaml;
  Value omap = yaml.load("!!omap\n- z: 1\n- a: 2\n");
  TEST_ASSERT(omap.IsOrderedMap(), "ordered map");
  TEST_ASSERT(omap.asMap().begin()->key.asString() == "z", "insertion order kept");
  TEST_ASSERT_THROWS(yaml.load("!!omap\n- a: 1\n  b: 2\n"), ConstructorError, "omap item with two pairs");

  Value set = yaml.load("!!set {a, b}\n");
  TEST_ASSERT(set.IsSet() && set.size() == 2 && set.asSet().contains(Value("a")), "set");

  Value tagged = yaml.load("!point 1,2\n");
  TEST_ASSERT(tagged.IsTagged(), "unknown scalar tag kept");
  TEST_ASSERT(tagged.asTagged().value() == "1,2" && tagged.asTagged().tag() == "!point", "tagged scalar");

  Value tagged_map = yaml.load("!thing {a: 1}\n");
  TEST_ASSERT(tagged_map.IsMap() && tagged_map.asMap().tag() && *tagged_map.asMap().tag() == "!thing",
              "unknown mapping tag kept on the map");

  YAML safe(YAML::Kind::Safe);
  TEST_ASSERT_THROWS(safe.load("!point 1,2\n"), ConstructorError, "the safe loader rejects unknown tags");
  TestLogger::log_pass("Collection tags");
}

void testComplexKeys() {
  TestLogger::log_test("complex keys");
  YAML yaml;
  Value doc = yaml.load("? [a, b]\n: seq\n? {x: 1}\n: map\n");
  TEST_ASSERT(doc.size() == 2, "two entries");
  for (const auto &e : doc.asMap()) {
    if (e.key.IsSequence()) {
      TEST_ASSERT(e.key.asSequence().frozen(), "sequence key is frozen");
      TEST_ASSERT_THROWS(e.key.asSequence().push_back(Value("c")), TypeError, "frozen keys refuse mutation");
    }
  }
  TestLogger::log_pass("Complex keys");
}

void testPositionsAndQuotes() {
  TestLogger::log_test("positions and preserved quotes");
  YAML yaml;
  yaml.preserve_quotes = true;
  Value doc = yaml.load("a: 1\nlist:\n- 'x'\n- \"y\"\n");
  CommentedMap &m = doc.asMap();
  TEST_ASSERT(m.lc().line == 0 && m.lc().col == 0, "map position");
  auto value_pos = m.lc().value(Value("list"));
  TEST_ASSERT(value_pos && value_pos->first == 2, "value position of `list`");
  TEST_ASSERT(doc["list"][0].asScalarString().style == ScalarStyle::SingleQuoted, "single quotes preserved");
  TEST_ASSERT(doc["list"][1].asScalarString().style == ScalarStyle::DoubleQuoted, "double quotes preserved");

  YAML plain;
  TEST_ASSERT(plain.load("'x'").asScalarString().style == ScalarStyle::Plain, "quotes dropped by default");
  TestLogger::log_pass("Positions and preserved quotes");
}

} // namespace

int main() {
  TestLogger::log_header("Constructor Tests");
  TestRunner runner;
  runner.run("Scalars by version", testScalarsByVersion);
  runner.run("Integer formats", testIntegerFormats);
  runner.run("Integers beyond int64", testIntegersBeyondInt64);
  runner.run("Float formats", testFloatFormats);
  runner.run("Floats beyond the double range", testFloatsBeyondDoubleRange);
  runner.run("Timestamps and binary", testTimestampAndBinary);
  runner.run("Merge keys", testMergeKeys);
  runner.run("Duplicate keys", testDuplicateKeys);
  runner.run("Alias identity", testAliasIdentity);
  runner.run("Collection tags", testCollectionTags);
  runner.run("Complex keys", testComplexKeys);
  runner.run("Positions and quotes", testPositionsAndQuotes);
  return runner.finish("constructor tests");
}
