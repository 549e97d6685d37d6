#include <rtyaml.hh>
#include <rtyaml/di.hh>

#include <cstdlib>
#include <cxxabi.h>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <typeinfo>
#include <vector>

using namespace rtyaml;

// Each failure is raised a few calls deep, so the trace has frames of this file above the library ones
volatile int call_depth = 0;

__attribute__((noinline)) void load_unterminated_flow() {
  ++call_depth;
  YAML yaml;
  yaml.load("items: [1, 2\nnext: 3\n", "unterminated.yaml");
}

__attribute__((noinline)) void load_duplicate_keys() {
  ++call_depth;
  YAML yaml;
  yaml.duplicate_keys = DuplicateKeyPolicy::Error;
  yaml.load("a: 1\nb: 2\na: 3\n", "duplicate_keys.yaml");
}

__attribute__((noinline)) void read_string_as_int() {
  ++call_depth;
  YAML yaml;
  Value doc = yaml.load("count: not_a_number\n", "conversion.yaml");
  std::cout << "  count is " << doc["count"].asInt() << std::endl;
}

__attribute__((noinline)) void dump_host_object() {
  ++call_depth;
  struct Unregistered {};
  YAML yaml;
  std::cout << yaml.dump(Value::object(std::make_shared<Unregistered>()));
}

__attribute__((noinline)) void nested(const std::function<void()> &fn, int levels) {
  ++call_depth;
  if (levels > 0) {
    nested(fn, levels - 1);
  } else {
    fn();
  }
}

struct TraceCase {
  std::string name;
  std::function<void()> trigger;
  // text the error message must carry, empty for none
  std::string message_part;
};

std::string type_name(const std::exception &e) {
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> demangled(abi::__cxa_demangle(typeid(e).name(), nullptr, nullptr, &status),
                                                    std::free);
  return status == 0 ? std::string(demangled.get()) : std::string(typeid(e).name());
}

bool check_case(const TraceCase &tc) {
  std::cout << "\n=== Stack Trace Test: " << tc.name << " ===" << std::endl;
  try {
    nested(tc.trigger, 3);
  } catch (const Exception &e) {
    std::cout << "  Exception type: " << type_name(e) << std::endl;
    std::cout << "  Error message: " << e.what() << std::endl;
    const std::string &trace = e.stack_trace();
    std::istringstream lines(trace);
    std::string line;
    while (std::getline(lines, line)) {
      std::cout << "    " << line << std::endl;
    }
    bool ok = true;
    if (trace.find("/yaml_exc_trace_test.cc") == std::string::npos) {
      std::cout << "  ✗ no source location of the test in the stack trace" << std::endl;
      ok = false;
    }
    if (!tc.message_part.empty() && std::string(e.what()).find(tc.message_part) == std::string::npos) {
      std::cout << "  ✗ message lacks \"" << tc.message_part << "\"" << std::endl;
      ok = false;
    }
    std::cout << (ok ? "\033[0;32m✓\033[0m " : "\033[0;31m✗\033[0m ") << tc.name << std::endl;
    return ok;
  } catch (const std::exception &e) {
    std::cout << "\033[0;31m✗\033[0m " << tc.name << " - not an rtyaml exception: " << type_name(e) << std::endl;
    return false;
  }
  std::cout << "\033[0;31m✗\033[0m " << tc.name << " - no exception thrown" << std::endl;
  return false;
}

int main() {
  std::cout << "=== YAML Exception Stack Trace Test Suite ===" << std::endl;
  initialize_llvm_components();

  const std::vector<TraceCase> cases = {
      {"Unterminated Flow Sequence", load_unterminated_flow, "unterminated.yaml"},
      {"DuplicateKeyError", load_duplicate_keys, "found duplicate key"},
      {"TypeError", read_string_as_int, ""},
      {"RepresenterError", dump_host_object, "cannot represent an object"},
  };

  bool all_passed = true;
  for (const auto &tc : cases) {
    all_passed = check_case(tc) && all_passed;
  }

  std::cout << "\n=== Test Suite Complete ===" << std::endl;
  if (!all_passed) {
    std::cout << "\033[0;31m✗\033[0m Some tests failed!" << std::endl;
    return 1;
  }
  std::cout << "\033[0;32m✓\033[0m All tests passed!" << std::endl;
  return 0;
}
