#include "rtyaml.hh"
#include "rtyaml/di.hh"

#include <cstdint>
#include <iostream>
#include <string>

// Dumps a value so the function stays out of line with a real body
__attribute__((noinline)) std::string dumpSample() {
  rtyaml::YAML yaml;
  return yaml.dump(rtyaml::Value(42));
}

int main() {
  std::cout << "Testing getSourceLocation function from rtyaml/di.hh" << std::endl;

  // Initialize LLVM components required for DWARF debug info handling
  rtyaml::initialize_llvm_components();

  std::cout << "dumpSample output: " << dumpSample();

  void *func_addr = (void *)(uintptr_t)&dumpSample;
  std::cout << "Obtained address of dumpSample: " << func_addr << std::endl;

  std::string location = rtyaml::getSourceLocation(func_addr);

  std::cout << "getSourceLocation result: '" << location << "'" << std::endl;

  bool success = !location.empty() && location.find("get_source_location_test.cc") != std::string::npos;

  if (success) {
    std::cout << "\033[0;32m✓ getSourceLocation test passed\033[0m" << std::endl;
    return 0;
  } else {
    std::cout << "\033[0;31m✗ getSourceLocation test failed\033[0m" << std::endl;
    return 1;
  }
}
