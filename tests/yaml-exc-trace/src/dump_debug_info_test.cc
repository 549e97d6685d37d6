#include "rtyaml.hh"
#include "rtyaml/di.hh"

#include <cstdint>
#include <iostream>

// Loads a small document so the function has a body worth describing
__attribute__((noinline)) void loadSample() {
  rtyaml::YAML yaml;
  rtyaml::Value doc = yaml.load("sample: 1\n");
  std::cerr << "Loaded sample document with " << doc.size() << " entry" << std::endl;
}

int main() {
  std::cerr << "Testing dumpDebugInfo function from rtyaml/di.hh" << std::endl;

  rtyaml::initialize_llvm_components();
  loadSample();

  void *func_addr = (void *)(uintptr_t)&loadSample;
  std::cerr << "Obtained address of loadSample: " << func_addr << std::endl;

  rtyaml::dumpDebugInfo(func_addr, std::cerr);

  std::cerr << std::endl;

  std::cerr << "\033[0;32m✓ dumpDebugInfo test passed\033[0m" << std::endl;
  return 0;
}
