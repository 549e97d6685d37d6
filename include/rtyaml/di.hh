#pragma once

#include <iostream>
#include <sstream>
#include <string>

namespace rtyaml {

// Format one frame of a captured backtrace, with DWARF source location when available
void formatBacktraceFrame(int btDepth, void *address, std::ostringstream &oss);

// `file:line[:column]` of the code at an address, or empty when no debug info covers it
std::string getSourceLocation(void *address);

// Dump comprehensive debug information from an address to the specified output stream
void dumpDebugInfo(void *address, std::ostream &os = std::cerr);

} // namespace rtyaml
