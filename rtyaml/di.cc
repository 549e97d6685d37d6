#include "rtyaml/di.hh"
#include "rtyaml/error.hh"

#include <climits>
#include <cstdlib>
#include <cxxabi.h>
#include <dlfcn.h>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <string_view>
#include <unistd.h>
#include <unordered_map>

// LLVM DWARF debug info for source-level stack traces
#include "llvm/DebugInfo/DIContext.h"
#include "llvm/DebugInfo/DWARF/DWARFContext.h"
#include "llvm/Object/ObjectFile.h"
#include "llvm/Support/MemoryBuffer.h"

namespace rtyaml {

namespace {

// Parsed object file and its DWARF context, kept alive for the process lifetime
struct ModuleDebugInfo {
  std::unique_ptr<llvm::MemoryBuffer> buffer;
  std::unique_ptr<llvm::object::ObjectFile> object;
  std::unique_ptr<llvm::DWARFContext> context;
};

// Keyed by the module's file path, a null context records a module without usable debug info
std::unordered_map<std::string, ModuleDebugInfo> debug_info_cache;
std::mutex cache_mutex;

std::string demangle(const char *symbol) {
  int status = 0;
  char *demangled = abi::__cxa_demangle(symbol, nullptr, nullptr, &status);
  if (status == 0 && demangled) {
    std::string name(demangled);
    std::free(demangled);
    return name;
  }
  return symbol;
}

std::unique_ptr<llvm::MemoryBuffer> loadModuleFile(std::string_view module_path) {
  std::string debug_file_path(module_path);

#ifdef __APPLE__
  // debug info lives in a separate dSYM bundle
  auto last_slash = module_path.find_last_of('/');
  std::string_view filename = last_slash != std::string_view::npos ? module_path.substr(last_slash + 1) : module_path;
  std::string dsym_path = debug_file_path + ".dSYM/Contents/Resources/DWARF/" + std::string(filename);
  if (std::ifstream(dsym_path).good()) {
    debug_file_path = dsym_path;
  }
#endif

  auto buffer_or = llvm::MemoryBuffer::getFile(debug_file_path, -1, false);
  if (buffer_or) {
    return std::move(buffer_or.get());
  }

#ifdef __linux__
  // dladdr may report argv[0] for the main executable, which is relative to a former cwd
  if (module_path.ends_with(".so") || module_path.find(".so.") != std::string_view::npos) {
    return nullptr;
  }
  char exe_path[PATH_MAX];
  ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
  if (len == -1) {
    return nullptr;
  }
  exe_path[len] = '\0';
  auto exe_buffer_or = llvm::MemoryBuffer::getFile(exe_path, -1, false);
  if (exe_buffer_or) {
    return std::move(exe_buffer_or.get());
  }
#endif
  return nullptr;
}

llvm::DWARFContext *getModuleDebugInfo(const Dl_info &info) {
  std::string module_path(info.dli_fname ? info.dli_fname : "");

  std::lock_guard<std::mutex> lock(cache_mutex);
  auto it = debug_info_cache.find(module_path);
  if (it != debug_info_cache.end()) {
    return it->second.context.get();
  }

  ModuleDebugInfo &entry = debug_info_cache[module_path];
  entry.buffer = loadModuleFile(module_path);
  if (!entry.buffer) {
    return nullptr;
  }
  auto object_or = llvm::object::ObjectFile::createObjectFile(entry.buffer->getMemBufferRef());
  if (!object_or) {
    llvm::consumeError(object_or.takeError());
    return nullptr;
  }
  entry.object = std::move(object_or.get());
  entry.context = llvm::DWARFContext::create(*entry.object);
  return entry.context.get();
}

// Line info for an address inside a loaded module, the context is null when the module has no debug info
llvm::DILineInfo lookupLineInfo(void *address, const Dl_info &info, llvm::DWARFContext *context,
                                bool return_address) {
  uint64_t debug_address = (uintptr_t)(address) - (uintptr_t)(info.dli_fbase);
#ifdef __APPLE__
  // dSYM addresses assume a 0x100000000 base
  debug_address += 0x100000000;
#endif
  // backtrace() yields return addresses, one past the call instruction
  if (return_address && debug_address > 0) {
    debug_address -= 1;
  }
  llvm::DILineInfoSpecifier spec(llvm::DILineInfoSpecifier::FileLineInfoKind::AbsoluteFilePath,
                                 llvm::DILineInfoSpecifier::FunctionNameKind::LinkageName);
  llvm::object::SectionedAddress sectioned = {debug_address, llvm::object::SectionedAddress::UndefSection};
  return context->getLineInfoForAddress(sectioned, spec);
}

bool usable(std::string_view name) { return !name.empty() && name != "<invalid>"; }

} // namespace

void initialize_llvm_components() {
  // Warm the cache for the module holding this library so the first throw does not pay for DWARF parsing
  Dl_info info;
  if (dladdr(reinterpret_cast<void *>(&initialize_llvm_components), &info) && info.dli_fname) {
    getModuleDebugInfo(info);
  }
}

void formatBacktraceFrame(int btDepth, void *address, std::ostringstream &oss) {
  oss << "#" << std::setw(2) << std::setfill(' ') << btDepth << " ";

  Dl_info info;
  if (!dladdr(address, &info) || !info.dli_fname) {
    oss << "📍 <unknown-src-location>";
    return;
  }

  std::string_view module_path(info.dli_fname);
  std::string_view symbol(info.dli_sname ? info.dli_sname : "");
  if (!usable(symbol) && !usable(module_path)) {
    oss << "📍 <unknown-frame>";
    return;
  }

  auto *context = getModuleDebugInfo(info);
  llvm::DILineInfo lineInfo;
  if (context) {
    lineInfo = lookupLineInfo(address, info, context, true);
  }

  // DWARF function name first, dladdr symbol second
  std::string function_name;
  if (usable(lineInfo.FunctionName)) {
    function_name = demangle(lineInfo.FunctionName.c_str());
  } else if (usable(symbol)) {
    function_name = demangle(info.dli_sname);
  }

  if (!function_name.empty()) {
    oss << "🌀  " << function_name << "\n";
  }
  // vscode-clickable source location
  if (usable(lineInfo.FileName)) {
    oss << "   👉 " << lineInfo.FileName << ":" << lineInfo.Line;
    if (lineInfo.Column > 0) {
      oss << ":" << lineInfo.Column;
    }
    oss << "\n";
  }
  oss << "📦 " << module_path;
}

std::string getSourceLocation(void *address) {
  Dl_info info;
  if (!dladdr(address, &info) || !info.dli_fname) {
    return "";
  }
  auto *context = getModuleDebugInfo(info);
  if (!context) {
    return "";
  }
  llvm::DILineInfo lineInfo = lookupLineInfo(address, info, context, false);
  if (!usable(lineInfo.FileName)) {
    return "";
  }
  std::string location = lineInfo.FileName + ":" + std::to_string(lineInfo.Line);
  if (lineInfo.Column > 0) {
    location += ":" + std::to_string(lineInfo.Column);
  }
  return location;
}

void dumpDebugInfo(void *address, std::ostream &os) {
  os << "=== Debug Info Dump for address " << address << " ===" << std::endl;

  Dl_info info;
  if (!dladdr(address, &info) || !info.dli_fname) {
    os << "  Failed to get module info for address" << std::endl;
    os << "=== End Debug Info Dump ===" << std::endl;
    return;
  }

  auto *context = getModuleDebugInfo(info);
  if (!context) {
    os << "  No debug context available for module" << std::endl;
    os << "=== End Debug Info Dump ===" << std::endl;
    return;
  }

  llvm::DILineInfo lineInfo = lookupLineInfo(address, info, context, false);
  os << "  Function: " << (lineInfo.FunctionName.empty() ? "<unknown>" : lineInfo.FunctionName) << std::endl;
  os << "  File: " << (lineInfo.FileName.empty() ? "<unknown>" : lineInfo.FileName) << std::endl;
  os << "  Line: " << lineInfo.Line << std::endl;
  os << "  Column: " << lineInfo.Column << std::endl;
  os << "  Start Line: " << lineInfo.StartLine << std::endl;
  os << "  Symbol (dladdr): " << (info.dli_sname ? demangle(info.dli_sname) : std::string("<unknown>")) << std::endl;
  os << "  Module: " << info.dli_fname << std::endl;
  os << "=== End Debug Info Dump ===" << std::endl;
}

} // namespace rtyaml
