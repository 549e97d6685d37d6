#include "rtyaml.hh"
#include "rtyaml/reader.hh"
#include "rtyaml/unicode.hh"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace rtyaml;

namespace {

void usage() {
  std::cerr << "rty roundtrip [options] <file>   print the file loaded and dumped again\n"
               "rty check [options] <file>       exit 0 when the round trip reproduces the file exactly\n"
               "rty tokens [options] <file>      print the scanner tokens\n"
               "rty events [options] <file>      print the parser events\n"
               "rty nodes [options] <file>       print the node graph of each document\n"
               "options: --version 1.1|1.2  --indent N  --width N"
            << std::endl;
}

std::string read_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StreamError("Could not open file: " + path);
  }
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

bool parse_int(std::string_view text, int &out) {
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  return lines;
}

// One `@@ line N @@` hunk per differing line
void print_diff(const std::string &expected, const std::string &actual) {
  std::vector<std::string> a = split_lines(expected), b = split_lines(actual);
  std::size_t n = std::max(a.size(), b.size()), differing = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const std::string *la = i < a.size() ? &a[i] : nullptr;
    const std::string *lb = i < b.size() ? &b[i] : nullptr;
    if (la && lb && *la == *lb)
      continue;
    ++differing;
    std::cout << "@@ line " << i + 1 << " @@\n";
    if (la)
      std::cout << "-" << *la << "\n";
    if (lb)
      std::cout << "+" << *lb << "\n";
  }
  std::cout << differing << " line(s) differ" << std::endl;
}

int cmd_tokens(const std::string &path, const std::string &input, const std::optional<VersionInfo> &version) {
  Reader reader(input, path);
  RoundTripScanner scanner(reader, version);
  while (true) {
    Token token = scanner.get_token();
    std::cout << token.start_mark.line + 1 << ":" << token.start_mark.column + 1 << " " << token.id();
    if (token.kind == TokenKind::Scalar || token.kind == TokenKind::Alias || token.kind == TokenKind::Anchor) {
      std::cout << " " << repr_str(token.value);
    } else if (token.kind == TokenKind::Tag) {
      std::cout << " " << token.tag_handle.value_or("") << token.tag_suffix;
    }
    std::cout << "\n";
    if (token.kind == TokenKind::StreamEnd)
      break;
  }
  return 0;
}

int cmd_events(const std::string &path, const std::string &input, const std::optional<VersionInfo> &version) {
  Reader reader(input, path);
  RoundTripScanner scanner(reader, version);
  RoundTripParser parser(scanner);
  while (parser.check_event()) {
    std::cout << parser.get_event().compact_repr() << "\n";
  }
  return 0;
}

int cmd_nodes(const std::string &path, const std::string &input, const std::optional<VersionInfo> &version) {
  Reader reader(input, path);
  RoundTripScanner scanner(reader, version);
  RoundTripParser parser(scanner);
  Resolver resolver;
  resolver.set_version_source([&scanner] { return scanner.processing_version(); });
  Composer composer(parser, resolver);
  int index = 0;
  while (NodePtr node = composer.get_node()) {
    std::cout << "--- document " << index++ << "\n";
    dump_node(std::cout, node);
  }
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::string_view cmd;
  std::string path;
  YAML yaml;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "--version" || a == "--indent" || a == "--width") {
      if (i + 1 >= argc) {
        usage();
        return 1;
      }
      std::string_view v = argv[++i];
      int n = 0;
      if (a == "--version") {
        if (v == "1.1") {
          yaml.version = VersionInfo{1, 1};
        } else if (v == "1.2") {
          yaml.version = VersionInfo{1, 2};
        } else {
          std::cerr << "Error: unsupported YAML version: " << v << std::endl;
          return 1;
        }
      } else if (!parse_int(v, n)) {
        std::cerr << "Error: " << a << " expects a number, got: " << v << std::endl;
        return 1;
      } else if (a == "--indent") {
        yaml.indent(n, n);
      } else {
        yaml.width = n;
      }
      continue;
    }
    if (cmd.empty()) {
      cmd = a;
    } else if (path.empty()) {
      path = a;
    } else {
      usage();
      return 1;
    }
  }

  if (path.empty() || (cmd != "roundtrip" && cmd != "check" && cmd != "tokens" && cmd != "events" && cmd != "nodes")) {
    usage();
    return 1;
  }

  initialize_llvm_components();
  try {
    std::string input = read_file(path);
    if (cmd == "tokens") {
      return cmd_tokens(path, input, yaml.version);
    }
    if (cmd == "events") {
      return cmd_events(path, input, yaml.version);
    }
    if (cmd == "nodes") {
      return cmd_nodes(path, input, yaml.version);
    }

    std::vector<Value> documents = yaml.load_all(input, path);
    std::string output = yaml.dump_all(documents);
    if (cmd == "roundtrip") {
      std::cout << output << std::flush;
      return 0;
    }
    // cmd == "check"
    if (output == input) {
      std::cout << "✓ " << path << " round trips exactly" << std::endl;
      return 0;
    }
    std::cout << "✗ " << path << " differs after the round trip" << std::endl;
    print_diff(input, output);
    return 1;

  } catch (const Exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    std::cerr << "Stack trace:\n" << e.stack_trace() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
