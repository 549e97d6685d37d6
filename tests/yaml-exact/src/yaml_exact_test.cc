#include "rtyaml.hh"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace rtyaml;

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StreamError("Could not open file: " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// 1-based line of the first difference, 0 when equal
std::size_t first_diff_line(const std::string &a, const std::string &b) {
  if (a == b)
    return 0;
  auto ia = std::mismatch(a.begin(), a.end(), b.begin(), b.end()).first;
  return static_cast<std::size_t>(std::count(a.begin(), ia, '\n')) + 1;
}

// Load and dump with quotes kept, then once more: both dumps must equal the input
bool round_trips_exactly(const fs::path &path) {
  try {
    const std::string original = read_file(path);
    YAML yaml;
    yaml.preserve_quotes = true;
    const std::string once = yaml.dump_all(yaml.load_all(original, path.string()));
    if (std::size_t line = first_diff_line(original, once)) {
      std::cerr << path.string() << ": differs from line " << line << "\n--- expected\n"
                << original << "--- got\n"
                << once << "---" << std::endl;
      return false;
    }
    const std::string twice = yaml.dump_all(yaml.load_all(once, path.string()));
    if (std::size_t line = first_diff_line(once, twice)) {
      std::cerr << path.string() << ": second pass differs from line " << line << std::endl;
      return false;
    }
    return true;
  } catch (const Exception &e) {
    std::cerr << "Error processing file '" << path.string() << "': " << e.what() << std::endl;
    return false;
  }
}

void show_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " <yaml-file>" << std::endl;
  std::cout << "       " << program_name << " --test-all" << std::endl;
  std::cout << std::endl;
  std::cout << "Loads and dumps YAML files, which must come out exactly as they went in." << std::endl;
  std::cout << "--test-all runs every test-data/*.yaml below the working directory." << std::endl;
}

int test_all() {
  std::cout << "=== YAML Round-Trip Printing Tests ===" << std::endl;

  YAML yaml;
  if (!yaml.load("key: value\n").IsMap()) {
    std::cout << "✗ a simple mapping does not load as a mapping" << std::endl;
    return 1;
  }
  std::cout << "✓ Basic loading works" << std::endl;

  std::vector<fs::path> files;
  for (const auto &entry : fs::directory_iterator("test-data")) {
    if (entry.is_regular_file() && entry.path().extension() == ".yaml") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  if (files.empty()) {
    std::cout << "✗ no test-data/*.yaml found" << std::endl;
    return 1;
  }

  int failed = 0;
  for (const auto &path : files) {
    const std::string test_name = path.stem().string();
    if (round_trips_exactly(path)) {
      std::cout << "✓ " << test_name << " passed - exact match!" << std::endl;
    } else {
      std::cout << "✗ " << test_name << " failed - output differs from original" << std::endl;
      ++failed;
    }
  }

  if (failed > 0) {
    std::cout << "\n✗ " << failed << " of " << files.size() << " files failed!" << std::endl;
    return 1;
  }
  std::cout << "\n✓ All " << files.size() << " round-trip printing tests passed!" << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    show_usage(argv[0]);
    return 1;
  }
  const std::string arg = argv[1];
  if (arg == "--help" || arg == "-h") {
    show_usage(argv[0]);
    return 0;
  }
  try {
    if (arg == "--test-all") {
      return test_all();
    }
    // single file, silent on success for use in scripts
    return round_trips_exactly(arg) ? 0 : 1;
  } catch (const std::exception &e) {
    std::cerr << "Test failed: " << e.what() << std::endl;
    return 1;
  }
}
