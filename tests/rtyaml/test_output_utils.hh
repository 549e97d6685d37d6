#pragma once

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

// ANSI color codes for consistent test output formatting
namespace test_colors {
constexpr const char *RED = "\033[0;31m";
constexpr const char *GREEN = "\033[0;32m";
constexpr const char *YELLOW = "\033[0;33m";
constexpr const char *NC = "\033[0m"; // No Color
} // namespace test_colors

// Helper macro for descriptive assertions
#define TEST_ASSERT(condition, message)                                                                                \
  do {                                                                                                                 \
    if (!(condition)) {                                                                                                \
      throw std::runtime_error("Assertion failed: " + std::string(message) + " (" #condition ")");                     \
    }                                                                                                                  \
  } while (0)

// Compares strings, both sides are shown on failure
#define TEST_ASSERT_STR(actual, expected, message)                                                                     \
  do {                                                                                                                 \
    const std::string actual_ = (actual);                                                                              \
    const std::string expected_ = (expected);                                                                          \
    if (actual_ != expected_) {                                                                                        \
      throw std::runtime_error("Assertion failed: " + std::string(message) + "\n--- expected\n" + expected_ +          \
                               "\n--- actual\n" + actual_ + "\n---");                                                  \
    }                                                                                                                  \
  } while (0)

// Expects `statement` to throw `exception_type`
#define TEST_ASSERT_THROWS(statement, exception_type, message)                                                         \
  do {                                                                                                                 \
    bool thrown_ = false;                                                                                              \
    try {                                                                                                              \
      statement;                                                                                                       \
    } catch (const exception_type &) {                                                                                 \
      thrown_ = true;                                                                                                  \
    }                                                                                                                  \
    if (!thrown_) {                                                                                                    \
      throw std::runtime_error("Assertion failed: " + std::string(message) + " (expected " #exception_type ")");       \
    }                                                                                                                  \
  } while (0)

// Standardized test output functions
class TestLogger {
public:
  static void log_test(const std::string &test_name) {
    std::cout << test_colors::YELLOW << "Testing " << test_name << "..." << test_colors::NC << std::endl;
  }

  static void log_pass(const std::string &message) {
    std::cout << test_colors::GREEN << "✓ " << message << test_colors::NC << std::endl;
  }

  static void log_fail(const std::string &message) {
    std::cerr << test_colors::RED << "✗ " << message << test_colors::NC << std::endl;
  }

  static void log_header(const std::string &test_suite_name) {
    std::cout << test_colors::GREEN << "=== " << test_suite_name << " ===" << test_colors::NC << std::endl;
  }

  static void log_summary(int passed, int total, const std::string &test_type = "tests") {
    std::cout << std::endl;
    if (passed == total) {
      std::cout << test_colors::GREEN << "✔ All " << test_type << " passed! (" << passed << "/" << total << ")"
                << test_colors::NC << std::endl;
    } else {
      int failed = total - passed;
      std::cout << test_colors::RED << "✗ Some " << test_type << " failed. (" << failed << "/" << total << " failures)"
                << test_colors::NC << std::endl;
    }
  }
};

// Runs one test function, logging a failure instead of letting it escape
class TestRunner {
private:
  int total_ = 0;
  int passed_ = 0;

public:
  void run(const std::string &name, const std::function<void()> &test) {
    ++total_;
    try {
      test();
      ++passed_;
    } catch (const std::exception &e) {
      TestLogger::log_fail(name + " failed: " + e.what());
    }
  }

  // Exit code for main()
  int finish(const std::string &test_type = "tests") const {
    TestLogger::log_summary(passed_, total_, test_type);
    return passed_ == total_ ? 0 : 1;
  }
};
