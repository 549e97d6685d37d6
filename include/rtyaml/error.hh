#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace rtyaml {

// Initialize LLVM components required for DWARF debug info handling
// This function should be called once before any exception throwing
// to ensure proper stack trace capture with source-level information
void initialize_llvm_components();

// Root of the rtyaml exception hierarchy, captures the stack trace at the throw site
class Exception : public std::runtime_error {
private:
  std::string stack_trace_;

public:
  // Explicit constructors that capture stack trace immediately
  explicit Exception(const std::string &message);

  const std::string &stack_trace() const;
};

// Position in the input stream, line and column are 0-based
struct Mark {
  std::string name;
  std::size_t index = 0;
  std::size_t line = 0;
  std::size_t column = 0;
  std::shared_ptr<const std::u32string> buffer; // decoded input, absent for marks made on dump
  std::size_t pointer = 0;

  Mark() = default;
  Mark(std::string name, std::size_t index, std::size_t line, std::size_t column,
       std::shared_ptr<const std::u32string> buffer = nullptr, std::size_t pointer = 0)
      : name(std::move(name)), index(index), line(line), column(column), buffer(std::move(buffer)),
        pointer(pointer) {}

  // A mark that only knows its column, used for comments created by the host program
  static Mark at_column(std::size_t column) {
    Mark m;
    m.column = column;
    return m;
  }

  // The offending source line with a caret under the mark, or empty without a buffer
  std::string get_snippet(int indent = 4, std::size_t max_length = 75) const;

  // `  in "<name>", line L, column C` followed by the snippet
  std::string str() const;

  bool operator==(const Mark &other) const {
    return line == other.line && column == other.column && name == other.name && index == other.index;
  }
};

// Error with two source positions: where the ambiguous context began, and where the problem was found
class MarkedError : public Exception {
private:
  std::string context_;
  std::optional<Mark> context_mark_;
  std::string problem_;
  std::optional<Mark> problem_mark_;
  std::string note_;

public:
  MarkedError(std::string context, std::optional<Mark> context_mark, std::string problem,
              std::optional<Mark> problem_mark, std::string note = "");

  const std::string &context() const noexcept { return context_; }
  const std::optional<Mark> &context_mark() const noexcept { return context_mark_; }
  const std::string &problem() const noexcept { return problem_; }
  const std::optional<Mark> &problem_mark() const noexcept { return problem_mark_; }
  const std::string &note() const noexcept { return note_; }

  static std::string FormatErrorMessage(const std::string &context, const std::optional<Mark> &context_mark,
                                        const std::string &problem, const std::optional<Mark> &problem_mark,
                                        const std::string &note);
};

// Undecodable or non-printable input
class ReaderError : public MarkedError {
private:
  std::string name_;
  std::size_t position_;
  std::uint32_t character_;
  std::string encoding_;
  std::string reason_;

public:
  ReaderError(std::string name, std::size_t position, std::uint32_t character, std::string encoding,
              std::string reason);

  const std::string &name() const noexcept { return name_; }
  std::size_t position() const noexcept { return position_; }
  std::uint32_t character() const noexcept { return character_; }
  const std::string &encoding() const noexcept { return encoding_; }
  const std::string &reason() const noexcept { return reason_; }
};

class ScannerError : public MarkedError {
public:
  using MarkedError::MarkedError;
};

class ParserError : public MarkedError {
public:
  using MarkedError::MarkedError;
};

class ComposerError : public MarkedError {
public:
  using MarkedError::MarkedError;
};

class ConstructorError : public MarkedError {
public:
  using MarkedError::MarkedError;
};

class DuplicateKeyError : public ConstructorError {
public:
  using ConstructorError::ConstructorError;
};

class EmitterError : public Exception {
public:
  using Exception::Exception;
};

class SerializerError : public Exception {
public:
  using Exception::Exception;
};

class RepresenterError : public Exception {
public:
  using Exception::Exception;
};

// Missing or unusable output stream
class StreamError : public Exception {
public:
  using Exception::Exception;
};

// Non-fatal conditions, reported through a WarningHandler
enum class WarningKind { DuplicateKey, MantissaNoDot, ReusedAnchor, Version };

struct MarkedWarning {
  WarningKind kind;
  std::string context;
  std::optional<Mark> context_mark;
  std::string problem;
  std::optional<Mark> problem_mark;
  std::string note;

  std::string str() const {
    return MarkedError::FormatErrorMessage(context, context_mark, problem, problem_mark, note);
  }
};

using WarningHandler = std::function<void(const MarkedWarning &)>;

// Logs `Warning: <text>` to std::cerr
void default_warning_handler(const MarkedWarning &warning);

// How a condition that is a warning by default gets reported
enum class DuplicateKeyPolicy { Warn, Error, Allow };
enum class MantissaPolicy { Warn, Error };

} // namespace rtyaml
