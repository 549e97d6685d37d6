#include "rtyaml/error.hh"
#include "rtyaml/di.hh"
#include "rtyaml/unicode.hh"

#include <cstdio>
#include <execinfo.h>
#include <iostream>
#include <sstream>

namespace rtyaml {

namespace {

constexpr int MAX_BACKTRACE_FRAMES = 64;

__attribute__((noinline)) std::string captureStackTrace() {
  void *frames[MAX_BACKTRACE_FRAMES];
  int depth = backtrace(frames, MAX_BACKTRACE_FRAMES);
  std::ostringstream oss;
  // frame 0 is this function, frame 1 the Exception constructor
  for (int i = 2; i < depth; ++i) {
    formatBacktraceFrame(i - 2, frames[i], oss);
    oss << "\n";
  }
  return oss.str();
}

bool same_position(const Mark &a, const Mark &b) {
  return a.name == b.name && a.line == b.line && a.column == b.column;
}

std::string reader_message(const std::string &name, std::size_t position, std::uint32_t character,
                           const std::string &encoding, const std::string &reason) {
  char head[96];
  if (!encoding.empty()) {
    std::snprintf(head, sizeof(head), "'%s' codec can't decode byte #x%02x: ", encoding.c_str(), character);
  } else {
    std::snprintf(head, sizeof(head), "unacceptable character #x%04x: ", character);
  }
  return std::string(head) + reason + "\n  in \"" + name + "\", position " + std::to_string(position);
}

} // namespace

Exception::Exception(const std::string &message) : std::runtime_error(message), stack_trace_(captureStackTrace()) {}

const std::string &Exception::stack_trace() const { return stack_trace_; }

std::string Mark::get_snippet(int indent, std::size_t max_length) const {
  if (!buffer) {
    return "";
  }
  const std::u32string &buf = *buffer;
  const std::size_t half = max_length / 2 - 1;

  std::u32string head;
  std::size_t start = pointer;
  while (start > 0 && !is_break_z(buf[start - 1])) {
    --start;
    if (pointer - start > half) {
      head = U" ... ";
      start += 5;
      break;
    }
  }
  std::u32string tail;
  std::size_t end = pointer;
  while (end < buf.size() && !is_break_z(buf[end])) {
    ++end;
    if (end - pointer > half) {
      tail = U" ... ";
      end -= 5;
      break;
    }
  }

  std::string snippet(indent, ' ');
  snippet += to_utf8(head);
  snippet += to_utf8(std::u32string_view(buf).substr(start, end - start));
  snippet += to_utf8(tail);
  snippet += "\n";
  snippet += std::string(indent + (pointer - start) + head.size(), ' ');
  snippet += "^ (line: " + std::to_string(line + 1) + ")";
  return snippet;
}

std::string Mark::str() const {
  std::string where =
      "  in \"" + name + "\", line " + std::to_string(line + 1) + ", column " + std::to_string(column + 1);
  std::string snippet = get_snippet();
  if (!snippet.empty()) {
    where += ":\n" + snippet;
  }
  return where;
}

std::string MarkedError::FormatErrorMessage(const std::string &context, const std::optional<Mark> &context_mark,
                                            const std::string &problem, const std::optional<Mark> &problem_mark,
                                            const std::string &note) {
  std::string msg;
  auto append = [&msg](const std::string &line) {
    if (!msg.empty()) {
      msg += "\n";
    }
    msg += line;
  };
  if (!context.empty()) {
    append(context);
  }
  // the context mark is only worth printing when it points elsewhere
  if (context_mark && (problem.empty() || !problem_mark || !same_position(*context_mark, *problem_mark))) {
    append(context_mark->str());
  }
  if (!problem.empty()) {
    append(problem);
  }
  if (problem_mark) {
    append(problem_mark->str());
  }
  if (!note.empty()) {
    append(note);
  }
  return msg;
}

MarkedError::MarkedError(std::string context, std::optional<Mark> context_mark, std::string problem,
                         std::optional<Mark> problem_mark, std::string note)
    : Exception(FormatErrorMessage(context, context_mark, problem, problem_mark, note)), context_(std::move(context)),
      context_mark_(std::move(context_mark)), problem_(std::move(problem)), problem_mark_(std::move(problem_mark)),
      note_(std::move(note)) {}

ReaderError::ReaderError(std::string name, std::size_t position, std::uint32_t character, std::string encoding,
                         std::string reason)
    : MarkedError("", std::nullopt, reader_message(name, position, character, encoding, reason), std::nullopt),
      name_(std::move(name)), position_(position), character_(character), encoding_(std::move(encoding)),
      reason_(std::move(reason)) {}

void default_warning_handler(const MarkedWarning &warning) {
  std::cerr << "Warning: " << warning.str() << std::endl;
}

} // namespace rtyaml
