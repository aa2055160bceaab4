#include "executor/hints.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"

namespace executor {

namespace {

const constexpr size_t kExcerptLength = 100;

bool ContainsAny(const std::string& text,
                 std::initializer_list<const char*> keywords) {
  return std::any_of(keywords.begin(), keywords.end(),
                     [&text](const char* keyword) {
                       return absl::StrContains(text, keyword);
                     });
}

std::string Excerpt(const std::string& prefix, const std::string& error) {
  return prefix + error.substr(0, kExcerptLength) + "...";
}

std::string CompilationHint(const std::string& error,
                            proto::Language language) {
  if (error.empty()) return "Check your code syntax.";
  std::string lower = absl::AsciiStrToLower(error);
  if (ContainsAny(lower,
                  {"cannot find symbol", "was not declared", "is not defined"}))
    return "Variable or method not found. Check spelling and make sure "
           "you've declared all variables.";
  if (ContainsAny(lower, {"expected"}))
    return "Syntax error detected. Check for missing semicolons, brackets, or "
           "parentheses.";
  if (language == proto::JAVA && ContainsAny(lower, {"class"}))
    return "Java class issues. Make sure your class name matches the filename "
           "and is properly structured.";
  return Excerpt("Compilation error: ", error);
}

std::string RuntimeHint(const std::string& error) {
  if (error.empty()) return "Runtime error occurred. Check your program logic.";
  std::string lower = absl::AsciiStrToLower(error);
  if (ContainsAny(lower, {"nullpointerexception", "nonetype", "of undefined",
                          "of null", "is undefined", "is null"}))
    return "Null pointer error. Make sure you initialize your variables before "
           "using them.";
  if (ContainsAny(lower, {"arrayindexoutofbounds", "indexoutofbounds",
                          "index out of range", "out_of_range",
                          "out of bounds", "invalid array length"}))
    return "Array index error. Check that your array indices are within valid "
           "bounds.";
  if (ContainsAny(lower, {"dividebyzero", "division by zero", "/ by zero",
                          "zerodivisionerror", "floating point exception"}))
    return "Division by zero error. Make sure you're not dividing by zero in "
           "your calculations.";
  if (ContainsAny(lower, {"stackoverflowerror", "recursionerror",
                          "maximum call stack", "stack overflow",
                          "maximum recursion depth"}))
    return "Stack overflow. Make sure your recursion has a base case that is "
           "always reached.";
  if (ContainsAny(lower, {"is not defined", "nameerror"}))
    return "Variable or method not found. Check spelling and make sure "
           "you've declared all variables.";
  return Excerpt("Runtime error: ", error);
}

}  // namespace

std::string Hint(proto::ExecutionStatus status, const std::string& error_text,
                 proto::Language language) {
  switch (status) {
    case proto::SUCCESS:
      return "Code executed successfully! No hints needed.";
    case proto::COMPILATION_ERROR:
      return CompilationHint(error_text, language);
    case proto::RUNTIME_ERROR:
      return RuntimeHint(error_text);
    case proto::TIMEOUT:
      return "Your code is taking too long to execute. Check for infinite "
             "loops or optimize your algorithm.";
    case proto::MEMORY_LIMIT_EXCEEDED:
      return "Your code is using too much memory. Consider using more "
             "efficient data structures.";
    case proto::SECURITY_VIOLATION:
      return "Your code contains potentially unsafe operations. Stick to basic "
             "programming constructs for learning.";
    default:
      return "Something went wrong. Check your code syntax and logic.";
  }
}

}  // namespace executor
