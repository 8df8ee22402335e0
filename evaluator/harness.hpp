#ifndef EVALUATOR_HARNESS_HPP
#define EVALUATOR_HARNESS_HPP

#include <string>
#include <vector>

#include "evaluator/literal.hpp"

namespace evaluator {

// The Python driver that loads a submission and calls its entry point.
// Its stdout carries only the harness's own output: the repr of the result
// on success, or the error description otherwise. Prints of the submission
// go to stderr.
class Harness {
 public:
  enum ExitCode {
    kOk = 0,
    kException = 1,
    kLoadError = 2,
    kMemoryError = 3,
  };

  // Command that imports module_path and checks that entry_point evaluates
  // to a callable in its namespace.
  static std::vector<std::string> CheckCommand(const std::string& python,
                                               const std::string& module_path,
                                               const std::string& entry_point);

  // Command that calls entry_point with the arguments stored in args_path,
  // as written by EncodeArguments.
  static std::vector<std::string> CallCommand(const std::string& python,
                                              const std::string& module_path,
                                              const std::string& entry_point,
                                              const std::string& args_path);

  // Serializes args as a Python literal that the harness decodes. Strings are
  // hex encoded and numbers kept as text, so that every value (including
  // huge ints, inf and nan) survives exactly.
  static std::string EncodeArguments(const Arguments& args);

  static const char* Script();
};

}  // namespace evaluator

#endif
