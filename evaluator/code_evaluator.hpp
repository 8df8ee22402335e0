#ifndef EVALUATOR_CODE_EVALUATOR_HPP
#define EVALUATOR_CODE_EVALUATOR_HPP

#include <string>

#include "executor/executor.hpp"
#include "proto/evaluation.pb.h"

namespace evaluator {

// Runs a Python function against a list of test cases, each case in its own
// sandboxed interpreter.
class CodeEvaluator {
 public:
  using IOCases = google::protobuf::RepeatedPtrField<proto::IOCase>;

  // executor must outlive the evaluator. num_workers is the maximum number
  // of cases run at the same time, 0 for the number of CPUs.
  CodeEvaluator(executor::Executor* executor, std::string python,
                size_t num_workers = 0);

  // Writes code to a temporary module inside root, checks that it loads and
  // that entry_point is callable, then runs every case with the given
  // per-case limits. Throws session::invalid_input for a malformed
  // entry_point; every other failure is reported in the result.
  proto::EvaluationReport Evaluate(const std::string& root,
                                   const std::string& code,
                                   const std::string& entry_point,
                                   const IOCases& io_cases,
                                   const executor::Limits& limits);

  CodeEvaluator(const CodeEvaluator&) = delete;
  CodeEvaluator& operator=(const CodeEvaluator&) = delete;

 private:
  // Fills the outcome fields of result by running one case.
  void RunCase(const std::string& root, const std::string& module_path,
               const std::string& entry_point, const executor::Limits& limits,
               proto::CaseResult* result);

  executor::Executor* executor_;
  std::string python_;
  size_t num_workers_;
};

}  // namespace evaluator

#endif
