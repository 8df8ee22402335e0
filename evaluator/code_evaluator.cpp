#include "evaluator/code_evaluator.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "evaluator/harness.hpp"
#include "evaluator/literal.hpp"
#include "glog/logging.h"
#include "session/errors.hpp"
#include "util/file.hpp"

namespace {
static const constexpr char* kTempPrefix = ".eval_";
static const constexpr char* kNotRun = "not run";

// The error of a harness run that did not succeed.
std::string Describe(const proto::ExecutionResult& result) {
  if (result.status() != proto::Status::NONZERO) {
    return result.error_message();
  }
  switch (result.status_code()) {
    case evaluator::Harness::kException:
    case evaluator::Harness::kLoadError:
    case evaluator::Harness::kMemoryError:
      if (!result.stdout_data().empty()) {
        return std::string(absl::StripTrailingAsciiWhitespace(
            result.stdout_data()));
      }
      break;
    default:
      break;
  }
  return absl::StrCat("exit code ", result.status_code(), ": ",
                      result.stderr_data());
}

proto::Status CaseStatus(const proto::ExecutionResult& result) {
  if (result.status() == proto::Status::NONZERO &&
      result.status_code() == evaluator::Harness::kMemoryError) {
    return proto::Status::MEMORY_LIMIT;
  }
  return result.status();
}

void ValidateEntryPoint(const std::string& entry_point) {
  if (entry_point.empty()) {
    throw session::invalid_input("entry_point is empty");
  }
  if (entry_point.find_first_of(std::string("\n\r\0", 3)) !=
      std::string::npos) {
    throw session::invalid_input("entry_point must be a single line");
  }
}
}  // namespace

namespace evaluator {

CodeEvaluator::CodeEvaluator(executor::Executor* executor, std::string python,
                             size_t num_workers)
    : executor_(executor),
      python_(std::move(python)),
      num_workers_(num_workers) {
  if (num_workers_ == 0) num_workers_ = std::thread::hardware_concurrency();
  if (num_workers_ == 0) num_workers_ = 1;
}

proto::EvaluationReport CodeEvaluator::Evaluate(
    const std::string& root, const std::string& code,
    const std::string& entry_point, const IOCases& io_cases,
    const executor::Limits& limits) {
  ValidateEntryPoint(entry_point);

  proto::EvaluationReport report;
  for (const proto::IOCase& io_case : io_cases) {
    proto::CaseResult* result = report.add_case_results();
    result->set_input(io_case.input());
    result->set_expected_output(io_case.output());
  }

  util::TempFile module(root, kTempPrefix, ".py", code);
  proto::ExecutionResult check = executor_->Run(
      root, Harness::CheckCommand(python_, module.Path(), entry_point), limits);
  if (check.status() != proto::Status::SUCCESS) {
    report.set_error(Describe(check));
    for (proto::CaseResult& result : *report.mutable_case_results()) {
      result.set_passed(false);
      result.set_status(proto::Status::NOT_RUN);
      result.set_error(kNotRun);
    }
    report.set_passed(false);
    VLOG(1) << "Submission failed to load: " << report.error();
    return report;
  }

  // Every case writes only its own slot.
  const size_t num_cases = report.case_results_size();
  std::atomic<size_t> next{0};
  auto worker = [&]() {
    for (size_t i = next++; i < num_cases; i = next++) {
      proto::CaseResult* result =
          report.mutable_case_results(static_cast<int>(i));
      try {
        RunCase(root, module.Path(), entry_point, limits, result);
      } catch (const std::exception& exc) {
        LOG(ERROR) << "Evaluation of case " << i << " failed: " << exc.what();
        result->set_passed(false);
        result->set_status(proto::Status::INTERNAL_ERROR);
        result->set_error(exc.what());
      }
    }
  };
  std::vector<std::thread> threads(std::min(num_workers_, num_cases));
  for (std::thread& thread : threads) thread = std::thread(worker);
  for (std::thread& thread : threads) thread.join();

  bool passed = true;
  for (const proto::CaseResult& result : report.case_results()) {
    passed = passed && result.passed();
  }
  report.set_passed(passed);
  return report;
}

void CodeEvaluator::RunCase(const std::string& root,
                            const std::string& module_path,
                            const std::string& entry_point,
                            const executor::Limits& limits,
                            proto::CaseResult* result) {
  result->set_passed(false);
  Arguments args;
  try {
    args = ParseArguments(result->input());
  } catch (const parse_error& exc) {
    result->set_status(proto::Status::NOT_RUN);
    result->set_error(absl::StrCat("invalid input: ", exc.what()));
    return;
  }

  util::TempFile args_file(root, kTempPrefix, ".args",
                           Harness::EncodeArguments(args));
  proto::ExecutionResult execution = executor_->Run(
      root,
      Harness::CallCommand(python_, module_path, entry_point, args_file.Path()),
      limits);
  result->set_status(CaseStatus(execution));
  if (execution.status() != proto::Status::SUCCESS) {
    result->set_error(Describe(execution));
    return;
  }
  result->set_actual_output(execution.stdout_data());
  if (execution.stdout_truncated()) {
    result->set_error("output too long");
    return;
  }
  try {
    result->set_passed(Equals(Parse(execution.stdout_data()),
                              Parse(result->expected_output())));
  } catch (const parse_error&) {
    // Not a literal, e.g. the repr of an object: compare the text.
    result->set_passed(absl::StripAsciiWhitespace(execution.stdout_data()) ==
                       absl::StripAsciiWhitespace(result->expected_output()));
  }
}

}  // namespace evaluator
