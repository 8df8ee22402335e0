#include "evaluator/code_evaluator.hpp"

#include <dirent.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <thread>

#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "session/errors.hpp"
#include "session/session_store.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/user.hpp"
#include "util/which.hpp"

namespace {

using evaluator::CodeEvaluator;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Return;

const std::string test_tmpdir = "/tmp/sessionbox_testdir";

CodeEvaluator::IOCases Cases(
    const std::vector<std::pair<std::string, std::string>>& cases) {
  CodeEvaluator::IOCases io_cases;
  for (const auto& c : cases) {
    proto::IOCase* io_case = io_cases.Add();
    io_case->set_input(c.first);
    io_case->set_output(c.second);
  }
  return io_cases;
}

std::vector<std::string> ListDir(const std::string& path) {
  std::vector<std::string> names;
  std::unique_ptr<DIR, decltype(&closedir)> dir{opendir(path.c_str()),
                                                &closedir};
  if (!dir) return names;
  while (struct dirent* ent = readdir(dir.get())) {
    std::string name = ent->d_name;
    if (name != "." && name != "..") names.push_back(name);
  }
  return names;
}

class CodeEvaluatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    python_ = util::which("python3");
    ASSERT_FALSE(python_.empty()) << "python3 is required";
    root_ = std::make_unique<util::TempDir>(test_tmpdir, "eval");
    evaluator_ = std::make_unique<CodeEvaluator>(&executor_, python_, 4);
    limits_.wall_time_ms = 5000;
    limits_.cpu_time_ms = 4000;
    limits_.memory_kb = 1024 * 1024;
  }

  proto::EvaluationReport Evaluate(
      const std::string& code, const std::string& entry_point,
      const std::vector<std::pair<std::string, std::string>>& cases) {
    return evaluator_->Evaluate(root_->Path(), code, entry_point, Cases(cases),
                                limits_);
  }

  std::string python_;
  std::unique_ptr<util::TempDir> root_;
  executor::LocalExecutor executor_;
  std::unique_ptr<CodeEvaluator> evaluator_;
  executor::Limits limits_;
};

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, Add) {
  proto::EvaluationReport report =
      Evaluate("def add(a, b):\n    return a + b\n", "add",
               {{"a=1,b=2", "3"}, {"a=5,b=5", "10"}});
  EXPECT_TRUE(report.passed());
  EXPECT_EQ(report.error(), "");
  ASSERT_EQ(report.case_results_size(), 2);
  for (const proto::CaseResult& result : report.case_results()) {
    EXPECT_TRUE(result.passed()) << result.error();
    EXPECT_EQ(result.status(), proto::Status::SUCCESS);
  }
  EXPECT_EQ(report.case_results(0).actual_output(), "3");
  EXPECT_EQ(report.case_results(1).actual_output(), "10");
  EXPECT_EQ(report.case_results(1).input(), "a=5,b=5");
  EXPECT_EQ(report.case_results(1).expected_output(), "10");
  // The temporary module is gone.
  EXPECT_THAT(ListDir(root_->Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, WrongAnswer) {
  proto::EvaluationReport report = Evaluate(
      "def add(a, b):\n    return a - b\n", "add", {{"a=1,b=2", "3"}});
  EXPECT_FALSE(report.passed());
  ASSERT_EQ(report.case_results_size(), 1);
  EXPECT_FALSE(report.case_results(0).passed());
  EXPECT_EQ(report.case_results(0).status(), proto::Status::SUCCESS);
  EXPECT_EQ(report.case_results(0).actual_output(), "-1");
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, PositionalAndStructuredValues) {
  proto::EvaluationReport report = Evaluate(
      "def f(xs):\n"
      "    print('noise')\n"
      "    return {'sum': sum(xs), 'sorted': tuple(sorted(xs)), 'half': "
      "sum(xs) / 2, 'set': set(xs)}\n",
      "f", {{"[3, 1, 2]", "{'sum': 6, 'sorted': [1, 2, 3], 'half': 3, "
                          "'set': {1, 2, 3}}"},
            {"", "None"}});
  ASSERT_EQ(report.case_results_size(), 2);
  EXPECT_TRUE(report.case_results(0).passed())
      << report.case_results(0).actual_output();
  EXPECT_FALSE(report.case_results(1).passed());
  EXPECT_EQ(report.case_results(1).status(), proto::Status::NONZERO);
  EXPECT_THAT(report.case_results(1).error(), HasSubstr("TypeError"));
  EXPECT_FALSE(report.passed());
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, MethodEntryPoint) {
  proto::EvaluationReport report = Evaluate(
      "class Solution:\n"
      "    def two_sum(self, nums, target):\n"
      "        seen = {}\n"
      "        for i, n in enumerate(nums):\n"
      "            if target - n in seen:\n"
      "                return [seen[target - n], i]\n"
      "            seen[n] = i\n",
      "Solution().two_sum",
      {{"nums=[2, 7, 11, 15], target=9", "[0, 1]"},
       {"nums=[3, 2, 4], target=6", "[1, 2]"}});
  EXPECT_TRUE(report.passed()) << report.error();
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, StringsAndBigIntegers) {
  proto::EvaluationReport report = Evaluate(
      "def f(s, n):\n    return s.upper() + '\\n', 2 ** n\n", "f",
      {{"s='caffè', n=100", "('CAFFÈ\\n', 1267650600228229401496703205376)"}});
  EXPECT_TRUE(report.passed()) << report.case_results(0).actual_output();
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, InfiniteLoop) {
  limits_.wall_time_ms = 500;
  proto::EvaluationReport report = Evaluate(
      "import time\ndef f():\n    while True:\n        time.sleep(1)\n", "f",
      {{"", "None"}});
  EXPECT_FALSE(report.passed());
  ASSERT_EQ(report.case_results_size(), 1);
  EXPECT_EQ(report.case_results(0).status(), proto::Status::WALL_TIME_LIMIT);
  EXPECT_FALSE(report.case_results(0).passed());
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, BusyLoop) {
  limits_.wall_time_ms = 500;
  proto::EvaluationReport report =
      Evaluate("def f():\n    while True:\n        pass\n", "f",
               {{"", "None"}, {"", "None"}});
  EXPECT_FALSE(report.passed());
  ASSERT_EQ(report.case_results_size(), 2);
  for (const proto::CaseResult& result : report.case_results()) {
    EXPECT_EQ(result.status(), proto::Status::WALL_TIME_LIMIT);
    EXPECT_FALSE(result.passed());
  }
  EXPECT_THAT(ListDir(root_->Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, EvaluatesAsSandboxUser) {
  if (geteuid() != 0 || getpwnam("nobody") == nullptr) {
    GTEST_SKIP() << "Needs root and the nobody user";
  }
  uid_t nobody = getpwnam("nobody")->pw_uid;
  gflags::FlagSaver saver;
  FLAGS_sandbox_user = "nobody";
  ASSERT_EQ(chmod(root_->Path().c_str(), 0755), 0);
  session::SessionStore store(root_->Path(), util::SandboxUser());
  std::string root = store.GetOrCreate("as-nobody");
  struct stat st {};
  ASSERT_EQ(stat(root.c_str(), &st), 0);
  EXPECT_EQ(st.st_uid, nobody);

  executor::LocalExecutor executor;
  CodeEvaluator evaluator(&executor, python_, 1);
  proto::EvaluationReport report = evaluator.Evaluate(
      root,
      "import os\ndef f(a):\n    open('out.txt', 'w').write(str(a))\n"
      "    return os.getuid()\n",
      "f", Cases({{"a=7", std::to_string(nobody)}}), limits_);
  EXPECT_TRUE(report.passed()) << report.error();
  ASSERT_EQ(report.case_results_size(), 1);
  EXPECT_TRUE(report.case_results(0).passed())
      << report.case_results(0).error();
  EXPECT_EQ(util::File::Read(util::File::JoinPath(root, "out.txt")), "7");
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, SyntaxError) {
  proto::EvaluationReport report =
      Evaluate("def f(:\n", "f", {{"", "1"}, {"", "2"}});
  EXPECT_FALSE(report.passed());
  EXPECT_THAT(report.error(), HasSubstr("SyntaxError"));
  ASSERT_EQ(report.case_results_size(), 2);
  for (const proto::CaseResult& result : report.case_results()) {
    EXPECT_FALSE(result.passed());
    EXPECT_EQ(result.status(), proto::Status::NOT_RUN);
    EXPECT_EQ(result.error(), "not run");
  }
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, MissingEntryPoint) {
  proto::EvaluationReport report =
      Evaluate("def f():\n    return 1\n", "g", {{"", "1"}});
  EXPECT_FALSE(report.passed());
  EXPECT_THAT(report.error(), HasSubstr("NameError"));
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, InvalidEntryPoint) {
  EXPECT_THROW(Evaluate("", "", {}), session::invalid_input);  // NOLINT
  EXPECT_THROW(Evaluate("", "f\nimport os", {}),             // NOLINT
               session::invalid_input);
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, InvalidInput) {
  proto::EvaluationReport report =
      Evaluate("def f(x):\n    return x\n", "f", {{"[1, 2", "1"}, {"1", "1"}});
  ASSERT_EQ(report.case_results_size(), 2);
  EXPECT_EQ(report.case_results(0).status(), proto::Status::NOT_RUN);
  EXPECT_THAT(report.case_results(0).error(), HasSubstr("invalid input"));
  EXPECT_TRUE(report.case_results(1).passed());
  EXPECT_FALSE(report.passed());
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, UnparsableOutputComparesText) {
  proto::EvaluationReport report = Evaluate(
      "class P:\n    def __repr__(self):\n        return '<P>'\n"
      "def f():\n    return P()\n",
      "f", {{"", " <P> "}});
  EXPECT_TRUE(report.passed()) << report.case_results(0).actual_output();
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, ModulesInSessionCanBeImported) {
  util::File::Write(util::File::JoinPath(root_->Path(), "helper.py"),
                    "VALUE = 42\n");
  proto::EvaluationReport report = Evaluate(
      "import helper\ndef f():\n    return helper.VALUE\n", "f", {{"", "42"}});
  EXPECT_TRUE(report.passed()) << report.error();
}

// NOLINTNEXTLINE
TEST_F(CodeEvaluatorTest, ConcurrentSessionsAreIsolated) {
  util::TempDir other(test_tmpdir, "eval");
  const std::string code =
      "import os\n"
      "def f(v):\n"
      "    with open('state.txt', 'a') as out:\n"
      "        out.write(v)\n"
      "    return sorted(os.listdir('.'))\n";
  proto::EvaluationReport first;
  proto::EvaluationReport second;
  std::thread t1([&]() {
    first = evaluator_->Evaluate(root_->Path(), code, "f", Cases({{"'a'", ""}}),
                                 limits_);
  });
  std::thread t2([&]() {
    second = evaluator_->Evaluate(other.Path(), code, "f",
                                  Cases({{"'b'", ""}}), limits_);
  });
  t1.join();
  t2.join();
  EXPECT_EQ(util::File::Read(util::File::JoinPath(root_->Path(), "state.txt")),
            "a");
  EXPECT_EQ(util::File::Read(util::File::JoinPath(other.Path(), "state.txt")),
            "b");
  ASSERT_EQ(first.case_results_size(), 1);
  ASSERT_EQ(second.case_results_size(), 1);
  EXPECT_THAT(first.case_results(0).actual_output(), HasSubstr("state.txt"));
  EXPECT_EQ(first.case_results(0).status(), proto::Status::SUCCESS);
  EXPECT_EQ(second.case_results(0).status(), proto::Status::SUCCESS);
}

class MockExecutor : public executor::Executor {
 public:
  MOCK_METHOD3(Run, proto::ExecutionResult(const std::string&,
                                           const std::vector<std::string>&,
                                           const executor::Limits&));
};

// NOLINTNEXTLINE
TEST(CodeEvaluatorMockTest, LoadFailureRunsNothingElse) {
  util::TempDir root(test_tmpdir, "eval");
  MockExecutor executor;
  proto::ExecutionResult timeout;
  timeout.set_status(proto::Status::WALL_TIME_LIMIT);
  timeout.set_error_message("Wall limit exceeded");
  EXPECT_CALL(executor, Run(root.Path(), _, _))
      .Times(1)
      .WillOnce(Return(timeout));
  CodeEvaluator evaluator(&executor, "python3", 2);
  proto::EvaluationReport report = evaluator.Evaluate(
      root.Path(), "import time\ntime.sleep(100)\n", "f",
      Cases({{"", "1"}, {"", "2"}, {"", "3"}}), executor::Limits());
  EXPECT_FALSE(report.passed());
  EXPECT_EQ(report.error(), "Wall limit exceeded");
  ASSERT_EQ(report.case_results_size(), 3);
  EXPECT_EQ(report.case_results(2).expected_output(), "3");
  EXPECT_EQ(report.case_results(2).status(), proto::Status::NOT_RUN);
}

// NOLINTNEXTLINE
TEST(CodeEvaluatorMockTest, MemoryErrorIsMemoryLimit) {
  util::TempDir root(test_tmpdir, "eval");
  MockExecutor executor;
  proto::ExecutionResult ok;
  ok.set_status(proto::Status::SUCCESS);
  proto::ExecutionResult oom;
  oom.set_status(proto::Status::NONZERO);
  oom.set_status_code(3);
  oom.set_stdout_data("MemoryError: \nTraceback...");
  EXPECT_CALL(executor, Run(_, _, _))
      .WillOnce(Return(ok))
      .WillOnce(Return(oom));
  CodeEvaluator evaluator(&executor, "python3", 1);
  proto::EvaluationReport report =
      evaluator.Evaluate(root.Path(), "def f(): pass\n", "f",
                         Cases({{"", "None"}}), executor::Limits());
  ASSERT_EQ(report.case_results_size(), 1);
  EXPECT_EQ(report.case_results(0).status(), proto::Status::MEMORY_LIMIT);
  EXPECT_THAT(report.case_results(0).error(), HasSubstr("MemoryError"));
  EXPECT_FALSE(report.passed());
}

// NOLINTNEXTLINE
TEST(CodeEvaluatorMockTest, ResultsKeepCaseOrder) {
  util::TempDir root(test_tmpdir, "eval");
  MockExecutor executor;
  proto::ExecutionResult ok;
  ok.set_status(proto::Status::SUCCESS);
  EXPECT_CALL(executor, Run(_, _, _))
      .WillRepeatedly([&ok](const std::string&,
                            const std::vector<std::string>& command,
                            const executor::Limits&) {
        proto::ExecutionResult result = ok;
        if (command[5] == "call") {
          // Echo the argument back, read from the encoded arguments file.
          std::string args = util::File::Read(command[8]);
          result.set_stdout_data(args.substr(args.find("('i','") + 6, 2));
        }
        return result;
      });
  CodeEvaluator evaluator(&executor, "python3", 4);
  CodeEvaluator::IOCases cases;
  for (int i = 10; i < 50; i++) {
    proto::IOCase* io_case = cases.Add();
    io_case->set_input(std::to_string(i));
    io_case->set_output(std::to_string(i));
  }
  proto::EvaluationReport report = evaluator.Evaluate(
      root.Path(), "def f(x): return x\n", "f", cases, executor::Limits());
  ASSERT_EQ(report.case_results_size(), 40);
  for (int i = 0; i < 40; i++) {
    EXPECT_EQ(report.case_results(i).input(), std::to_string(i + 10));
    EXPECT_TRUE(report.case_results(i).passed()) << i;
  }
  EXPECT_TRUE(report.passed());
}

}  // namespace
