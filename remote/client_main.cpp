#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "remote/client.hpp"
#include "util/file.hpp"

DEFINE_string(server, "127.0.0.1:6000", "server to connect to");
DEFINE_string(session, "", "session to operate on");
DEFINE_int64(timeout_ms, 120000, "deadline of each call, 0 for none");
DEFINE_int64(wall_time_ms, 0, "wall time limit for run and eval");
DEFINE_int64(cpu_time_ms, 0, "CPU time limit for run and eval");
DEFINE_int64(memory_kb, 0, "memory limit for run and eval");

namespace {

static const constexpr char* kUsage =
    "Usage: sessionbox_client [flags] <command> [args]\n"
    "Commands:\n"
    "  ping\n"
    "  new\n"
    "  run <shell command>\n"
    "  read <path>\n"
    "  write <path> [local file, default stdin]\n"
    "  delete <path>\n"
    "  rename <old path> <new path>\n"
    "  fork\n"
    "  eval <code file> <entry point> <cases file>\n"
    "The cases file has one case per line, input and expected output "
    "separated by a tab.";

proto::Resources Limits() {
  proto::Resources limits;
  limits.set_wall_time_ms(FLAGS_wall_time_ms);
  limits.set_cpu_time_ms(FLAGS_cpu_time_ms);
  limits.set_memory_kb(FLAGS_memory_kb);
  return limits;
}

std::string ReadStdin() {
  return std::string(std::istreambuf_iterator<char>(std::cin),
                     std::istreambuf_iterator<char>());
}

int Evaluate(remote::Client* client, const std::string& code_file,
             const std::string& entry_point, const std::string& cases_file) {
  proto::EvaluateRequest request;
  request.set_session_id(FLAGS_session);
  request.set_code(util::File::Read(code_file));
  request.set_entry_point(entry_point);
  *request.mutable_limits() = Limits();
  for (absl::string_view line :
       absl::StrSplit(util::File::Read(cases_file), '\n', absl::SkipEmpty())) {
    std::vector<std::string> fields =
        absl::StrSplit(line, absl::MaxSplits('\t', 1));
    proto::IOCase* io_case = request.add_io_cases();
    io_case->set_input(fields[0]);
    if (fields.size() > 1) io_case->set_output(fields[1]);
  }
  proto::EvaluationReport report = client->Evaluate(request);
  if (!report.error().empty()) {
    std::cout << "Error: " << report.error() << std::endl;
  }
  for (int i = 0; i < report.case_results_size(); i++) {
    const proto::CaseResult& result = report.case_results(i);
    std::cout << "Case " << i << ": " << (result.passed() ? "passed" : "FAILED")
              << " [" << proto::Status_Name(result.status()) << "]"
              << " input: " << result.input()
              << " expected: " << result.expected_output()
              << " got: " << result.actual_output() << std::endl;
    if (!result.error().empty()) {
      std::cout << "  " << result.error() << std::endl;
    }
  }
  std::cout << (report.passed() ? "PASSED" : "FAILED") << std::endl;
  return report.passed() ? 0 : 1;
}

int Dispatch(remote::Client* client, const std::vector<std::string>& args) {
  const std::string& command = args[0];
  auto need = [&args](size_t count) {
    if (args.size() < count + 1) {
      throw std::invalid_argument(args[0] + " needs " + std::to_string(count) +
                                  " arguments");
    }
  };
  if (command == "ping") {
    std::cout << client->Ping() << std::endl;
    return 0;
  }
  if (command == "new") {
    std::cout << remote::Client::CreateSession() << std::endl;
    return 0;
  }
  if (FLAGS_session.empty()) {
    throw std::invalid_argument("--session is required for " + command);
  }
  if (command == "run") {
    need(1);
    std::vector<std::string> words(args.begin() + 1, args.end());
    proto::RunResponse response =
        client->Run(FLAGS_session, absl::StrJoin(words, " "), Limits());
    std::cout << response.stdout_data();
    std::cerr << response.stderr_data();
    const proto::ExecutionResult& result = response.result();
    if (result.status() != proto::Status::SUCCESS) {
      std::cerr << proto::Status_Name(result.status()) << ": "
                << result.error_message() << std::endl;
    }
    return result.status() == proto::Status::NONZERO ? result.status_code()
           : result.status() == proto::Status::SUCCESS ? 0
                                                        : 1;
  }
  if (command == "read") {
    need(1);
    std::cout << client->ReadFile(FLAGS_session, args[1]);
    return 0;
  }
  if (command == "write") {
    need(1);
    std::string content =
        args.size() > 2 ? util::File::Read(args[2]) : ReadStdin();
    client->WriteFile(FLAGS_session, args[1], content);
    return 0;
  }
  if (command == "delete") {
    need(1);
    client->DeleteFile(FLAGS_session, args[1]);
    return 0;
  }
  if (command == "rename") {
    need(2);
    client->RenameFile(FLAGS_session, args[1], args[2]);
    return 0;
  }
  if (command == "fork") {
    std::cout << client->ForkSession(FLAGS_session) << std::endl;
    return 0;
  }
  if (command == "eval") {
    need(3);
    return Evaluate(client, args[1], args[2], args[3]);
  }
  throw std::invalid_argument("Unknown command: " + command);
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  if (argc < 2) {
    std::cerr << kUsage << std::endl;
    return 2;
  }
  std::vector<std::string> args(argv + 1, argv + argc);
  std::unique_ptr<remote::Client> client =
      remote::Client::Connect(FLAGS_server, FLAGS_timeout_ms);
  try {
    return Dispatch(client.get(), args);
  } catch (const remote::server_error& e) {
    LOG(ERROR) << "Server error " << e.code() << ": " << e.what();
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl << kUsage << std::endl;
    return 2;
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}
