#include "server/service.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "glog/logging.h"
#include "session/errors.hpp"
#include "session/file_manager.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/user.hpp"

namespace {

// Runs an RPC body, turning the exception it throws into a status.
template <typename Body>
grpc::Status Handle(const char* rpc, const std::string& session_id,
                    Body body) {
  LOG(INFO) << rpc << " session " << session_id;
  try {
    body();
    return grpc::Status::OK;
  } catch (const session::path_traversal& e) {
    LOG(INFO) << rpc << ": " << e.what();
    return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, e.what());
  } catch (const session::session_not_found& e) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, e.what());
  } catch (const util::file_not_found& e) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, e.what());
  } catch (const session::invalid_input& e) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (const std::exception& e) {
    LOG(ERROR) << rpc << " session " << session_id << ": " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
}

}  // namespace

namespace server {

SessionBoxService::SessionBoxService(const std::string& base_directory,
                                     executor::Executor* executor,
                                     const std::string& python)
    : store_(base_directory, util::SandboxUser()),
      executor_(executor),
      evaluator_(executor, python,
                 static_cast<size_t>(std::max(FLAGS_num_cores, 0))) {
  run_limits_.cpu_time_ms = FLAGS_run_cpu_limit_ms;
  run_limits_.wall_time_ms = FLAGS_run_wall_limit_ms;
  run_limits_.memory_kb = FLAGS_run_memory_limit_kb;
  eval_limits_.cpu_time_ms = FLAGS_eval_cpu_limit_ms;
  eval_limits_.wall_time_ms = FLAGS_eval_wall_limit_ms;
  eval_limits_.memory_kb = FLAGS_eval_memory_limit_kb;
}

grpc::Status SessionBoxService::Ping(grpc::ServerContext* context,
                                     const proto::PingRequest* request,
                                     proto::PingResponse* response) {
  response->set_message("ping");
  return grpc::Status::OK;
}

grpc::Status SessionBoxService::Evaluate(grpc::ServerContext* context,
                                         const proto::EvaluateRequest* request,
                                         proto::EvaluationReport* response) {
  return Handle("Evaluate", request->session_id(), [&]() {
    std::string root = store_.GetOrCreate(request->session_id());
    *response = evaluator_.Evaluate(
        root, request->code(), request->entry_point(), request->io_cases(),
        executor::Limits::Capped(request->limits(), eval_limits_));
  });
}

grpc::Status SessionBoxService::Run(grpc::ServerContext* context,
                                    const proto::RunRequest* request,
                                    proto::RunResponse* response) {
  return Handle("Run", request->session_id(), [&]() {
    if (request->cmd().empty()) {
      throw session::invalid_input("Empty command");
    }
    std::string root = store_.GetOrCreate(request->session_id());
    proto::ExecutionResult result = executor_->Run(
        root, {"/bin/sh", "-c", request->cmd()},
        executor::Limits::Capped(request->limits(), run_limits_));
    response->set_stdout_data(result.stdout_data());
    response->set_stderr_data(result.stderr_data());
    response->set_session_id(request->session_id());
    *response->mutable_result() = std::move(result);
  });
}

grpc::Status SessionBoxService::ReadFile(grpc::ServerContext* context,
                                         const proto::ReadFileRequest* request,
                                         proto::ReadFileResponse* response) {
  return Handle("ReadFile", request->session_id(), [&]() {
    std::string root = store_.GetOrCreate(request->session_id());
    response->set_content(
        session::FileManager::Read(root, request->rel_path()));
    response->set_session_id(request->session_id());
    response->set_rel_path(request->rel_path());
  });
}

grpc::Status SessionBoxService::WriteFile(
    grpc::ServerContext* context, const proto::WriteFileRequest* request,
    proto::WriteFileResponse* response) {
  return Handle("WriteFile", request->session_id(), [&]() {
    std::string root = store_.GetOrCreate(request->session_id());
    session::FileManager::Write(root, request->rel_path(), request->content());
    response->set_success(true);
    response->set_session_id(request->session_id());
    response->set_rel_path(request->rel_path());
  });
}

grpc::Status SessionBoxService::DeleteFile(
    grpc::ServerContext* context, const proto::DeleteFileRequest* request,
    proto::DeleteFileResponse* response) {
  return Handle("DeleteFile", request->session_id(), [&]() {
    std::string root = store_.GetOrCreate(request->session_id());
    session::FileManager::Delete(root, request->rel_path());
    response->set_success(true);
    response->set_session_id(request->session_id());
    response->set_rel_path(request->rel_path());
  });
}

grpc::Status SessionBoxService::RenameFile(
    grpc::ServerContext* context, const proto::RenameFileRequest* request,
    proto::RenameFileResponse* response) {
  return Handle("RenameFile", request->session_id(), [&]() {
    std::string root = store_.GetOrCreate(request->session_id());
    session::FileManager::Rename(root, request->old_path(),
                                 request->new_path());
    response->set_success(true);
    response->set_session_id(request->session_id());
    response->set_old_path(request->old_path());
    response->set_new_path(request->new_path());
  });
}

grpc::Status SessionBoxService::ForkSession(
    grpc::ServerContext* context, const proto::ForkSessionRequest* request,
    proto::ForkSessionResponse* response) {
  return Handle("ForkSession", request->session_id(), [&]() {
    response->set_new_session_id(store_.Fork(request->session_id()));
  });
}

}  // namespace server
