#ifndef SERVER_SERVICE_HPP
#define SERVER_SERVICE_HPP

#include <string>

#include "evaluator/code_evaluator.hpp"
#include "executor/executor.hpp"
#include "proto/session.grpc.pb.h"
#include "session/session_store.hpp"

namespace server {

// Synchronous implementation of the SessionBox service. It keeps no state
// besides the session directories, so handlers may run concurrently.
class SessionBoxService : public proto::SessionBox::Service {
 public:
  // executor must outlive the service. The default limits and the number of
  // evaluation workers are read from the command line flags.
  SessionBoxService(const std::string& base_directory,
                    executor::Executor* executor, const std::string& python);

  grpc::Status Ping(grpc::ServerContext* context,
                    const proto::PingRequest* request,
                    proto::PingResponse* response) override;

  grpc::Status Evaluate(grpc::ServerContext* context,
                        const proto::EvaluateRequest* request,
                        proto::EvaluationReport* response) override;

  grpc::Status Run(grpc::ServerContext* context,
                   const proto::RunRequest* request,
                   proto::RunResponse* response) override;

  grpc::Status ReadFile(grpc::ServerContext* context,
                        const proto::ReadFileRequest* request,
                        proto::ReadFileResponse* response) override;

  grpc::Status WriteFile(grpc::ServerContext* context,
                         const proto::WriteFileRequest* request,
                         proto::WriteFileResponse* response) override;

  grpc::Status DeleteFile(grpc::ServerContext* context,
                          const proto::DeleteFileRequest* request,
                          proto::DeleteFileResponse* response) override;

  grpc::Status RenameFile(grpc::ServerContext* context,
                          const proto::RenameFileRequest* request,
                          proto::RenameFileResponse* response) override;

  grpc::Status ForkSession(grpc::ServerContext* context,
                           const proto::ForkSessionRequest* request,
                           proto::ForkSessionResponse* response) override;

 private:
  session::SessionStore store_;
  executor::Executor* executor_;
  evaluator::CodeEvaluator evaluator_;
  executor::Limits run_limits_;
  executor::Limits eval_limits_;
};

}  // namespace server

#endif
