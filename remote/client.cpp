#include "remote/client.hpp"

#include <chrono>

#include "grpc++/create_channel.h"
#include "grpc++/security/credentials.h"
#include "util/uuid.hpp"

namespace {
void CheckStatus(const grpc::Status& status) {
  if (!status.ok()) throw remote::server_error(status);
}
}  // namespace

namespace remote {

Client::Client(const std::shared_ptr<grpc::Channel>& channel,
               int64_t timeout_ms)
    : stub_(proto::SessionBox::NewStub(channel)), timeout_ms_(timeout_ms) {}

std::unique_ptr<Client> Client::Connect(const std::string& address,
                                        int64_t timeout_ms) {
  return std::unique_ptr<Client>(new Client(
      grpc::CreateChannel(address, grpc::InsecureChannelCredentials()),
      timeout_ms));
}

void Client::SetupContext(grpc::ClientContext* context) const {
  if (timeout_ms_ > 0) {
    context->set_deadline(std::chrono::system_clock::now() +
                          std::chrono::milliseconds(timeout_ms_));
  }
}

std::string Client::Ping() {
  grpc::ClientContext context;
  SetupContext(&context);
  proto::PingResponse response;
  CheckStatus(stub_->Ping(&context, proto::PingRequest(), &response));
  return response.message();
}

std::string Client::CreateSession() { return util::NewUUID(); }

proto::RunResponse Client::Run(const std::string& session_id,
                               const std::string& cmd,
                               const proto::Resources& limits) {
  grpc::ClientContext context;
  SetupContext(&context);
  proto::RunRequest request;
  request.set_session_id(session_id);
  request.set_cmd(cmd);
  *request.mutable_limits() = limits;
  proto::RunResponse response;
  CheckStatus(stub_->Run(&context, request, &response));
  return response;
}

std::string Client::ReadFile(const std::string& session_id,
                             const std::string& rel_path) {
  grpc::ClientContext context;
  SetupContext(&context);
  proto::ReadFileRequest request;
  request.set_session_id(session_id);
  request.set_rel_path(rel_path);
  proto::ReadFileResponse response;
  CheckStatus(stub_->ReadFile(&context, request, &response));
  return response.content();
}

void Client::WriteFile(const std::string& session_id,
                       const std::string& rel_path,
                       const std::string& content) {
  grpc::ClientContext context;
  SetupContext(&context);
  proto::WriteFileRequest request;
  request.set_session_id(session_id);
  request.set_rel_path(rel_path);
  request.set_content(content);
  proto::WriteFileResponse response;
  CheckStatus(stub_->WriteFile(&context, request, &response));
}

void Client::DeleteFile(const std::string& session_id,
                        const std::string& rel_path) {
  grpc::ClientContext context;
  SetupContext(&context);
  proto::DeleteFileRequest request;
  request.set_session_id(session_id);
  request.set_rel_path(rel_path);
  proto::DeleteFileResponse response;
  CheckStatus(stub_->DeleteFile(&context, request, &response));
}

void Client::RenameFile(const std::string& session_id,
                        const std::string& old_path,
                        const std::string& new_path) {
  grpc::ClientContext context;
  SetupContext(&context);
  proto::RenameFileRequest request;
  request.set_session_id(session_id);
  request.set_old_path(old_path);
  request.set_new_path(new_path);
  proto::RenameFileResponse response;
  CheckStatus(stub_->RenameFile(&context, request, &response));
}

std::string Client::ForkSession(const std::string& session_id) {
  grpc::ClientContext context;
  SetupContext(&context);
  proto::ForkSessionRequest request;
  request.set_session_id(session_id);
  proto::ForkSessionResponse response;
  CheckStatus(stub_->ForkSession(&context, request, &response));
  return response.new_session_id();
}

proto::EvaluationReport Client::Evaluate(
    const proto::EvaluateRequest& request) {
  grpc::ClientContext context;
  SetupContext(&context);
  proto::EvaluationReport response;
  CheckStatus(stub_->Evaluate(&context, request, &response));
  return response;
}

}  // namespace remote
