#ifndef REMOTE_CLIENT_HPP
#define REMOTE_CLIENT_HPP

#include <memory>
#include <stdexcept>
#include <string>

#include "grpc++/channel.h"
#include "grpc++/client_context.h"
#include "grpc++/support/status.h"
#include "proto/session.grpc.pb.h"

namespace remote {

// A call returned a non-OK status.
class server_error : public std::runtime_error {
 public:
  explicit server_error(const grpc::Status& status)
      : std::runtime_error(status.error_message()),
        code_(status.error_code()) {}
  grpc::StatusCode code() const { return code_; }

 private:
  grpc::StatusCode code_;
};

// Blocking client of the SessionBox service. Every call carries a deadline
// and throws server_error when it fails.
class Client {
 public:
  Client(const std::shared_ptr<grpc::Channel>& channel, int64_t timeout_ms);

  // Connects to address (host:port) without transport security.
  static std::unique_ptr<Client> Connect(const std::string& address,
                                         int64_t timeout_ms);

  std::string Ping();

  // A fresh session id. The session is created on the server by the first
  // call that uses it.
  static std::string CreateSession();

  proto::RunResponse Run(const std::string& session_id, const std::string& cmd,
                         const proto::Resources& limits = proto::Resources());

  std::string ReadFile(const std::string& session_id,
                       const std::string& rel_path);
  void WriteFile(const std::string& session_id, const std::string& rel_path,
                 const std::string& content);
  void DeleteFile(const std::string& session_id, const std::string& rel_path);
  void RenameFile(const std::string& session_id, const std::string& old_path,
                  const std::string& new_path);

  // Returns the id of the copy.
  std::string ForkSession(const std::string& session_id);

  proto::EvaluationReport Evaluate(const proto::EvaluateRequest& request);

 private:
  void SetupContext(grpc::ClientContext* context) const;

  std::unique_ptr<proto::SessionBox::Stub> stub_;
  int64_t timeout_ms_;
};

}  // namespace remote

#endif
