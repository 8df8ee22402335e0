#include <memory>
#include <string>

#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "server/service.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

DEFINE_string(address, "0.0.0.0", "address to listen on");
DEFINE_int32(port, 6000, "port to listen on");

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  std::string python = util::which(FLAGS_python);
  CHECK(!python.empty()) << "Python interpreter " << FLAGS_python
                         << " not found in PATH";

  executor::LocalExecutor executor;
  server::SessionBoxService service(FLAGS_base_directory, &executor, python);

  std::string server_address = FLAGS_address + ":" + std::to_string(FLAGS_port);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  CHECK(server) << "Failed to listen on " << server_address;
  LOG(INFO) << "Server listening on " << server_address << ", sessions in "
            << FLAGS_base_directory;
  server->Wait();
}
