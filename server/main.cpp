#include <memory>
#include <string>

#include "absl/strings/str_cat.h"
#include "executor/executor_builder.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "grpc++/server_context.h"
#include "policy/validator.hpp"
#include "proto/codebox.grpc.pb.h"
#include "util/flags.hpp"

namespace {

grpc::Status InvalidArgument(const policy::ValidationError& e) {
  LOG(WARNING) << "Invalid request: " << e.what();
  return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
}

}  // namespace

class CodeRunnerImpl : public proto::CodeRunner::Service {
 public:
  explicit CodeRunnerImpl(std::unique_ptr<executor::Executor> executor)
      : executor_(std::move(executor)) {}

  grpc::Status Execute(grpc::ServerContext* /*context*/,
                       const proto::ExecutionRequest* request,
                       proto::ExecutionResponse* response) override {
    try {
      *response = executor_->Execute(*request);
    } catch (const policy::ValidationError& e) {
      return InvalidArgument(e);
    }
    return grpc::Status::OK;
  }

  grpc::Status Validate(grpc::ServerContext* /*context*/,
                        const proto::ExecutionRequest* request,
                        proto::ValidationResponse* response) override {
    *response = executor_->Validate(*request);
    return grpc::Status::OK;
  }

  grpc::Status Hint(grpc::ServerContext* /*context*/,
                    const proto::ExecutionRequest* request,
                    proto::HintResponse* response) override {
    try {
      *response = executor_->Hint(*request);
    } catch (const policy::ValidationError& e) {
      return InvalidArgument(e);
    }
    return grpc::Status::OK;
  }

  grpc::Status Health(grpc::ServerContext* /*context*/,
                      const proto::HealthRequest* /*request*/,
                      proto::HealthResponse* response) override {
    *response = executor_->Health();
    return grpc::Status::OK;
  }

  grpc::Status ListLanguages(grpc::ServerContext* /*context*/,
                             const proto::LanguagesRequest* /*request*/,
                             proto::LanguagesResponse* response) override {
    *response = executor_->Languages();
    return grpc::Status::OK;
  }

 private:
  std::unique_ptr<executor::Executor> executor_;
};

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  std::string server_address =
      absl::StrCat(FLAGS_listen_address, ":", FLAGS_port);
  CodeRunnerImpl service(executor::ExecutorBuilder::Get(
      executor::ExecutorBuilder::OptionsFromFlags()));
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    LOG(ERROR) << "Unable to listen on " << server_address;
    return 1;
  }
  LOG(INFO) << "Server listening on " << server_address;
  server->Wait();
}
