#include <iostream>
#include <memory>
#include <string>

#include "absl/strings/ascii.h"
#include "executor/executor_builder.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "language/profile.hpp"
#include "policy/validator.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(language, "", "java, python, javascript or cpp");  // NOLINT
DEFINE_string(source, "", "File with the code to run");          // NOLINT
DEFINE_string(stdin, "", "File passed as standard input");       // NOLINT
DEFINE_int32(timeout, 0, "Timeout in seconds; 0 means the default");  // NOLINT
DEFINE_bool(validate_only, false,  // NOLINT
            "Only validate and scan the code, without running it");

namespace {

const constexpr size_t kMaxInputBytes = 1 << 20;

const constexpr int kExitEngineFailure = 1;
const constexpr int kExitInvalid = 2;

proto::Language ParseLanguage(const std::string& name) {
  std::string lower = absl::AsciiStrToLower(name);
  for (const language::LanguageProfile* profile :
       language::LanguageProfile::All()) {
    if (profile->Name() == lower) return profile->Language();
  }
  return proto::UNKNOWN_LANGUAGE;
}

void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  CHECK(status.ok()) << status.ToString();
  std::cout << json;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs a source file in the sandbox and prints the result as JSON.\n"
      "Usage: codebox_run --language=cpp --source=main.cpp [--stdin=FILE]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  proto::ExecutionRequest request;
  request.set_language(ParseLanguage(FLAGS_language));
  if (FLAGS_timeout != 0) request.set_timeout_seconds(FLAGS_timeout);
  try {
    if (!FLAGS_source.empty())
      request.set_code(util::File::Read(FLAGS_source, kMaxInputBytes));
    if (!FLAGS_stdin.empty())
      request.set_input(util::File::Read(FLAGS_stdin, kMaxInputBytes));
  } catch (const std::system_error& e) {
    LOG(ERROR) << e.what();
    return kExitEngineFailure;
  }

  std::unique_ptr<executor::Executor> executor = executor::ExecutorBuilder::Get(
      executor::ExecutorBuilder::OptionsFromFlags());
  if (FLAGS_validate_only) {
    proto::ValidationResponse response = executor->Validate(request);
    Print(response);
    return response.valid() ? 0 : kExitInvalid;
  }

  proto::ExecutionResponse response;
  try {
    response = executor->Execute(request);
  } catch (const policy::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    return kExitInvalid;
  }
  Print(response);
  return response.status() == proto::SYSTEM_ERROR ? kExitEngineFailure : 0;
}
