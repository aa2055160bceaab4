#include "executor/executor_builder.hpp"

#include "executor/local_executor.hpp"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace executor {

ExecutorOptions ExecutorBuilder::OptionsFromFlags() {
  ExecutorOptions options;
  options.temp_directory = FLAGS_temp_directory;
  options.max_parallel = FLAGS_max_parallel;
  if (options.max_parallel < 0) {
    LOG(WARNING) << "Invalid --max_parallel " << FLAGS_max_parallel
                 << ", using one slot per hardware thread";
    options.max_parallel = 0;
  }
  options.slot_wait_millis = FLAGS_slot_wait_millis;
  options.default_timeout_seconds = FLAGS_default_timeout_seconds;
  options.max_timeout_seconds = FLAGS_max_timeout_seconds;
  options.compile_timeout_seconds = FLAGS_compile_timeout_seconds;
  options.watchdog_grace_millis = FLAGS_watchdog_grace_millis;
  options.memory_limit_mb = FLAGS_memory_limit_mb;
  options.max_output_kb = FLAGS_max_output_kb;
  options.execution_enabled = FLAGS_execution_enabled;
  options.cgroup_root = FLAGS_cgroup_root;
  options.sandbox = FLAGS_sandbox;
  return options;
}

std::unique_ptr<Executor> ExecutorBuilder::Get(const ExecutorOptions& options) {
  return std::unique_ptr<Executor>(new LocalExecutor(options));
}

}  // namespace executor
