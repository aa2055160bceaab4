#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Engine
DECLARE_string(temp_directory);
DECLARE_int32(max_parallel);
DECLARE_int32(slot_wait_millis);
DECLARE_int32(default_timeout_seconds);
DECLARE_int32(max_timeout_seconds);
DECLARE_int32(compile_timeout_seconds);
DECLARE_int32(watchdog_grace_millis);
DECLARE_int32(memory_limit_mb);
DECLARE_int32(max_output_kb);
DECLARE_bool(execution_enabled);

// Sandbox
DECLARE_string(cgroup_root);
DECLARE_string(sandbox);

// Server
DECLARE_int32(port);
DECLARE_string(listen_address);

#endif
