#include "util/flags.hpp"

DEFINE_string(temp_directory, "/tmp/codebox",
              "Where the per-request scratch directories are created");
DEFINE_int32(max_parallel, 0,
             "Number of sandboxes that may run at the same time. If unset, "
             "autodetect");
DEFINE_int32(slot_wait_millis, 2000,
             "How long a request may wait for a free sandbox slot");
DEFINE_int32(default_timeout_seconds, 10,
             "Timeout used when the request does not specify one");
DEFINE_int32(max_timeout_seconds, 30, "Largest timeout a request may ask for");
DEFINE_int32(compile_timeout_seconds, 30,
             "Wall time limit of the compilation step");
DEFINE_int32(watchdog_grace_millis, 1000,
             "Grace added to the request timeout before the watchdog kills "
             "the sandbox");
DEFINE_int32(memory_limit_mb, 256,
             "Hard upper bound of the memory ceiling of any sandbox");
DEFINE_int32(max_output_kb, 1024,
             "Maximum amount of stdout/stderr kept from a program");
DEFINE_bool(execution_enabled, true,
            "If false, every execution request fails with SYSTEM_ERROR");

DEFINE_string(cgroup_root, "",
              "Delegated cgroup v2 directory used for memory/cpu accounting. "
              "If empty, only rlimits and RSS polling are used");
DEFINE_string(sandbox, "",
              "Name of the sandbox backend to use. If empty, pick the best "
              "available one");

DEFINE_int32(port, 7072, "port to listen on");
DEFINE_string(listen_address, "127.0.0.1", "address to listen on");
