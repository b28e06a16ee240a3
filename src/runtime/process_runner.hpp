#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/pipeline_errors.hpp"

namespace sysintent::runtime {

struct ProcessLimits {
    std::uint32_t timeout_ms = 10000;
    std::size_t max_output_bytes = 64 * 1024;
};

struct ProcessCapture {
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    bool timed_out = false;
    bool launch_failed = false;
    std::string launch_error;
    std::string error_message;   // set when the exit status could not be observed
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::int64_t duration_ms = 0;
};

struct DetachedSpawn {
    pid_t pid = -1;
    bool launch_failed = false;
    std::string launch_error;
};

// Runs argv[0] (resolved through PATH) with the remaining entries as
// arguments. No shell is involved. The child leads its own process group,
// which is SIGKILLed on timeout and after the child exits, so no descendant
// outlives the call. Output beyond max_output_bytes is drained and dropped.
// Errors are returned only for failures of the runner itself (pipe, fork).
core::errors::Result<ProcessCapture> run_process(const std::vector<std::string>& argv,
                                                 const ProcessLimits& limits);

// Starts argv in a new session, detached from the caller, with stdio on
// /dev/null. Reports whether exec succeeded.
core::errors::Result<DetachedSpawn> spawn_detached(const std::vector<std::string>& argv);

}  // namespace sysintent::runtime
