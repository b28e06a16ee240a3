#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "command/command.hpp"

namespace sysintent::runtime {

// Binaries invoked for each action. Bare names are resolved through PATH.
struct ProgramTable {
    std::string pkill = "pkill";
    std::string ps = "ps";
    std::string grep = "grep";
    std::string systemctl = "systemctl";
};

struct ExecutorSettings {
    std::uint32_t timeout_ms = 10000;
    std::size_t max_output_bytes = 64 * 1024;
    std::size_t max_output_lines = 100;
    bool dry_run = false;
    ProgramTable programs;
};

struct ExecutionResult {
    explicit ExecutionResult(command::Command executed) : command(std::move(executed)) {}

    command::Command command;
    std::vector<std::string> argv;
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    std::string stdout_text;
    std::string stderr_text;
    std::int64_t duration_ms = 0;
    bool timed_out = false;
    bool launch_failed = false;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    bool dry_run = false;
    std::string error_message;

    bool success() const {
        return !timed_out && !launch_failed && exit_code.has_value() &&
               exit_code.value() == 0;
    }
};

// Runs an approved Command as a single argv invocation. Never throws and
// never reports failures out of band: launch errors, non-zero exits, signals
// and timeouts are all described by the returned ExecutionResult.
class CommandExecutor {
public:
    explicit CommandExecutor(ExecutorSettings settings = {});

    ExecutionResult run(const command::Command& command) const;

    std::vector<std::string> build_argv(const command::Command& command) const;

    const ExecutorSettings& settings() const { return settings_; }

private:
    ExecutorSettings settings_;
};

}  // namespace sysintent::runtime
