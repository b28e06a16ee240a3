#pragma once

#include <optional>
#include <string>
#include "command/command.hpp"
#include "core/errors/pipeline_errors.hpp"
#include "policy/policy_rule.hpp"
#include "runtime/command_executor.hpp"

namespace sysintent::protocol {

enum class RequestStatus {
    ParseRejected,
    Refused,
    Executed,
    ExecutionFailed,
    TimedOut
};

// What the caller gets back for one request, mirroring the audit entry.
struct RequestOutcome {
    std::string request_id;
    RequestStatus status = RequestStatus::Refused;
    std::optional<command::Command> command;
    std::optional<core::errors::PipelineError> parse_error;
    policy::Verdict verdict;
    std::optional<runtime::ExecutionResult> execution;
};

inline std::string to_string(const RequestStatus status) {
    switch (status) {
        case RequestStatus::ParseRejected:
            return "parse_rejected";
        case RequestStatus::Refused:
            return "refused";
        case RequestStatus::Executed:
            return "executed";
        case RequestStatus::ExecutionFailed:
            return "execution_failed";
        case RequestStatus::TimedOut:
            return "timed_out";
        default:
            return "unknown";
    }
}

}  // namespace sysintent::protocol
