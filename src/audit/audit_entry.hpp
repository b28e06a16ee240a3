#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "command/command.hpp"
#include "policy/policy_rule.hpp"
#include "runtime/command_executor.hpp"

namespace sysintent::audit {

struct ParseRecord {
    bool ok = false;
    std::optional<command::Command> command;   // set when ok
    std::string error_code;                    // set when !ok
    std::string error_message;
};

// One end-to-end request. Built once by the pipeline and handed to the
// trail as a const reference; nothing rewrites it afterwards.
struct AuditEntry {
    std::int64_t timestamp_unix_ms = 0;
    std::string request_id;
    std::string raw_input;
    ParseRecord parse;
    policy::Verdict verdict;
    std::optional<runtime::ExecutionResult> execution;
};

}  // namespace sysintent::audit
