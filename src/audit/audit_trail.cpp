#include "audit/audit_trail.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace sysintent::audit {

using core::errors::ErrorCategory;
using core::errors::PipelineError;
using nlohmann::json;

namespace {

json optional_int(const std::optional<int>& value) {
    return value.has_value() ? json(value.value()) : json(nullptr);
}

json execution_to_json(const runtime::ExecutionResult& result) {
    json payload;
    payload["argv"] = result.argv;
    payload["exit_code"] = optional_int(result.exit_code);
    payload["term_signal"] = optional_int(result.term_signal);
    payload["stdout"] = truncate_for_audit(result.stdout_text, kMaxAuditOutputBytes);
    payload["stderr"] = truncate_for_audit(result.stderr_text, kMaxAuditOutputBytes);
    payload["stdout_truncated"] = result.stdout_truncated;
    payload["stderr_truncated"] = result.stderr_truncated;
    payload["duration_ms"] = result.duration_ms;
    payload["timed_out"] = result.timed_out;
    payload["launch_failed"] = result.launch_failed;
    payload["dry_run"] = result.dry_run;
    payload["success"] = result.success();
    payload["error_message"] = result.error_message;
    return payload;
}

}  // namespace

std::string truncate_for_audit(const std::string& text, const std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "...[truncated " +
           std::to_string(text.size() - limit) + " bytes]";
}

json command_to_json(const command::Command& command) {
    json payload;
    payload["action"] = command::to_string(command.tag());
    const auto& action = command.action();
    if (const auto* start = std::get_if<command::StartApplication>(&action)) {
        payload["name"] = start->name;
    } else if (const auto* kill = std::get_if<command::KillProcess>(&action)) {
        payload["name"] = kill->name;
        payload["signal"] = command::to_string(kill->signal);
    } else if (const auto* list = std::get_if<command::ListProcesses>(&action)) {
        payload["filter"] = list->filter.has_value() ? json(list->filter.value())
                                                     : json(nullptr);
    } else if (const auto* restart = std::get_if<command::RestartService>(&action)) {
        payload["unit"] = restart->unit;
    } else if (const auto* query = std::get_if<command::ShellQuery>(&action)) {
        payload["program"] = command::to_string(query->program);
        payload["args"] = query->args;
    }
    return payload;
}

json to_json(const AuditEntry& entry) {
    json parse;
    parse["ok"] = entry.parse.ok;
    if (entry.parse.ok && entry.parse.command.has_value()) {
        parse["command"] = command_to_json(entry.parse.command.value());
    } else {
        parse["error_code"] = entry.parse.error_code;
        parse["error_message"] = entry.parse.error_message;
    }

    json verdict;
    verdict["decision"] = policy::to_string(entry.verdict.decision);
    verdict["reason"] = entry.verdict.reason;
    verdict["matched_rule"] = entry.verdict.matched_rule;

    json record;
    record["ts_unix_ms"] = entry.timestamp_unix_ms;
    record["request_id"] = entry.request_id;
    record["raw_input"] = truncate_for_audit(entry.raw_input, kMaxAuditRawInputBytes);
    record["parse"] = parse;
    record["verdict"] = verdict;
    record["execution"] = entry.execution.has_value()
                              ? execution_to_json(entry.execution.value())
                              : json(nullptr);
    return record;
}

AuditTrail::AuditTrail(std::shared_ptr<AuditSink> sink) : sink_(std::move(sink)) {}

core::errors::Status AuditTrail::ready() const {
    if (!sink_) {
        return PipelineError{ErrorCategory::Audit, "No audit sink configured.",
                             "audit_write_failed"};
    }
    return sink_->ready();
}

core::errors::Status AuditTrail::record(const AuditEntry& entry) const {
    if (!sink_) {
        SYSINTENT_LOG_ERROR("AuditTrail: no sink configured, entry for " +
                            entry.request_id + " lost");
        return PipelineError{ErrorCategory::Audit, "No audit sink configured.",
                             "audit_write_failed"};
    }

    // Model output is arbitrary bytes; invalid UTF-8 is replaced, not thrown.
    const std::string line =
        to_json(entry).dump(-1, ' ', false, json::error_handler_t::replace);

    auto appended = sink_->append(line);
    if (core::errors::is_error(appended)) {
        SYSINTENT_LOG_ERROR("AuditTrail: failed to record " + entry.request_id + ": " +
                            core::errors::get_error(appended).message);
        return appended;
    }
    SYSINTENT_LOG_DEBUG("AuditTrail: recorded " + entry.request_id);
    return core::errors::ok();
}

}  // namespace sysintent::audit
