#include "session/request_pipeline.hpp"

#include <chrono>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"

namespace sysintent::session {

using core::errors::ErrorCategory;
using core::errors::PipelineError;
using protocol::RequestOutcome;
using protocol::RequestStatus;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

// Parse failures never reach the policy engine but still carry a verdict, so
// the caller and the audit trail always see a decision.
policy::Verdict verdict_for_parse_failure(const PipelineError& error) {
    if (error.code == "shell_program_not_allowed") {
        return policy::Verdict{policy::Decision::Deny,
                               "shell_query program is outside the allowed set {ps, grep}",
                               "builtin.shell_program_allow_set"};
    }
    return policy::Verdict{policy::Decision::Deny,
                           "request could not be parsed: " + error.message,
                           "parse.rejected"};
}

RequestStatus status_for(const runtime::ExecutionResult& result) {
    if (result.timed_out) {
        return RequestStatus::TimedOut;
    }
    return result.success() ? RequestStatus::Executed : RequestStatus::ExecutionFailed;
}

}  // namespace

RequestPipeline::RequestPipeline(intent::IntentParser parser,
                                 policy::PolicyEngine engine,
                                 runtime::CommandExecutor executor,
                                 std::shared_ptr<const audit::AuditTrail> audit_trail)
    : parser_(std::move(parser)),
      engine_(std::move(engine)),
      executor_(std::move(executor)),
      audit_trail_(std::move(audit_trail)) {}

core::errors::Result<RequestOutcome> RequestPipeline::handle(
    const std::string& raw_input) const {
    return handle(core::config::generate_request_id(), raw_input);
}

core::errors::Result<RequestOutcome> RequestPipeline::handle(
    const std::string& request_id, const std::string& raw_input) const {
    audit::AuditEntry entry;
    entry.timestamp_unix_ms = now_unix_ms();
    entry.request_id = request_id;
    entry.raw_input = raw_input;

    RequestOutcome outcome;
    outcome.request_id = request_id;

    // 1. Parse
    auto parsed = parser_.parse(raw_input);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        entry.parse.ok = false;
        entry.parse.error_code = err.code;
        entry.parse.error_message = err.message;
        entry.verdict = verdict_for_parse_failure(err);

        outcome.status = err.code == "shell_program_not_allowed"
                             ? RequestStatus::Refused
                             : RequestStatus::ParseRejected;
        outcome.parse_error = err;
        outcome.verdict = entry.verdict;
        SYSINTENT_LOG_WARN("Pipeline: " + request_id + " parse rejected [" + err.code +
                           "]");
        return finish(entry, std::move(outcome));
    }

    const command::Command& command = core::errors::get_value(parsed);
    entry.parse.ok = true;
    entry.parse.command = command;
    outcome.command = command;

    // 2. Evaluate
    entry.verdict = engine_.evaluate(command);
    outcome.verdict = entry.verdict;
    if (!entry.verdict.allowed()) {
        outcome.status = RequestStatus::Refused;
        SYSINTENT_LOG_WARN("Pipeline: " + request_id + " refused: " +
                           entry.verdict.reason);
        return finish(entry, std::move(outcome));
    }

    // 3. Execute, but only once the trail is known to be writable.
    auto ready = audit_trail_ ? audit_trail_->ready()
                              : core::errors::Status(PipelineError{
                                    ErrorCategory::Audit, "No audit trail configured.",
                                    "audit_write_failed"});
    if (core::errors::is_error(ready)) {
        const auto& err = core::errors::get_error(ready);
        SYSINTENT_LOG_ERROR("Pipeline: " + request_id +
                            " not executed, audit trail unavailable: " + err.message);
        return err;
    }

    runtime::ExecutionResult result = executor_.run(command);
    outcome.status = status_for(result);
    entry.execution = result;
    outcome.execution = std::move(result);
    SYSINTENT_LOG_INFO("Pipeline: " + request_id + " " +
                       protocol::to_string(outcome.status));

    // 4. Record
    return finish(entry, std::move(outcome));
}

core::errors::Result<RequestOutcome> RequestPipeline::finish(
    const audit::AuditEntry& entry, RequestOutcome outcome) const {
    if (!audit_trail_) {
        SYSINTENT_LOG_ERROR("Pipeline: no audit trail, entry for " + entry.request_id +
                            " lost");
        return PipelineError{ErrorCategory::Audit, "No audit trail configured.",
                             "audit_write_failed"};
    }
    auto recorded = audit_trail_->record(entry);
    if (core::errors::is_error(recorded)) {
        auto err = core::errors::get_error(recorded);
        err.message = "Request " + entry.request_id + " (" +
                      protocol::to_string(outcome.status) +
                      ") was not recorded: " + err.message;
        SYSINTENT_LOG_ERROR("Pipeline: " + err.message);
        return err;
    }
    return outcome;
}

runtime::ExecutorSettings executor_settings_from(const core::config::Settings& settings) {
    runtime::ExecutorSettings executor;
    executor.timeout_ms = settings.timeout_ms;
    executor.max_output_bytes = settings.max_output_bytes;
    executor.max_output_lines = settings.max_output_lines;
    executor.dry_run = settings.dry_run;
    executor.programs.pkill = settings.programs.pkill;
    executor.programs.ps = settings.programs.ps;
    executor.programs.grep = settings.programs.grep;
    executor.programs.systemctl = settings.programs.systemctl;
    return executor;
}

core::errors::Result<std::shared_ptr<const RequestPipeline>> build_request_pipeline(
    const core::config::Settings& settings) {
    std::shared_ptr<const policy::RuleSet> rules;
    if (settings.policy_file.has_value()) {
        auto loaded = policy::load_rule_set_file(settings.policy_file.value());
        if (core::errors::is_error(loaded)) {
            return core::errors::get_error(loaded);
        }
        rules = core::errors::get_value(loaded);
        SYSINTENT_LOG_INFO("Loaded " + std::to_string(rules->size()) +
                           " policy rules from " + settings.policy_file->string());
    } else {
        rules = policy::default_rule_set();
        if (!rules) {
            return PipelineError{ErrorCategory::Internal,
                                 "Built-in policy rules failed to load.",
                                 "default_policy_invalid"};
        }
        SYSINTENT_LOG_INFO("Using " + std::to_string(rules->size()) +
                           " built-in policy rules");
    }

    intent::ParserLimits limits;
    limits.max_payload_bytes = settings.max_payload_bytes;

    auto sink = std::make_shared<audit::JsonlFileSink>(settings.audit_log_path);
    auto trail = std::make_shared<const audit::AuditTrail>(sink);

    return std::make_shared<const RequestPipeline>(
        intent::IntentParser(limits), policy::PolicyEngine(std::move(rules)),
        runtime::CommandExecutor(executor_settings_from(settings)), std::move(trail));
}

}  // namespace sysintent::session
