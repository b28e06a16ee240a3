#pragma once

#include <memory>
#include <string>
#include "audit/audit_trail.hpp"
#include "core/config/settings.hpp"
#include "core/errors/pipeline_errors.hpp"
#include "intent/intent_parser.hpp"
#include "policy/policy_engine.hpp"
#include "protocol/request_outcome.hpp"
#include "runtime/command_executor.hpp"

namespace sysintent::session {

// Runs one model response end to end: parse -> evaluate -> execute (only on
// allow) -> record. Exactly one audit entry is written per call. The only
// error returned is an audit failure; every other outcome, including parse
// rejections and policy denials, is a RequestOutcome.
//
// handle() is const and may be called from several threads at once.
class RequestPipeline {
public:
    RequestPipeline(intent::IntentParser parser, policy::PolicyEngine engine,
                    runtime::CommandExecutor executor,
                    std::shared_ptr<const audit::AuditTrail> audit_trail);

    core::errors::Result<protocol::RequestOutcome> handle(
        const std::string& raw_input) const;

    core::errors::Result<protocol::RequestOutcome> handle(
        const std::string& request_id, const std::string& raw_input) const;

private:
    core::errors::Result<protocol::RequestOutcome> finish(
        const audit::AuditEntry& entry, protocol::RequestOutcome outcome) const;

    intent::IntentParser parser_;
    policy::PolicyEngine engine_;
    runtime::CommandExecutor executor_;
    std::shared_ptr<const audit::AuditTrail> audit_trail_;
};

runtime::ExecutorSettings executor_settings_from(const core::config::Settings& settings);

// Loads the configured rule set (or the default one) and wires a pipeline
// writing to a JSON Lines audit file.
core::errors::Result<std::shared_ptr<const RequestPipeline>> build_request_pipeline(
    const core::config::Settings& settings);

}  // namespace sysintent::session
