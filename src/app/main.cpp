#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/request_id.hpp"
#include "core/config/settings.hpp"
#include "core/errors/pipeline_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/rule_set.hpp"
#include "protocol/request_outcome.hpp"
#include "session/request_pipeline.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitExecutionFailed = 1;
constexpr int kExitInputError = 2;
constexpr int kExitParseRejected = 3;
constexpr int kExitRefused = 4;
constexpr int kExitConfigError = 5;
constexpr int kExitAuditFailure = 6;

// Reads at most limit + 1 bytes so oversized input still reaches the parser's
// size check without being buffered whole.
std::string read_bounded(std::istream& in, const std::size_t limit) {
    std::string text;
    char c = 0;
    while (text.size() <= limit && in.get(c)) {
        text.push_back(c);
    }
    return text;
}

void report_error(const std::string& context,
                  const sysintent::core::errors::PipelineError& err) {
    SYSINTENT_LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        SYSINTENT_LOG_INFO("Hint: " + err.hint);
    }
}

void print_outcome(const sysintent::protocol::RequestOutcome& outcome) {
    using sysintent::protocol::RequestStatus;
    std::cout << "request " << outcome.request_id << ": "
              << sysintent::protocol::to_string(outcome.status) << "\n";
    switch (outcome.status) {
        case RequestStatus::ParseRejected:
            std::cout << "could not understand the model response: "
                      << (outcome.parse_error ? outcome.parse_error->message : "") << "\n";
            break;
        case RequestStatus::Refused:
            std::cout << "request refused: " << outcome.verdict.reason << " ("
                      << outcome.verdict.matched_rule << ")\n";
            break;
        case RequestStatus::Executed:
        case RequestStatus::ExecutionFailed:
        case RequestStatus::TimedOut:
            if (outcome.execution) {
                const auto& result = outcome.execution.value();
                if (!result.stdout_text.empty()) {
                    std::cout << result.stdout_text;
                    if (result.stdout_text.back() != '\n') {
                        std::cout << "\n";
                    }
                }
                if (!result.stderr_text.empty()) {
                    std::cerr << result.stderr_text;
                }
                if (!result.error_message.empty()) {
                    std::cout << "error: " << result.error_message << "\n";
                }
            }
            break;
    }
}

int exit_code_for(const sysintent::protocol::RequestStatus status) {
    using sysintent::protocol::RequestStatus;
    switch (status) {
        case RequestStatus::Executed:
            return kExitOk;
        case RequestStatus::ParseRejected:
            return kExitParseRejected;
        case RequestStatus::Refused:
            return kExitRefused;
        case RequestStatus::ExecutionFailed:
        case RequestStatus::TimedOut:
            return kExitExecutionFailed;
    }
    return kExitExecutionFailed;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = sysintent::core::errors;
    namespace config = sysintent::core::config;

    // 1. One request id per invocation, shared with the logger
    const std::string request_id = config::generate_request_id();
    sysintent::core::logging::Logger::get().set_request_id(request_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = sysintent::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        report_error("Input error", errors::get_error(parsed));
        return kExitInputError;
    }
    const auto& req = errors::get_value(parsed);

    if (req.mode == sysintent::protocol::CliMode::CheckPolicy) {
        auto loaded = sysintent::policy::load_rule_set_file(req.policy_file.value());
        if (errors::is_error(loaded)) {
            report_error("Policy error", errors::get_error(loaded));
            return kExitConfigError;
        }
        std::cout << req.policy_file->string() << ": "
                  << errors::get_value(loaded)->size() << " rules OK\n";
        return kExitOk;
    }

    // 3. Settings: defaults < settings file < environment < flags
    config::Settings settings;
    if (req.config_file) {
        auto loaded = config::load_settings_file(req.config_file.value(), settings);
        if (errors::is_error(loaded)) {
            report_error("Settings error", errors::get_error(loaded));
            return kExitConfigError;
        }
        settings = errors::get_value(loaded);
    }
    auto env_status = config::apply_environment(settings);
    if (errors::is_error(env_status)) {
        report_error("Environment error", errors::get_error(env_status));
        return kExitConfigError;
    }
    if (req.policy_file) settings.policy_file = req.policy_file;
    if (req.audit_log) settings.audit_log_path = req.audit_log.value();
    if (req.timeout_ms) settings.timeout_ms = req.timeout_ms.value();
    if (req.dry_run) settings.dry_run = true;
    if (req.verbose) settings.log_level = "debug";

    sysintent::core::logging::LogLevel level = sysintent::core::logging::LogLevel::INFO;
    if (sysintent::core::logging::Logger::parse_level(settings.log_level, level)) {
        sysintent::core::logging::Logger::get().set_min_level(level);
    }

    // 4. Wire the pipeline
    auto built = sysintent::session::build_request_pipeline(settings);
    if (errors::is_error(built)) {
        report_error("Startup error", errors::get_error(built));
        return kExitConfigError;
    }
    const auto pipeline = errors::get_value(built);

    // 5. Read the model response
    std::string raw_input;
    if (req.input_text) {
        raw_input = req.input_text.value();
    } else if (req.input_file) {
        std::ifstream in(req.input_file.value(), std::ios::binary);
        if (!in.is_open()) {
            SYSINTENT_LOG_ERROR("Unable to open input file: " + req.input_file->string());
            return kExitInputError;
        }
        raw_input = read_bounded(in, settings.max_payload_bytes);
    } else {
        raw_input = read_bounded(std::cin, settings.max_payload_bytes);
    }

    // 6. Run it
    auto handled = pipeline->handle(request_id, raw_input);
    if (errors::is_error(handled)) {
        const auto& err = errors::get_error(handled);
        report_error("Audit failure", err);
        std::cout << "request " << request_id << ": not completed, " << err.message << "\n";
        return err.category == errors::ErrorCategory::Audit ? kExitAuditFailure
                                                            : kExitExecutionFailed;
    }

    const auto& outcome = errors::get_value(handled);
    print_outcome(outcome);
    SYSINTENT_LOG_INFO("Audit: " + settings.audit_log_path.string());
    return exit_code_for(outcome.status);
}
