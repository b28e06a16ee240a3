#include "cli_parser.hpp"
#include <optional>
#include <system_error>
#include <vector>
#include "core/config/settings.hpp"

namespace sysintent::app::cli {

    using namespace sysintent::core::errors;
    using sysintent::protocol::CliMode;
    using sysintent::protocol::CliRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> input;
        std::optional<std::string> input_file;
        std::optional<std::string> config;
        std::optional<std::string> policy;
        std::optional<std::string> audit_log;
        std::optional<std::string> timeout_ms;
        bool dry_run = false;
        bool verbose = false;
    };

    namespace {

        Result<std::filesystem::path> existing_file(const std::string& value, const std::string& flag) {
            std::filesystem::path p(value);
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(p, ec);
            if (ec || !is_file) {
                return PipelineError{ErrorCategory::Input, flag + " does not name a readable file: " + value, "invalid_path"};
            }
            return p;
        }

    } // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return PipelineError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: sysintent handle --input '{\"action\":...}'"};
        }

        CliRequest req;
        std::string command = argv[1];
        if (command == "handle") {
            req.mode = CliMode::Handle;
        } else if (command == "check-policy") {
            req.mode = CliMode::CheckPolicy;
        } else {
            return PipelineError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: handle, check-policy."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            auto take_value = [&](std::optional<std::string>& slot) -> bool {
                if (i + 1 >= args.size()) return false;
                slot = args[++i];
                return true;
            };

            if (args[i] == "--input") {
                if (!take_value(raw.input)) return PipelineError{ErrorCategory::Input, "Missing value for --input", "missing_value"};
            } else if (args[i] == "--input-file") {
                if (!take_value(raw.input_file)) return PipelineError{ErrorCategory::Input, "Missing value for --input-file", "missing_value"};
            } else if (args[i] == "--config") {
                if (!take_value(raw.config)) return PipelineError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--policy") {
                if (!take_value(raw.policy)) return PipelineError{ErrorCategory::Input, "Missing value for --policy", "missing_value"};
            } else if (args[i] == "--audit-log") {
                if (!take_value(raw.audit_log)) return PipelineError{ErrorCategory::Input, "Missing value for --audit-log", "missing_value"};
            } else if (args[i] == "--timeout-ms") {
                if (!take_value(raw.timeout_ms)) return PipelineError{ErrorCategory::Input, "Missing value for --timeout-ms", "missing_value"};
            } else if (args[i] == "--dry-run") {
                raw.dry_run = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return PipelineError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.dry_run = raw.dry_run;
        req.verbose = raw.verbose;

        if (req.mode == CliMode::CheckPolicy) {
            if (!raw.policy.has_value()) {
                return PipelineError{ErrorCategory::Input, "check-policy requires --policy", "missing_required_flag"};
            }
            if (raw.input || raw.input_file) {
                return PipelineError{ErrorCategory::Input, "check-policy does not take input", "conflicting_flags"};
            }
        }

        if (raw.input.has_value() && raw.input_file.has_value()) {
            return PipelineError{ErrorCategory::Input, "Cannot provide both --input and --input-file", "conflicting_flags"};
        }
        if (raw.input) req.input_text = raw.input.value();

        if (raw.input_file) {
            auto file = existing_file(raw.input_file.value(), "--input-file");
            if (is_error(file)) return get_error(file);
            req.input_file = get_value(file);
        }
        if (raw.config) {
            auto file = existing_file(raw.config.value(), "--config");
            if (is_error(file)) return get_error(file);
            req.config_file = get_value(file);
        }
        if (raw.policy) {
            auto file = existing_file(raw.policy.value(), "--policy");
            if (is_error(file)) return get_error(file);
            req.policy_file = get_value(file);
        }
        if (raw.audit_log) {
            if (raw.audit_log->empty()) {
                return PipelineError{ErrorCategory::Input, "--audit-log cannot be empty", "invalid_path"};
            }
            req.audit_log = std::filesystem::path(raw.audit_log.value());
        }

        if (raw.timeout_ms) {
            auto parsed = sysintent::core::config::parse_bounded_integer(
                raw.timeout_ms.value(), sysintent::core::config::kMinTimeoutMs,
                sysintent::core::config::kMaxTimeoutMs, "--timeout-ms");
            if (is_error(parsed)) {
                auto err = get_error(parsed);
                err.category = ErrorCategory::Input;
                return err;
            }
            req.timeout_ms = static_cast<std::uint32_t>(get_value(parsed));
        }

        return req;
    }

} // namespace sysintent::app::cli
