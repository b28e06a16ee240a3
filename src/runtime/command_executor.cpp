#include "runtime/command_executor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/process_runner.hpp"

namespace sysintent::runtime {

using command::Command;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += part;
    }
    return out;
}

std::string with_service_suffix(const std::string& unit) {
    constexpr const char* kSuffix = ".service";
    if (unit.size() > 8 && lowercase(unit.substr(unit.size() - 8)) == kSuffix) {
        return unit;
    }
    return unit + kSuffix;
}

// pkill treats its pattern as an extended regex; escape it so -x matches the
// literal name the policy evaluated.
std::string literal_pattern(const std::string& name) {
    constexpr const char* kRegexSpecials = ".*+?^$[](){}|\\";
    std::string out;
    out.reserve(name.size() * 2);
    for (const char c : name) {
        if (std::string(kRegexSpecials).find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

bool is_sort_filter(const std::optional<std::string>& filter) {
    return filter.has_value() &&
           (filter.value() == "cpu" || filter.value() == "memory");
}

// Keeps the ps header plus every line that mentions the filter.
std::string filter_lines(const std::string& text, const std::string& filter) {
    std::istringstream in(text);
    std::ostringstream out;
    const std::string needle = lowercase(filter);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header || lowercase(line).find(needle) != std::string::npos) {
            out << line << "\n";
        }
        header = false;
    }
    return out.str();
}

std::string limit_lines(const std::string& text, const std::size_t max_lines) {
    if (max_lines == 0) {
        return text;
    }
    std::istringstream in(text);
    std::ostringstream out;
    std::string line;
    std::size_t count = 0;
    while (std::getline(in, line)) {
        if (count == max_lines) {
            out << "... (truncated, showing first " << max_lines << " lines)\n";
            break;
        }
        out << line << "\n";
        ++count;
    }
    return out.str();
}

}  // namespace

CommandExecutor::CommandExecutor(ExecutorSettings settings)
    : settings_(std::move(settings)) {}

std::vector<std::string> CommandExecutor::build_argv(const Command& command) const {
    const auto& action = command.action();
    const ProgramTable& programs = settings_.programs;

    if (const auto* start = std::get_if<command::StartApplication>(&action)) {
        return {start->name};
    }
    if (const auto* kill = std::get_if<command::KillProcess>(&action)) {
        return {programs.pkill, "--signal", command::to_string(kill->signal), "-x",
                literal_pattern(kill->name)};
    }
    if (const auto* list = std::get_if<command::ListProcesses>(&action)) {
        std::vector<std::string> argv = {programs.ps, "aux"};
        if (list->filter.has_value() && list->filter.value() == "cpu") {
            argv.push_back("--sort=-%cpu");
        } else if (list->filter.has_value() && list->filter.value() == "memory") {
            argv.push_back("--sort=-%mem");
        }
        return argv;
    }
    if (const auto* restart = std::get_if<command::RestartService>(&action)) {
        return {programs.systemctl, "restart", with_service_suffix(restart->unit)};
    }
    if (const auto* query = std::get_if<command::ShellQuery>(&action)) {
        std::vector<std::string> argv;
        argv.push_back(query->program == command::ShellProgram::Grep ? programs.grep
                                                                     : programs.ps);
        argv.insert(argv.end(), query->args.begin(), query->args.end());
        return argv;
    }
    return {};
}

ExecutionResult CommandExecutor::run(const Command& command) const {
    ExecutionResult result(command);
    result.argv = build_argv(command);

    if (result.argv.empty()) {
        result.launch_failed = true;
        result.error_message = "No invocation is defined for " + command.describe();
        SYSINTENT_LOG_ERROR("CommandExecutor: " + result.error_message);
        return result;
    }

    if (settings_.dry_run) {
        result.dry_run = true;
        result.exit_code = 0;
        result.stdout_text = "[dry run] would execute: " + join(result.argv);
        SYSINTENT_LOG_INFO("CommandExecutor: " + result.stdout_text);
        return result;
    }

    SYSINTENT_LOG_INFO("CommandExecutor: executing " + join(result.argv));

    if (command.tag() == command::ActionTag::StartApplication) {
        const auto started = std::chrono::steady_clock::now();
        auto spawned = spawn_detached(result.argv);
        result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (core::errors::is_error(spawned)) {
            result.launch_failed = true;
            result.error_message = core::errors::get_error(spawned).message;
        } else if (core::errors::get_value(spawned).launch_failed) {
            result.launch_failed = true;
            result.error_message = core::errors::get_value(spawned).launch_error;
        } else {
            result.exit_code = 0;
            result.stdout_text = "Started '" + result.argv.front() + "' (PID " +
                                 std::to_string(core::errors::get_value(spawned).pid) +
                                 ")";
        }
    } else {
        ProcessLimits limits;
        limits.timeout_ms = settings_.timeout_ms;
        limits.max_output_bytes = settings_.max_output_bytes;

        auto captured = run_process(result.argv, limits);
        if (core::errors::is_error(captured)) {
            result.launch_failed = true;
            result.error_message = core::errors::get_error(captured).message;
        } else {
            const auto& capture = core::errors::get_value(captured);
            result.exit_code = capture.exit_code;
            result.term_signal = capture.term_signal;
            result.stdout_text = capture.stdout_text;
            result.stderr_text = capture.stderr_text;
            result.stdout_truncated = capture.stdout_truncated;
            result.stderr_truncated = capture.stderr_truncated;
            result.duration_ms = capture.duration_ms;
            result.timed_out = capture.timed_out;
            result.launch_failed = capture.launch_failed;
            result.error_message =
                capture.launch_failed ? capture.launch_error : capture.error_message;
        }
    }

    if (const auto* list = std::get_if<command::ListProcesses>(&command.action())) {
        if (list->filter.has_value() && !is_sort_filter(list->filter)) {
            result.stdout_text = filter_lines(result.stdout_text, list->filter.value());
        }
    }
    if (command.tag() == command::ActionTag::ListProcesses ||
        command.tag() == command::ActionTag::ShellQuery) {
        result.stdout_text = limit_lines(result.stdout_text, settings_.max_output_lines);
    }

    if (result.timed_out) {
        result.error_message = "Command timed out after " +
                               std::to_string(settings_.timeout_ms) + " ms";
        SYSINTENT_LOG_WARN("CommandExecutor: " + result.error_message);
    } else if (result.launch_failed) {
        SYSINTENT_LOG_WARN("CommandExecutor: " + result.error_message);
    } else if (result.term_signal.has_value()) {
        result.error_message =
            "Command terminated by signal " + std::to_string(result.term_signal.value());
        SYSINTENT_LOG_WARN("CommandExecutor: " + result.error_message);
    } else if (!result.exit_code.has_value()) {
        SYSINTENT_LOG_WARN("CommandExecutor: " + result.error_message);
    } else if (!result.success()) {
        result.error_message =
            "Command exited with code " + std::to_string(result.exit_code.value_or(-1));
        SYSINTENT_LOG_WARN("CommandExecutor: " + result.error_message);
    } else {
        SYSINTENT_LOG_INFO("CommandExecutor: completed in " +
                           std::to_string(result.duration_ms) + " ms");
    }
    return result;
}

}  // namespace sysintent::runtime
