#include "intent/intent_parser.hpp"

#include <initializer_list>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace sysintent::intent {

using command::ActionTag;
using command::Command;
using command::KillSignal;
using command::ShellProgram;
using core::errors::ErrorCategory;
using core::errors::PipelineError;
using nlohmann::json;

namespace {

PipelineError parse_error(const std::string& message, const std::string& code) {
    return PipelineError{ErrorCategory::Parse, message, code};
}

// Unknown keys are rejected rather than ignored so that a model cannot smuggle
// extra intent past the decoder.
std::optional<PipelineError> reject_unexpected_keys(
    const json& object, std::initializer_list<const char*> allowed,
    const std::string& context) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        bool known = false;
        for (const char* key : allowed) {
            if (it.key() == key) {
                known = true;
                break;
            }
        }
        if (!known) {
            return parse_error("Unexpected field '" + it.key() + "' in " + context + ".",
                               "unexpected_field");
        }
    }
    return std::nullopt;
}

// Looks up a string member. Absent or null yields nullopt; any other
// non-string type is an error.
core::errors::Result<std::optional<std::string>> optional_string(
    const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return parse_error(std::string("Field '") + key + "' must be a string.",
                           "invalid_field_type");
    }
    return std::optional<std::string>{it->get<std::string>()};
}

// Primary field with the legacy "target" alias.
core::errors::Result<std::string> required_subject(const json& object,
                                                   const char* key) {
    auto primary = optional_string(object, key);
    if (core::errors::is_error(primary)) {
        return core::errors::get_error(primary);
    }
    if (core::errors::get_value(primary).has_value()) {
        return core::errors::get_value(primary).value();
    }

    auto target = optional_string(object, "target");
    if (core::errors::is_error(target)) {
        return core::errors::get_error(target);
    }
    if (core::errors::get_value(target).has_value()) {
        return core::errors::get_value(target).value();
    }
    return parse_error(std::string("Missing required field '") + key + "'.",
                       "missing_field");
}

// Reads `key` from the action object, falling back to parameters.<key>.
core::errors::Result<std::optional<std::string>> field_or_parameter(
    const json& object, const char* key) {
    auto direct = optional_string(object, key);
    if (core::errors::is_error(direct) ||
        core::errors::get_value(direct).has_value()) {
        return direct;
    }
    const auto params = object.find("parameters");
    if (params == object.end() || params->is_null()) {
        return std::optional<std::string>{};
    }
    return optional_string(*params, key);
}

core::errors::Result<Command> decode_start_application(const json& object) {
    if (auto unexpected = reject_unexpected_keys(
            object, {"action", "name", "target", "reason", "parameters"},
            "start_app")) {
        return unexpected.value();
    }
    auto name = required_subject(object, "name");
    if (core::errors::is_error(name)) {
        return core::errors::get_error(name);
    }
    return Command::start_application(core::errors::get_value(name));
}

core::errors::Result<Command> decode_kill_process(const json& object) {
    if (auto unexpected = reject_unexpected_keys(
            object, {"action", "name", "target", "signal", "reason", "parameters"},
            "kill_process")) {
        return unexpected.value();
    }
    auto name = required_subject(object, "name");
    if (core::errors::is_error(name)) {
        return core::errors::get_error(name);
    }

    auto signal_text = field_or_parameter(object, "signal");
    if (core::errors::is_error(signal_text)) {
        return core::errors::get_error(signal_text);
    }
    KillSignal signal = KillSignal::Term;
    if (core::errors::get_value(signal_text).has_value()) {
        const std::string& text = core::errors::get_value(signal_text).value();
        const auto parsed = command::kill_signal_from_string(text);
        if (!parsed.has_value()) {
            return parse_error("Unsupported signal '" + text +
                                   "'; expected one of TERM, KILL, HUP, INT.",
                               "invalid_field_value");
        }
        signal = parsed.value();
    }
    return Command::kill_process(core::errors::get_value(name), signal);
}

core::errors::Result<Command> decode_list_processes(const json& object) {
    if (auto unexpected = reject_unexpected_keys(
            object, {"action", "filter", "target", "reason", "parameters"},
            "list_processes")) {
        return unexpected.value();
    }
    auto filter = field_or_parameter(object, "filter");
    if (core::errors::is_error(filter)) {
        return core::errors::get_error(filter);
    }
    std::optional<std::string> value = core::errors::get_value(filter);
    if (!value.has_value()) {
        auto target = optional_string(object, "target");
        if (core::errors::is_error(target)) {
            return core::errors::get_error(target);
        }
        value = core::errors::get_value(target);
    }
    if (value.has_value() && value.value() == "all") {
        value.reset();
    }
    return Command::list_processes(value);
}

core::errors::Result<Command> decode_restart_service(const json& object) {
    if (auto unexpected = reject_unexpected_keys(
            object, {"action", "unit", "target", "reason", "parameters"},
            "restart_service")) {
        return unexpected.value();
    }
    auto unit = required_subject(object, "unit");
    if (core::errors::is_error(unit)) {
        return core::errors::get_error(unit);
    }
    return Command::restart_service(core::errors::get_value(unit));
}

core::errors::Result<Command> decode_shell_query(const json& object) {
    if (auto unexpected = reject_unexpected_keys(
            object, {"action", "program", "args", "reason"}, "shell_query")) {
        return unexpected.value();
    }
    auto program_text = optional_string(object, "program");
    if (core::errors::is_error(program_text)) {
        return core::errors::get_error(program_text);
    }
    if (!core::errors::get_value(program_text).has_value()) {
        return parse_error("Missing required field 'program'.", "missing_field");
    }
    const std::string& name = core::errors::get_value(program_text).value();
    const auto program = command::shell_program_from_string(name);
    if (!program.has_value()) {
        return parse_error("Shell query program '" + name +
                               "' is not in the allowed set {ps, grep}.",
                           "shell_program_not_allowed");
    }

    std::vector<std::string> args;
    const auto args_it = object.find("args");
    if (args_it != object.end() && !args_it->is_null()) {
        if (!args_it->is_array()) {
            return parse_error("Field 'args' must be an array of strings.",
                               "invalid_field_type");
        }
        if (args_it->size() > command::kMaxShellArgs) {
            return parse_error("Field 'args' has more than " +
                                   std::to_string(command::kMaxShellArgs) +
                                   " entries.",
                               "too_many_arguments");
        }
        for (const auto& arg : *args_it) {
            if (!arg.is_string()) {
                return parse_error("Field 'args' must be an array of strings.",
                                   "invalid_field_type");
            }
            args.push_back(arg.get<std::string>());
        }
    }
    return Command::shell_query(program.value(), std::move(args));
}

core::errors::Result<Command> decode_action(const json& object) {
    const auto params = object.find("parameters");
    if (params != object.end() && !params->is_null()) {
        if (!params->is_object()) {
            return parse_error("Field 'parameters' must be an object.",
                               "invalid_field_type");
        }
        if (auto unexpected =
                reject_unexpected_keys(*params, {"signal", "filter"}, "parameters")) {
            return unexpected.value();
        }
    }

    auto reason = optional_string(object, "reason");
    if (core::errors::is_error(reason)) {
        return core::errors::get_error(reason);
    }

    auto action_text = optional_string(object, "action");
    if (core::errors::is_error(action_text)) {
        return core::errors::get_error(action_text);
    }
    if (!core::errors::get_value(action_text).has_value()) {
        return parse_error("Missing required field 'action'.", "missing_field");
    }
    const std::string& action_name = core::errors::get_value(action_text).value();
    const auto tag = command::action_tag_from_string(action_name);
    if (!tag.has_value()) {
        return parse_error("Unknown action '" + action_name + "'.", "unknown_action");
    }

    switch (tag.value()) {
        case ActionTag::StartApplication:
            return decode_start_application(object);
        case ActionTag::KillProcess:
            return decode_kill_process(object);
        case ActionTag::ListProcesses:
            return decode_list_processes(object);
        case ActionTag::RestartService:
            return decode_restart_service(object);
        case ActionTag::ShellQuery:
            return decode_shell_query(object);
    }
    return parse_error("Unknown action '" + action_name + "'.", "unknown_action");
}

bool looks_like_envelope(const json& object) {
    return object.contains("command") || object.contains("cannot_process");
}

core::errors::Result<Command> decode_envelope(const json& object) {
    if (auto unexpected = reject_unexpected_keys(
            object, {"command", "error", "cannot_process"}, "response envelope")) {
        return unexpected.value();
    }

    auto error_text = optional_string(object, "error");
    if (core::errors::is_error(error_text)) {
        return core::errors::get_error(error_text);
    }
    const std::string model_error =
        core::errors::get_value(error_text).value_or("no reason given");

    const auto declined = object.find("cannot_process");
    if (declined != object.end() && !declined->is_null()) {
        if (!declined->is_boolean()) {
            return parse_error("Field 'cannot_process' must be a boolean.",
                               "invalid_field_type");
        }
        if (declined->get<bool>()) {
            return parse_error("Model declined the request: " + model_error,
                               "model_declined");
        }
    }

    const auto command_it = object.find("command");
    if (command_it == object.end() || command_it->is_null()) {
        return parse_error("Model returned no command: " + model_error,
                           "model_declined");
    }
    if (!command_it->is_object()) {
        return parse_error("Field 'command' must be an object.", "invalid_field_type");
    }
    return decode_action(*command_it);
}

}  // namespace

IntentParser::IntentParser(ParserLimits limits) : limits_(limits) {}

std::optional<std::string> extract_json_object(const std::string& text) {
    const auto first = text.find('{');
    const auto last = text.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) {
        return std::nullopt;
    }
    return text.substr(first, last - first + 1);
}

core::errors::Result<Command> IntentParser::parse(const std::string& raw_output) const {
    if (raw_output.size() > limits_.max_payload_bytes) {
        SYSINTENT_LOG_WARN("IntentParser: payload of " +
                           std::to_string(raw_output.size()) +
                           " bytes exceeds limit");
        return parse_error("Model output exceeds " +
                               std::to_string(limits_.max_payload_bytes) + " bytes.",
                           "payload_too_large");
    }

    const auto candidate = extract_json_object(raw_output);
    if (!candidate.has_value()) {
        return parse_error("Model output does not contain a JSON object.",
                           "malformed_json");
    }

    const json document = json::parse(candidate.value(), nullptr, false);
    if (document.is_discarded()) {
        return parse_error("Model output is not valid JSON.", "malformed_json");
    }
    if (!document.is_object()) {
        return parse_error("Model output must be a JSON object.", "malformed_json");
    }

    auto decoded = looks_like_envelope(document) ? decode_envelope(document)
                                                 : decode_action(document);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        SYSINTENT_LOG_WARN("IntentParser: rejected [" + err.code + "]: " + err.message);
        return decoded;
    }

    SYSINTENT_LOG_DEBUG("IntentParser: parsed " +
                        core::errors::get_value(decoded).describe());
    return decoded;
}

}  // namespace sysintent::intent
