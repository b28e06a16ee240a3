#include "command/command.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace sysintent::command {

using core::errors::ErrorCategory;
using core::errors::PipelineError;

namespace {

constexpr const char* kForbiddenCharacters = ";|&$`><\\'\"(){}[]!";

std::string uppercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });
    return value;
}

PipelineError invalid_command(const std::string& message) {
    return PipelineError{ErrorCategory::Validation, message, "invalid_command"};
}

std::string printable(const std::string& value) {
    constexpr std::size_t kPreview = 48;
    std::string out;
    for (const char c : value.substr(0, kPreview)) {
        const auto uc = static_cast<unsigned char>(c);
        out.push_back(std::iscntrl(uc) != 0 ? '?' : c);
    }
    if (value.size() > kPreview) {
        out += "...";
    }
    return out;
}

}  // namespace

core::errors::Status validate_field(const std::string& field_name,
                                    const std::string& value,
                                    const FieldKind kind) {
    if (value.empty()) {
        return invalid_command("Field '" + field_name + "' cannot be empty.");
    }
    if (value.size() > kMaxFieldLength) {
        return invalid_command("Field '" + field_name + "' exceeds " +
                               std::to_string(kMaxFieldLength) + " characters.");
    }

    for (const char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::iscntrl(uc) != 0) {
            return invalid_command("Field '" + field_name +
                                   "' contains a control character.");
        }
        if (std::string(kForbiddenCharacters).find(c) != std::string::npos) {
            return invalid_command("Field '" + field_name +
                                   "' contains shell metacharacter '" +
                                   std::string(1, c) + "': " + printable(value));
        }
    }

    if (value.find("..") != std::string::npos) {
        return invalid_command("Field '" + field_name +
                               "' contains a path traversal sequence: " +
                               printable(value));
    }

    if (kind == FieldKind::Name) {
        if (value.find('/') != std::string::npos) {
            return invalid_command("Field '" + field_name +
                                   "' must be a bare name, not a path: " +
                                   printable(value));
        }
        if (value.front() == '-') {
            return invalid_command("Field '" + field_name +
                                   "' cannot start with '-': " + printable(value));
        }
        if (std::isspace(static_cast<unsigned char>(value.front())) != 0 ||
            std::isspace(static_cast<unsigned char>(value.back())) != 0) {
            return invalid_command("Field '" + field_name +
                                   "' has leading or trailing whitespace.");
        }
    }

    return core::errors::ok();
}

Command::Command(Action action) : action_(std::move(action)) {}

core::errors::Result<Command> Command::start_application(std::string name) {
    auto status = validate_field("name", name, FieldKind::Name);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    // The name is exec'd as argv[0] with no arguments.
    const bool has_space = std::any_of(name.begin(), name.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (has_space) {
        return invalid_command("Application name must be a single program name: " +
                               printable(name));
    }
    return Command(StartApplication{std::move(name)});
}

core::errors::Result<Command> Command::kill_process(std::string name,
                                                    const KillSignal signal) {
    auto status = validate_field("name", name, FieldKind::Name);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    return Command(KillProcess{std::move(name), signal});
}

core::errors::Result<Command> Command::list_processes(
    std::optional<std::string> filter) {
    if (filter.has_value()) {
        auto status = validate_field("filter", filter.value(), FieldKind::Name);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }
    return Command(ListProcesses{std::move(filter)});
}

core::errors::Result<Command> Command::restart_service(std::string unit) {
    auto status = validate_field("unit", unit, FieldKind::Name);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    return Command(RestartService{std::move(unit)});
}

core::errors::Result<Command> Command::shell_query(const ShellProgram program,
                                                   std::vector<std::string> args) {
    if (program != ShellProgram::Ps && program != ShellProgram::Grep) {
        return invalid_command("Shell query program is outside the allowed set.");
    }
    if (args.size() > kMaxShellArgs) {
        return invalid_command("Shell query accepts at most " +
                               std::to_string(kMaxShellArgs) + " arguments.");
    }
    for (std::size_t i = 0; i < args.size(); ++i) {
        auto status = validate_field("args[" + std::to_string(i) + "]", args[i],
                                     FieldKind::Argument);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }
    return Command(ShellQuery{program, std::move(args)});
}

ActionTag Command::tag() const {
    switch (action_.index()) {
        case 0:
            return ActionTag::StartApplication;
        case 1:
            return ActionTag::KillProcess;
        case 2:
            return ActionTag::ListProcesses;
        case 3:
            return ActionTag::RestartService;
        default:
            return ActionTag::ShellQuery;
    }
}

std::string Command::describe() const {
    std::ostringstream out;
    out << to_string(tag());
    if (const auto* start = std::get_if<StartApplication>(&action_)) {
        out << " name=" << start->name;
    } else if (const auto* kill = std::get_if<KillProcess>(&action_)) {
        out << " name=" << kill->name << " signal=" << to_string(kill->signal);
    } else if (const auto* list = std::get_if<ListProcesses>(&action_)) {
        out << " filter=" << list->filter.value_or("<none>");
    } else if (const auto* restart = std::get_if<RestartService>(&action_)) {
        out << " unit=" << restart->unit;
    } else if (const auto* query = std::get_if<ShellQuery>(&action_)) {
        out << " program=" << to_string(query->program) << " args=[";
        for (std::size_t i = 0; i < query->args.size(); ++i) {
            out << (i == 0 ? "" : ", ") << query->args[i];
        }
        out << "]";
    }
    return out.str();
}

std::string to_string(const ActionTag tag) {
    switch (tag) {
        case ActionTag::StartApplication:
            return "start_app";
        case ActionTag::KillProcess:
            return "kill_process";
        case ActionTag::ListProcesses:
            return "list_processes";
        case ActionTag::RestartService:
            return "restart_service";
        case ActionTag::ShellQuery:
            return "shell_query";
        default:
            return "unknown";
    }
}

std::string to_string(const ShellProgram program) {
    switch (program) {
        case ShellProgram::Ps:
            return "ps";
        case ShellProgram::Grep:
            return "grep";
        default:
            return "unknown";
    }
}

std::string to_string(const KillSignal signal) {
    switch (signal) {
        case KillSignal::Term:
            return "TERM";
        case KillSignal::Kill:
            return "KILL";
        case KillSignal::Hup:
            return "HUP";
        case KillSignal::Int:
            return "INT";
        default:
            return "unknown";
    }
}

std::optional<ActionTag> action_tag_from_string(const std::string& text) {
    if (text == "start_app" || text == "start_application") {
        return ActionTag::StartApplication;
    }
    if (text == "kill_process") {
        return ActionTag::KillProcess;
    }
    if (text == "list_processes") {
        return ActionTag::ListProcesses;
    }
    if (text == "restart_service") {
        return ActionTag::RestartService;
    }
    if (text == "shell_query") {
        return ActionTag::ShellQuery;
    }
    return std::nullopt;
}

std::optional<ShellProgram> shell_program_from_string(const std::string& text) {
    if (text == "ps") {
        return ShellProgram::Ps;
    }
    if (text == "grep") {
        return ShellProgram::Grep;
    }
    return std::nullopt;
}

std::optional<KillSignal> kill_signal_from_string(const std::string& text) {
    std::string name = uppercase(text);
    if (name.rfind("SIG", 0) == 0) {
        name = name.substr(3);
    }
    if (name == "TERM" || name == "15") {
        return KillSignal::Term;
    }
    if (name == "KILL" || name == "9") {
        return KillSignal::Kill;
    }
    if (name == "HUP" || name == "1") {
        return KillSignal::Hup;
    }
    if (name == "INT" || name == "2") {
        return KillSignal::Int;
    }
    return std::nullopt;
}

}  // namespace sysintent::command
