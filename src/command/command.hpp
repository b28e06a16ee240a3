#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "core/errors/pipeline_errors.hpp"

namespace sysintent::command {

inline constexpr std::size_t kMaxFieldLength = 256;
inline constexpr std::size_t kMaxShellArgs = 16;

enum class ActionTag {
    StartApplication,
    KillProcess,
    ListProcesses,
    RestartService,
    ShellQuery
};

// The only programs a shell query may name.
enum class ShellProgram {
    Ps,
    Grep
};

enum class KillSignal {
    Term,
    Kill,
    Hup,
    Int
};

struct StartApplication {
    std::string name;
};

struct KillProcess {
    std::string name;
    KillSignal signal = KillSignal::Term;
};

struct ListProcesses {
    std::optional<std::string> filter;
};

struct RestartService {
    std::string unit;
};

struct ShellQuery {
    ShellProgram program = ShellProgram::Ps;
    std::vector<std::string> args;
};

using Action = std::variant<StartApplication, KillProcess, ListProcesses,
                            RestartService, ShellQuery>;

// A validated, immutable action. Instances can only be obtained through the
// factories below, each of which enforces the field constraints.
class Command {
public:
    static core::errors::Result<Command> start_application(std::string name);
    static core::errors::Result<Command> kill_process(
        std::string name, KillSignal signal = KillSignal::Term);
    static core::errors::Result<Command> list_processes(
        std::optional<std::string> filter = std::nullopt);
    static core::errors::Result<Command> restart_service(std::string unit);
    static core::errors::Result<Command> shell_query(
        ShellProgram program, std::vector<std::string> args);

    ActionTag tag() const;
    const Action& action() const { return action_; }

    // One-line human readable form, e.g. "kill_process name=firefox signal=TERM".
    std::string describe() const;

private:
    explicit Command(Action action);

    Action action_;
};

enum class FieldKind {
    Name,      // application, process or unit name: no '/', no leading '-'
    Argument   // shell query argument: may contain '/' and start with '-'
};

core::errors::Status validate_field(const std::string& field_name,
                                    const std::string& value, FieldKind kind);

std::string to_string(ActionTag tag);
std::string to_string(ShellProgram program);
std::string to_string(KillSignal signal);

std::optional<ActionTag> action_tag_from_string(const std::string& text);
std::optional<ShellProgram> shell_program_from_string(const std::string& text);
std::optional<KillSignal> kill_signal_from_string(const std::string& text);

}  // namespace sysintent::command
