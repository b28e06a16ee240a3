#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "command/command.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/pipeline_errors.hpp"
#include "runtime/command_executor.hpp"

namespace {

using sysintent::command::Command;
using sysintent::command::KillSignal;
using sysintent::command::ShellProgram;
using sysintent::runtime::CommandExecutor;
using sysintent::runtime::ExecutionResult;
using sysintent::runtime::ExecutorSettings;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_command_executor_" + sysintent::core::config::generate_request_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

// Writes an executable /bin/sh script standing in for a system program.
std::string fake_program(const std::filesystem::path& path, const std::string& body) {
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body << "\n";
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add);
    return path.string();
}

Command must(sysintent::core::errors::Result<Command> result) {
    return std::get<Command>(std::move(result));
}

TEST(CommandExecutorTest, BuildsFixedArgvPerAction) {
    CommandExecutor executor;

    EXPECT_EQ(executor.build_argv(must(Command::kill_process("firefox", KillSignal::Kill))),
              (std::vector<std::string>{"pkill", "--signal", "KILL", "-x", "firefox"}));
    EXPECT_EQ(executor.build_argv(must(Command::list_processes())),
              (std::vector<std::string>{"ps", "aux"}));
    EXPECT_EQ(executor.build_argv(must(Command::list_processes(std::string("memory")))),
              (std::vector<std::string>{"ps", "aux", "--sort=-%mem"}));
    EXPECT_EQ(executor.build_argv(must(Command::restart_service("nginx"))),
              (std::vector<std::string>{"systemctl", "restart", "nginx.service"}));
    EXPECT_EQ(executor.build_argv(must(Command::restart_service("nginx.service"))),
              (std::vector<std::string>{"systemctl", "restart", "nginx.service"}));
    EXPECT_EQ(executor.build_argv(must(Command::shell_query(ShellProgram::Grep, {"-c", "x"}))),
              (std::vector<std::string>{"grep", "-c", "x"}));
    EXPECT_EQ(executor.build_argv(must(Command::start_application("firefox"))),
              (std::vector<std::string>{"firefox"}));
}

TEST(CommandExecutorTest, KillPatternMatchesOnlyTheLiteralName) {
    CommandExecutor executor;

    EXPECT_EQ(executor.build_argv(must(Command::kill_process(".*"))).back(), "\\.\\*");
    EXPECT_EQ(executor.build_argv(must(Command::kill_process("s.stemd"))).back(),
              "s\\.stemd");
    EXPECT_EQ(executor.build_argv(must(Command::kill_process("^sys+d?"))).back(),
              "\\^sys\\+d\\?");
    EXPECT_EQ(executor.build_argv(must(Command::kill_process("gnome-shell"))).back(),
              "gnome-shell");
}

TEST(CommandExecutorTest, DryRunDoesNotExecute) {
    TempWorkspace workspace;
    const auto marker = workspace.root() / "ran";
    ExecutorSettings settings;
    settings.dry_run = true;
    settings.programs.pkill =
        fake_program(workspace.root() / "pkill", "touch '" + marker.string() + "'");

    CommandExecutor executor(settings);
    const ExecutionResult result = executor.run(must(Command::kill_process("firefox")));

    EXPECT_TRUE(result.dry_run);
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdout_text.rfind("[dry run] would execute: ", 0), 0u);
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST(CommandExecutorTest, RunsKillThroughConfiguredProgram) {
    TempWorkspace workspace;
    ExecutorSettings settings;
    settings.programs.pkill = fake_program(workspace.root() / "pkill", "echo \"$@\"");

    CommandExecutor executor(settings);
    const ExecutionResult result = executor.run(must(Command::kill_process("firefox")));

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdout_text, "--signal TERM -x firefox\n");
    EXPECT_TRUE(result.error_message.empty());
    ASSERT_EQ(result.argv.size(), 5u);
}

TEST(CommandExecutorTest, ReportsNonZeroExit) {
    TempWorkspace workspace;
    ExecutorSettings settings;
    settings.programs.pkill =
        fake_program(workspace.root() / "pkill", "echo 'no process found' >&2; exit 1");

    CommandExecutor executor(settings);
    const ExecutionResult result = executor.run(must(Command::kill_process("ghost")));

    EXPECT_FALSE(result.success());
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(result.exit_code.value(), 1);
    EXPECT_EQ(result.stderr_text, "no process found\n");
    EXPECT_EQ(result.error_message, "Command exited with code 1");
}

TEST(CommandExecutorTest, FiltersAndLimitsProcessListing) {
    TempWorkspace workspace;
    ExecutorSettings settings;
    settings.max_output_lines = 3;
    settings.programs.ps = fake_program(
        workspace.root() / "ps",
        "echo 'USER PID COMMAND'\n"
        "echo 'me 1 Firefox'\n"
        "echo 'me 2 vim'\n"
        "echo 'me 3 firefox-bin'\n"
        "echo 'me 4 firefox --tab'\n");

    CommandExecutor filtered_executor(settings);
    const ExecutionResult filtered =
        filtered_executor.run(must(Command::list_processes(std::string("firefox"))));
    EXPECT_TRUE(filtered.success());
    EXPECT_EQ(filtered.stdout_text,
              "USER PID COMMAND\nme 1 Firefox\nme 3 firefox-bin\n"
              "... (truncated, showing first 3 lines)\n");

    const ExecutionResult all = filtered_executor.run(must(Command::list_processes()));
    EXPECT_EQ(all.stdout_text,
              "USER PID COMMAND\nme 1 Firefox\nme 2 vim\n"
              "... (truncated, showing first 3 lines)\n");
}

TEST(CommandExecutorTest, TimesOutLongRunningCommand) {
    TempWorkspace workspace;
    ExecutorSettings settings;
    settings.timeout_ms = 200;
    settings.programs.systemctl = fake_program(workspace.root() / "systemctl", "sleep 10");

    CommandExecutor executor(settings);
    const ExecutionResult result = executor.run(must(Command::restart_service("nginx")));

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error_message, "Command timed out after 200 ms");
    EXPECT_LT(result.duration_ms, 5000);
}

TEST(CommandExecutorTest, StartsApplicationsDetached) {
    CommandExecutor executor;
    const ExecutionResult started = executor.run(must(Command::start_application("true")));
    EXPECT_TRUE(started.success());
    EXPECT_EQ(started.stdout_text.rfind("Started 'true' (PID ", 0), 0u);

    const ExecutionResult missing =
        executor.run(must(Command::start_application("sysintent-no-such-app")));
    EXPECT_FALSE(missing.success());
    EXPECT_TRUE(missing.launch_failed);
    EXPECT_FALSE(missing.error_message.empty());
}

}  // namespace
