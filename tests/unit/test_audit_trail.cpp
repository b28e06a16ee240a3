#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "audit/audit_sink.hpp"
#include "audit/audit_trail.hpp"
#include "command/command.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/pipeline_errors.hpp"

namespace {

using nlohmann::json;
using sysintent::audit::AuditEntry;
using sysintent::audit::AuditSink;
using sysintent::audit::AuditTrail;
using sysintent::audit::JsonlFileSink;
using sysintent::command::Command;
using sysintent::core::errors::ErrorCategory;
using sysintent::core::errors::get_error;
using sysintent::core::errors::is_error;
using sysintent::core::errors::PipelineError;
using sysintent::core::errors::Status;
using sysintent::policy::Decision;
using sysintent::policy::Verdict;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_audit_trail_" + sysintent::core::config::generate_request_id());
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

class FailingSink : public AuditSink {
public:
    Status append(const std::string&) override {
        return PipelineError{ErrorCategory::Audit, "disk full", "audit_write_failed"};
    }
    Status ready() override { return sysintent::core::errors::ok(); }
};

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

Command must(sysintent::core::errors::Result<Command> result) {
    return std::get<Command>(std::move(result));
}

AuditEntry executed_entry() {
    const Command command = must(Command::kill_process("firefox"));
    AuditEntry entry;
    entry.timestamp_unix_ms = 1700000000000;
    entry.request_id = "req-0000abcd";
    entry.raw_input = R"({"action": "kill_process", "name": "firefox"})";
    entry.parse.ok = true;
    entry.parse.command = command;
    entry.verdict = Verdict{Decision::Allow, "killing user processes is permitted",
                            "allow.kill_process"};

    sysintent::runtime::ExecutionResult result(command);
    result.argv = {"pkill", "--signal", "TERM", "-x", "firefox"};
    result.exit_code = 0;
    result.duration_ms = 12;
    entry.execution = result;
    return entry;
}

TEST(AuditTrailTest, SerializesExecutedEntry) {
    const json record = sysintent::audit::to_json(executed_entry());

    EXPECT_EQ(record["request_id"], "req-0000abcd");
    EXPECT_EQ(record["ts_unix_ms"], 1700000000000);
    EXPECT_EQ(record["parse"]["ok"], true);
    EXPECT_EQ(record["parse"]["command"]["action"], "kill_process");
    EXPECT_EQ(record["parse"]["command"]["signal"], "TERM");
    EXPECT_EQ(record["verdict"]["decision"], "allow");
    EXPECT_EQ(record["verdict"]["matched_rule"], "allow.kill_process");
    EXPECT_EQ(record["execution"]["exit_code"], 0);
    EXPECT_TRUE(record["execution"]["term_signal"].is_null());
    EXPECT_EQ(record["execution"]["success"], true);
    EXPECT_EQ(record["execution"]["argv"].size(), 5u);
}

TEST(AuditTrailTest, SerializesParseRejection) {
    AuditEntry entry;
    entry.request_id = "req-1";
    entry.raw_input = "not json";
    entry.parse.ok = false;
    entry.parse.error_code = "malformed_json";
    entry.parse.error_message = "Model output does not contain a JSON object.";
    entry.verdict = Verdict{Decision::Deny, "request could not be parsed", "parse.rejected"};

    const json record = sysintent::audit::to_json(entry);
    EXPECT_EQ(record["parse"]["ok"], false);
    EXPECT_EQ(record["parse"]["error_code"], "malformed_json");
    EXPECT_FALSE(record["parse"].contains("command"));
    EXPECT_EQ(record["verdict"]["decision"], "deny");
    EXPECT_TRUE(record["execution"].is_null());
}

TEST(AuditTrailTest, TruncatesLargeFields) {
    const std::string big(5000, 'x');
    const std::string cut = sysintent::audit::truncate_for_audit(big, 4096);
    EXPECT_EQ(cut.substr(0, 4096), std::string(4096, 'x'));
    EXPECT_EQ(cut.substr(4096), "...[truncated 904 bytes]");
    EXPECT_EQ(sysintent::audit::truncate_for_audit("short", 4096), "short");

    AuditEntry entry = executed_entry();
    entry.raw_input = std::string(2000, 'r');
    const json record = sysintent::audit::to_json(entry);
    EXPECT_LT(record["raw_input"].get<std::string>().size(), 1100u);
}

TEST(AuditTrailTest, AppendsOneJsonLinePerEntry) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "logs" / "audit.jsonl";
    AuditTrail trail(std::make_shared<JsonlFileSink>(log_path));

    ASSERT_FALSE(is_error(trail.ready()));
    ASSERT_FALSE(is_error(trail.record(executed_entry())));
    AuditEntry second = executed_entry();
    second.request_id = "req-2";
    ASSERT_FALSE(is_error(trail.record(second)));

    const auto lines = read_lines(log_path);
    ASSERT_EQ(lines.size(), 2u);
    const json first = json::parse(lines[0], nullptr, false);
    ASSERT_FALSE(first.is_discarded());
    EXPECT_EQ(first["request_id"], "req-0000abcd");
    EXPECT_EQ(json::parse(lines[1])["request_id"], "req-2");
}

TEST(AuditTrailTest, InvalidUtf8DoesNotBreakRecording) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "audit.jsonl";
    AuditTrail trail(std::make_shared<JsonlFileSink>(log_path));

    AuditEntry entry = executed_entry();
    entry.raw_input = std::string("bad \xff\xfe bytes");
    ASSERT_FALSE(is_error(trail.record(entry)));

    const auto lines = read_lines(log_path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_FALSE(json::parse(lines[0], nullptr, false).is_discarded());
}

TEST(AuditTrailTest, ConcurrentAppendsDoNotInterleave) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "audit.jsonl";
    auto trail = std::make_shared<const AuditTrail>(std::make_shared<JsonlFileSink>(log_path));

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([trail, t] {
            for (int i = 0; i < 10; ++i) {
                AuditEntry entry = executed_entry();
                entry.request_id = "req-" + std::to_string(t) + "-" + std::to_string(i);
                entry.raw_input = std::string(3000, static_cast<char>('a' + t));
                static_cast<void>(trail->record(entry));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const auto lines = read_lines(log_path);
    ASSERT_EQ(lines.size(), 80u);
    for (const auto& line : lines) {
        EXPECT_FALSE(json::parse(line, nullptr, false).is_discarded());
    }
}

TEST(AuditTrailTest, ReportsUnwritableLocation) {
    TempWorkspace workspace;
    const auto blocker = workspace.root() / "not_a_dir";
    {
        std::ofstream out(blocker);
        out << "file";
    }
    AuditTrail trail(std::make_shared<JsonlFileSink>(blocker / "audit.jsonl"));

    auto ready = trail.ready();
    ASSERT_TRUE(is_error(ready));
    EXPECT_EQ(get_error(ready).category, ErrorCategory::Audit);

    auto recorded = trail.record(executed_entry());
    ASSERT_TRUE(is_error(recorded));
    EXPECT_EQ(get_error(recorded).code, "audit_write_failed");
}

TEST(AuditTrailTest, PropagatesSinkFailure) {
    AuditTrail trail(std::make_shared<FailingSink>());
    auto recorded = trail.record(executed_entry());
    ASSERT_TRUE(is_error(recorded));
    EXPECT_EQ(get_error(recorded).message, "disk full");
}

}  // namespace
