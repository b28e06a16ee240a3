#include <string>
#include <gtest/gtest.h>
#include "command/command.hpp"
#include "core/errors/pipeline_errors.hpp"
#include "intent/intent_parser.hpp"

namespace {

using sysintent::command::ActionTag;
using sysintent::command::KillProcess;
using sysintent::command::KillSignal;
using sysintent::command::ListProcesses;
using sysintent::command::ShellProgram;
using sysintent::command::ShellQuery;
using sysintent::core::errors::ErrorCategory;
using sysintent::core::errors::get_error;
using sysintent::core::errors::get_value;
using sysintent::core::errors::is_error;
using sysintent::intent::IntentParser;
using sysintent::intent::ParserLimits;

TEST(IntentParserTest, ParsesFlatKillProcess) {
    IntentParser parser;
    auto result = parser.parse(R"({"action": "kill_process", "name": "firefox"})");
    ASSERT_FALSE(is_error(result));

    const auto& command = get_value(result);
    ASSERT_EQ(command.tag(), ActionTag::KillProcess);
    const auto& kill = std::get<KillProcess>(command.action());
    EXPECT_EQ(kill.name, "firefox");
    EXPECT_EQ(kill.signal, KillSignal::Term);
}

TEST(IntentParserTest, ParsesEnvelopeInsideCodeFence) {
    IntentParser parser;
    const std::string raw =
        "Sure, here you go:\n```json\n"
        R"({"command": {"action": "kill_process", "target": "firefox",)"
        R"( "parameters": {"signal": "SIGKILL"}}, "error": null, "cannot_process": false})"
        "\n```\n";
    auto result = parser.parse(raw);
    ASSERT_FALSE(is_error(result));

    const auto& kill = std::get<KillProcess>(get_value(result).action());
    EXPECT_EQ(kill.name, "firefox");
    EXPECT_EQ(kill.signal, KillSignal::Kill);
}

TEST(IntentParserTest, ListProcessesAllMeansNoFilter) {
    IntentParser parser;
    auto result = parser.parse(R"({"action": "list_processes", "target": "all"})");
    ASSERT_FALSE(is_error(result));
    const auto& list = std::get<ListProcesses>(get_value(result).action());
    EXPECT_FALSE(list.filter.has_value());

    auto sorted = parser.parse(
        R"({"action": "list_processes", "parameters": {"filter": "cpu"}})");
    ASSERT_FALSE(is_error(sorted));
    EXPECT_EQ(std::get<ListProcesses>(get_value(sorted).action()).filter.value_or(""), "cpu");
}

TEST(IntentParserTest, ParsesShellQueryArguments) {
    IntentParser parser;
    auto result = parser.parse(
        R"({"action": "shell_query", "program": "grep", "args": ["-c", "sshd", "/var/log/auth.log"]})");
    ASSERT_FALSE(is_error(result));
    const auto& query = std::get<ShellQuery>(get_value(result).action());
    EXPECT_EQ(query.program, ShellProgram::Grep);
    ASSERT_EQ(query.args.size(), 3u);
    EXPECT_EQ(query.args[1], "sshd");
}

TEST(IntentParserTest, RejectsNonJson) {
    IntentParser parser;
    auto result = parser.parse("I think you should kill firefox.");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Parse);
    EXPECT_EQ(get_error(result).code, "malformed_json");

    auto broken = parser.parse(R"({"action": "kill_process", "name": })");
    ASSERT_TRUE(is_error(broken));
    EXPECT_EQ(get_error(broken).code, "malformed_json");
}

TEST(IntentParserTest, RejectsUnknownAction) {
    IntentParser parser;
    auto result = parser.parse(R"({"action": "format_disk", "name": "sda"})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_action");
}

TEST(IntentParserTest, RejectsMissingAndMistypedFields) {
    IntentParser parser;
    auto missing = parser.parse(R"({"action": "kill_process"})");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_field");

    auto no_action = parser.parse(R"({"name": "firefox"})");
    ASSERT_TRUE(is_error(no_action));
    EXPECT_EQ(get_error(no_action).code, "missing_field");

    auto mistyped = parser.parse(R"({"action": "kill_process", "name": 42})");
    ASSERT_TRUE(is_error(mistyped));
    EXPECT_EQ(get_error(mistyped).code, "invalid_field_type");

    auto bad_signal = parser.parse(
        R"({"action": "kill_process", "name": "firefox", "signal": "STOP"})");
    ASSERT_TRUE(is_error(bad_signal));
    EXPECT_EQ(get_error(bad_signal).code, "invalid_field_value");
}

TEST(IntentParserTest, RejectsUnexpectedFields) {
    IntentParser parser;
    auto result = parser.parse(
        R"({"action": "start_app", "name": "firefox", "shell": "bash -c reboot"})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_field");

    auto nested = parser.parse(
        R"({"action": "kill_process", "name": "x", "parameters": {"force": true}})");
    ASSERT_TRUE(is_error(nested));
    EXPECT_EQ(get_error(nested).code, "unexpected_field");
}

TEST(IntentParserTest, RejectsProgramOutsideAllowSet) {
    IntentParser parser;
    auto result = parser.parse(
        R"({"action": "shell_query", "program": "rm", "args": ["-rf", "/"]})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "shell_program_not_allowed");
}

TEST(IntentParserTest, RejectsTooManyArguments) {
    IntentParser parser;
    std::string args;
    for (int i = 0; i < 17; ++i) {
        args += (i == 0 ? "" : ",") + std::string("\"a\"");
    }
    auto result = parser.parse(R"({"action": "shell_query", "program": "ps", "args": [)" +
                               args + "]}");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "too_many_arguments");
}

TEST(IntentParserTest, PassesThroughFieldValidationErrors) {
    IntentParser parser;
    auto result = parser.parse(
        R"({"action": "kill_process", "name": "firefox; rm -rf /"})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "invalid_command");
}

TEST(IntentParserTest, ReportsModelDeclining) {
    IntentParser parser;
    auto result = parser.parse(
        R"({"command": null, "error": "I cannot do that", "cannot_process": true})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "model_declined");
    EXPECT_NE(get_error(result).message.find("I cannot do that"), std::string::npos);
}

TEST(IntentParserTest, EnforcesPayloadLimit) {
    ParserLimits limits;
    limits.max_payload_bytes = 64;
    IntentParser parser(limits);

    const std::string raw = R"({"action": "start_app", "name": ")" +
                            std::string(100, 'a') + R"("})";
    auto result = parser.parse(raw);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "payload_too_large");
}

TEST(IntentParserTest, ExtractsOutermostObject) {
    const auto extracted =
        sysintent::intent::extract_json_object("noise {\"a\": {\"b\": 1}} trailing");
    ASSERT_TRUE(extracted.has_value());
    EXPECT_EQ(extracted.value(), "{\"a\": {\"b\": 1}}");
    EXPECT_FALSE(sysintent::intent::extract_json_object("no braces").has_value());
}

}  // namespace
