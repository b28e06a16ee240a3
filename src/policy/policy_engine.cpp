#include "policy/policy_engine.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace sysintent::policy {

using command::ActionTag;
using command::Command;

namespace {

constexpr const char* kFailClosedRule = "default.fail_closed";
constexpr const char* kShellAllowSetRule = "builtin.shell_program_allow_set";

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

const std::unordered_map<std::string, std::string>& destructive_table() {
    static const std::unordered_map<std::string, std::string> kTable = [] {
        const std::vector<std::pair<std::string, std::vector<std::string>>> classes = {
            {"deletion", {"rm", "rmdir", "shred", "unlink", "wipe", "srm"}},
            {"disk_format",
             {"mkfs", "mke2fs", "mkswap", "dd", "fdisk", "sfdisk", "cfdisk",
              "parted", "gdisk", "sgdisk", "wipefs"}},
            {"mount", {"mount", "umount", "losetup", "swapon", "swapoff"}},
            {"user_management",
             {"useradd", "userdel", "usermod", "adduser", "deluser", "passwd",
              "chpasswd", "groupadd", "groupdel", "groupmod", "gpasswd"}},
            {"permission_management",
             {"chmod", "chown", "chgrp", "setfacl", "chattr", "setcap"}},
            {"firewall",
             {"iptables", "ip6tables", "nft", "ufw", "firewall-cmd", "ebtables"}},
            {"privilege_escalation",
             {"sudo", "su", "pkexec", "doas", "runuser", "setpriv"}},
            {"power_state",
             {"reboot", "shutdown", "poweroff", "halt", "init", "telinit",
              "kexec", "systemd-reboot", "rescue", "emergency"}},
            {"interpreter",
             {"python", "python3", "perl", "ruby", "bash", "sh", "zsh", "dash",
              "fish", "ksh", "eval", "exec", "env", "xargs", "nohup"}},
            {"network_transfer",
             {"wget", "curl", "nc", "netcat", "ncat", "socat", "scp", "rsync",
              "ftp", "tftp"}},
            {"scheduling", {"crontab", "at", "batch", "systemd-run"}},
            {"kernel_modules", {"insmod", "rmmod", "modprobe", "sysctl"}},
        };
        std::unordered_map<std::string, std::string> table;
        for (const auto& entry : classes) {
            for (const auto& program : entry.second) {
                table.emplace(program, entry.first);
            }
        }
        return table;
    }();
    return kTable;
}

// "nginx.service" -> "nginx"; other suffixes are kept.
std::string strip_service_suffix(const std::string& unit) {
    constexpr std::size_t kSuffixLength = 8;  // ".service"
    if (unit.size() > kSuffixLength &&
        lowercase(unit.substr(unit.size() - kSuffixLength)) == ".service") {
        return unit.substr(0, unit.size() - kSuffixLength);
    }
    return unit;
}

std::optional<Verdict> builtin_verdict(const Command& command) {
    if (const auto* query = std::get_if<command::ShellQuery>(&command.action())) {
        if (query->program != command::ShellProgram::Ps &&
            query->program != command::ShellProgram::Grep) {
            return Verdict{Decision::Deny,
                           "shell_query program is outside the allowed set {ps, grep}",
                           kShellAllowSetRule};
        }
        // Bare words only: options and paths are left to the configured rules.
        for (const auto& arg : query->args) {
            if (arg.front() == '-' || arg.find('/') != std::string::npos) {
                continue;
            }
            if (const auto destructive = destructive_class_of(arg)) {
                return Verdict{Decision::Deny,
                               "shell_query argument '" + arg +
                                   "' names the destructive class " + destructive.value(),
                               "builtin.deny." + destructive.value()};
            }
        }
        return std::nullopt;
    }

    std::string program;
    if (const auto* start = std::get_if<command::StartApplication>(&command.action())) {
        program = start->name;
    } else if (const auto* restart =
                   std::get_if<command::RestartService>(&command.action())) {
        const std::string unit = strip_service_suffix(restart->unit);
        if (unit.find('.') != std::string::npos) {
            return Verdict{Decision::Deny,
                           "only .service units may be restarted, got '" +
                               restart->unit + "'",
                           "builtin.deny.non_service_unit"};
        }
        program = unit;
    } else {
        return std::nullopt;
    }

    const auto destructive = destructive_class_of(program);
    if (!destructive.has_value()) {
        return std::nullopt;
    }
    return Verdict{Decision::Deny,
                   "'" + program + "' belongs to the destructive class " +
                       destructive.value(),
                   "builtin.deny." + destructive.value()};
}

std::string primary_field(const ActionTag tag) {
    switch (tag) {
        case ActionTag::StartApplication:
        case ActionTag::KillProcess:
            return "name";
        case ActionTag::ListProcesses:
            return "filter";
        case ActionTag::RestartService:
            return "unit";
        case ActionTag::ShellQuery:
            return "args";
    }
    return "";
}

// Values of `field` on the command; empty when the command has no such field.
std::vector<std::string> subjects(const Command& command, const std::string& field) {
    const auto& action = command.action();
    if (const auto* start = std::get_if<command::StartApplication>(&action)) {
        if (field == "name") {
            return {start->name};
        }
    } else if (const auto* kill = std::get_if<command::KillProcess>(&action)) {
        if (field == "name") {
            return {kill->name};
        }
        if (field == "signal") {
            return {command::to_string(kill->signal)};
        }
    } else if (const auto* list = std::get_if<command::ListProcesses>(&action)) {
        if (field == "filter" && list->filter.has_value()) {
            return {list->filter.value()};
        }
    } else if (const auto* restart = std::get_if<command::RestartService>(&action)) {
        if (field == "unit") {
            return {strip_service_suffix(restart->unit)};
        }
    } else if (const auto* query = std::get_if<command::ShellQuery>(&action)) {
        if (field == "program") {
            return {command::to_string(query->program)};
        }
        if (field == "args") {
            return query->args;
        }
    }
    return {};
}

bool rule_matches(const RuleSet::CompiledRule& compiled, const Command& command) {
    const PolicyRule& rule = compiled.rule;
    if (rule.action.has_value() && rule.action.value() != command.tag()) {
        return false;
    }
    if (!rule.match.has_value()) {
        return true;
    }

    const ArgumentMatcher& matcher = rule.match.value();
    const std::string field = matcher.field.value_or(primary_field(command.tag()));
    for (const auto& value : subjects(command, field)) {
        const std::string lowered = lowercase(value);
        for (const auto& candidate : matcher.any_of) {
            if (lowered == lowercase(candidate)) {
                return true;
            }
        }
        if (compiled.pattern.has_value() &&
            std::regex_search(value, compiled.pattern.value())) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::optional<std::string> destructive_class_of(const std::string& program) {
    std::string name = lowercase(program);
    const auto slash = name.rfind('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    const auto& table = destructive_table();
    auto it = table.find(name);
    if (it != table.end()) {
        return it->second;
    }
    // mkfs.ext4, mkfs.vfat, ...
    const auto dot = name.find('.');
    if (dot != std::string::npos) {
        it = table.find(name.substr(0, dot));
        if (it != table.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

PolicyEngine::PolicyEngine(std::shared_ptr<const RuleSet> rules)
    : rules_(std::move(rules)) {}

Verdict PolicyEngine::evaluate(const Command& command) const {
    if (auto builtin = builtin_verdict(command)) {
        SYSINTENT_LOG_INFO("PolicyEngine: deny " + command.describe() + " by " +
                           builtin->matched_rule);
        return builtin.value();
    }

    const RuleSet::CompiledRule* first_allow = nullptr;
    if (rules_) {
        for (const auto& compiled : rules_->rules()) {
            if (!rule_matches(compiled, command)) {
                continue;
            }
            if (compiled.rule.decision == Decision::Deny) {
                SYSINTENT_LOG_INFO("PolicyEngine: deny " + command.describe() +
                                   " by " + compiled.rule.id);
                return Verdict{Decision::Deny, compiled.rule.reason, compiled.rule.id};
            }
            if (first_allow == nullptr) {
                first_allow = &compiled;
            }
        }
    }

    if (first_allow != nullptr) {
        SYSINTENT_LOG_INFO("PolicyEngine: allow " + command.describe() + " by " +
                           first_allow->rule.id);
        return Verdict{Decision::Allow, first_allow->rule.reason, first_allow->rule.id};
    }

    SYSINTENT_LOG_INFO("PolicyEngine: deny " + command.describe() +
                       " (no matching allow rule)");
    return Verdict{Decision::Deny, "no matching allow rule", kFailClosedRule};
}

}  // namespace sysintent::policy
