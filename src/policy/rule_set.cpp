#include "policy/rule_set.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>

namespace sysintent::policy {

using command::ActionTag;
using core::errors::ErrorCategory;
using core::errors::PipelineError;
using nlohmann::json;

namespace {

PipelineError config_error(const std::string& message, const std::string& code) {
    return PipelineError{ErrorCategory::Config, message, code};
}

bool field_applies(const std::string& field, const std::optional<ActionTag>& action) {
    if (!action.has_value()) {
        return is_known_match_field(field);
    }
    switch (action.value()) {
        case ActionTag::StartApplication:
            return field == "name";
        case ActionTag::KillProcess:
            return field == "name" || field == "signal";
        case ActionTag::ListProcesses:
            return field == "filter";
        case ActionTag::RestartService:
            return field == "unit";
        case ActionTag::ShellQuery:
            return field == "program" || field == "args";
    }
    return false;
}

core::errors::Result<std::string> string_member(const json& object,
                                                const char* key,
                                                const std::string& rule_label) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return config_error(rule_label + ": field '" + key +
                                "' is required and must be a string.",
                            "invalid_policy_rule");
    }
    return it->get<std::string>();
}

core::errors::Result<PolicyRule> rule_from_json(const json& entry,
                                                const std::size_t index) {
    const std::string label = "rule #" + std::to_string(index);
    if (!entry.is_object()) {
        return config_error(label + " must be an object.", "invalid_policy_rule");
    }

    PolicyRule rule;

    auto id = string_member(entry, "id", label);
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }
    rule.id = core::errors::get_value(id);

    auto action = string_member(entry, "action", label);
    if (core::errors::is_error(action)) {
        return core::errors::get_error(action);
    }
    const std::string& action_name = core::errors::get_value(action);
    if (action_name != "*") {
        rule.action = command::action_tag_from_string(action_name);
        if (!rule.action.has_value()) {
            return config_error(label + ": unknown action '" + action_name + "'.",
                                "unknown_policy_action");
        }
    }

    auto decision = string_member(entry, "decision", label);
    if (core::errors::is_error(decision)) {
        return core::errors::get_error(decision);
    }
    const std::string& decision_name = core::errors::get_value(decision);
    if (decision_name == "allow") {
        rule.decision = Decision::Allow;
    } else if (decision_name == "deny") {
        rule.decision = Decision::Deny;
    } else {
        return config_error(label + ": decision must be 'allow' or 'deny'.",
                            "invalid_policy_decision");
    }

    auto reason = string_member(entry, "reason", label);
    if (core::errors::is_error(reason)) {
        return core::errors::get_error(reason);
    }
    rule.reason = core::errors::get_value(reason);

    const auto match_it = entry.find("match");
    if (match_it != entry.end() && !match_it->is_null()) {
        if (!match_it->is_object()) {
            return config_error(label + ": 'match' must be an object.",
                                "invalid_policy_rule");
        }
        ArgumentMatcher matcher;
        const auto field_it = match_it->find("field");
        if (field_it != match_it->end()) {
            if (!field_it->is_string()) {
                return config_error(label + ": 'match.field' must be a string.",
                                    "invalid_policy_rule");
            }
            matcher.field = field_it->get<std::string>();
        }
        const auto any_of_it = match_it->find("any_of");
        if (any_of_it != match_it->end()) {
            if (!any_of_it->is_array()) {
                return config_error(label + ": 'match.any_of' must be an array.",
                                    "invalid_policy_rule");
            }
            for (const auto& value : *any_of_it) {
                if (!value.is_string()) {
                    return config_error(
                        label + ": 'match.any_of' entries must be strings.",
                        "invalid_policy_rule");
                }
                matcher.any_of.push_back(value.get<std::string>());
            }
        }
        const auto regex_it = match_it->find("regex");
        if (regex_it != match_it->end()) {
            if (!regex_it->is_string()) {
                return config_error(label + ": 'match.regex' must be a string.",
                                    "invalid_policy_rule");
            }
            matcher.regex = regex_it->get<std::string>();
        }
        rule.match = std::move(matcher);
    }

    return rule;
}

}  // namespace

bool is_known_match_field(const std::string& field) {
    static const std::unordered_set<std::string> kFields = {
        "name", "signal", "filter", "unit", "program", "args"};
    return kFields.count(field) != 0;
}

RuleSet::RuleSet(std::vector<CompiledRule> rules) : rules_(std::move(rules)) {}

core::errors::Result<std::shared_ptr<const RuleSet>> RuleSet::create(
    std::vector<PolicyRule> rules) {
    std::unordered_set<std::string> seen_ids;
    std::vector<CompiledRule> compiled;
    compiled.reserve(rules.size());

    for (auto& rule : rules) {
        if (rule.id.empty()) {
            return config_error("Policy rule id cannot be empty.", "invalid_policy_rule");
        }
        if (!seen_ids.insert(rule.id).second) {
            return config_error("Duplicate policy rule id: " + rule.id,
                                "duplicate_policy_rule");
        }
        if (rule.reason.empty()) {
            return config_error("Policy rule '" + rule.id + "' needs a reason.",
                                "invalid_policy_rule");
        }

        CompiledRule entry;
        if (rule.match.has_value()) {
            const auto& matcher = rule.match.value();
            if (matcher.any_of.empty() && !matcher.regex.has_value()) {
                return config_error("Policy rule '" + rule.id +
                                        "' has a match without any_of or regex.",
                                    "invalid_policy_rule");
            }
            if (matcher.field.has_value() &&
                !field_applies(matcher.field.value(), rule.action)) {
                return config_error("Policy rule '" + rule.id + "' matches field '" +
                                        matcher.field.value() +
                                        "' which its action does not have.",
                                    "invalid_policy_field");
            }
            if (matcher.regex.has_value()) {
                try {
                    entry.pattern.emplace(matcher.regex.value(),
                                          std::regex::ECMAScript | std::regex::icase);
                } catch (const std::regex_error& e) {
                    return config_error("Policy rule '" + rule.id +
                                            "' has an invalid regex: " + e.what(),
                                        "invalid_policy_regex");
                }
            }
        }
        entry.rule = std::move(rule);
        compiled.push_back(std::move(entry));
    }

    return std::shared_ptr<const RuleSet>(new RuleSet(std::move(compiled)));
}

core::errors::Result<std::shared_ptr<const RuleSet>> parse_rule_set(
    const std::string& json_text) {
    const json document = json::parse(json_text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return config_error("Policy document is not a valid JSON object.",
                            "invalid_policy_json");
    }
    const auto rules_it = document.find("rules");
    if (rules_it == document.end() || !rules_it->is_array()) {
        return config_error("Policy document must contain a 'rules' array.",
                            "invalid_policy_json");
    }

    std::vector<PolicyRule> rules;
    std::size_t index = 0;
    for (const auto& entry : *rules_it) {
        auto rule = rule_from_json(entry, index++);
        if (core::errors::is_error(rule)) {
            return core::errors::get_error(rule);
        }
        rules.push_back(core::errors::get_value(rule));
    }
    return RuleSet::create(std::move(rules));
}

core::errors::Result<std::shared_ptr<const RuleSet>> load_rule_set_file(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return config_error("Policy file does not exist: " + path.string(),
                            "policy_file_missing");
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return config_error("Unable to open policy file: " + path.string(),
                            "policy_file_unreadable");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse_rule_set(buffer.str());
    if (core::errors::is_error(parsed)) {
        auto err = core::errors::get_error(parsed);
        err.message = path.string() + ": " + err.message;
        return err;
    }
    return parsed;
}

std::vector<PolicyRule> default_rules() {
    std::vector<PolicyRule> rules;

    rules.push_back(PolicyRule{
        "deny.kill_process.critical",
        ActionTag::KillProcess,
        Decision::Deny,
        "killing a critical system process is not allowed",
        ArgumentMatcher{std::string("name"),
                        {"init", "systemd", "dbus", "dbus-daemon", "udev",
                         "systemd-udevd", "systemd-journald", "systemd-logind",
                         "kernel", "kthreadd"},
                        std::string("^(kworker|ksoftirqd|migration)")}});

    rules.push_back(PolicyRule{
        "deny.restart_service.protected",
        ActionTag::RestartService,
        Decision::Deny,
        "restarting a protected service is not allowed",
        ArgumentMatcher{std::string("unit"),
                        {"systemd", "init", "dbus", "udev", "NetworkManager",
                         "networking", "sshd", "ssh", "gdm", "gdm3", "lightdm",
                         "sddm"},
                        std::nullopt}});

    rules.push_back(PolicyRule{
        "deny.shell_query.sensitive_path",
        ActionTag::ShellQuery,
        Decision::Deny,
        "shell queries may not read system configuration or device paths",
        ArgumentMatcher{std::string("args"),
                        {},
                        std::string("/+(\\./)*(etc|root|dev|proc|sys)(/|$)")}});

    rules.push_back(PolicyRule{
        "deny.shell_query.recursive",
        ActionTag::ShellQuery,
        Decision::Deny,
        "recursive searches are not allowed",
        ArgumentMatcher{
            std::string("args"),
            {"--recursive", "--dereference-recursive", "--directories=recurse"},
            std::string("^-[a-z]*r")}});

    rules.push_back(PolicyRule{"allow.start_app", ActionTag::StartApplication,
                               Decision::Allow, "starting applications is permitted",
                               std::nullopt});
    rules.push_back(PolicyRule{"allow.kill_process", ActionTag::KillProcess,
                               Decision::Allow, "killing user processes is permitted",
                               std::nullopt});
    rules.push_back(PolicyRule{"allow.list_processes", ActionTag::ListProcesses,
                               Decision::Allow, "listing processes is read-only",
                               std::nullopt});
    rules.push_back(PolicyRule{"allow.restart_service", ActionTag::RestartService,
                               Decision::Allow, "restarting services is permitted",
                               std::nullopt});
    rules.push_back(PolicyRule{"allow.shell_query", ActionTag::ShellQuery,
                               Decision::Allow, "read-only ps/grep queries are permitted",
                               std::nullopt});
    return rules;
}

std::shared_ptr<const RuleSet> default_rule_set() {
    auto created = RuleSet::create(default_rules());
    if (core::errors::is_error(created)) {
        return nullptr;
    }
    return core::errors::get_value(created);
}

}  // namespace sysintent::policy
