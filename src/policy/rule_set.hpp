#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "core/errors/pipeline_errors.hpp"
#include "policy/policy_rule.hpp"

namespace sysintent::policy {

// An ordered, validated and read-only collection of policy rules. Built once
// at startup and shared between requests as std::shared_ptr<const RuleSet>.
class RuleSet {
public:
    struct CompiledRule {
        PolicyRule rule;
        std::optional<std::regex> pattern;
    };

    static core::errors::Result<std::shared_ptr<const RuleSet>> create(
        std::vector<PolicyRule> rules);

    const std::vector<CompiledRule>& rules() const { return rules_; }
    std::size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

private:
    explicit RuleSet(std::vector<CompiledRule> rules);

    std::vector<CompiledRule> rules_;
};

// Parses the JSON policy document:
//   {"rules": [{"id": "...", "action": "kill_process" | "*",
//               "decision": "allow" | "deny", "reason": "...",
//               "match": {"field": "name", "any_of": [...], "regex": "..."}}]}
core::errors::Result<std::shared_ptr<const RuleSet>> parse_rule_set(
    const std::string& json_text);

core::errors::Result<std::shared_ptr<const RuleSet>> load_rule_set_file(
    const std::filesystem::path& path);

// Rules used when no policy file is configured.
std::vector<PolicyRule> default_rules();
std::shared_ptr<const RuleSet> default_rule_set();

bool is_known_match_field(const std::string& field);

}  // namespace sysintent::policy
