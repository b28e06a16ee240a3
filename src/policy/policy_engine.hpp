#pragma once

#include <memory>
#include <optional>
#include <string>
#include "command/command.hpp"
#include "policy/policy_rule.hpp"
#include "policy/rule_set.hpp"

namespace sysintent::policy {

// Classifies a Command as allowed or denied. Evaluation order:
//   1. shell_query program outside {ps, grep}       -> deny
//   2. built-in destructive command classes         -> deny
//   3. configured rules in load order: first matching deny wins,
//      otherwise first matching allow
//   4. nothing matched                              -> deny (fail-closed)
// Steps 1 and 2 live in code and cannot be relaxed by a policy file.
class PolicyEngine {
public:
    explicit PolicyEngine(std::shared_ptr<const RuleSet> rules);

    Verdict evaluate(const command::Command& command) const;

    const std::shared_ptr<const RuleSet>& rule_set() const { return rules_; }

private:
    std::shared_ptr<const RuleSet> rules_;
};

// Names the destructive class a program name belongs to, if any
// (e.g. "rm" -> "deletion", "sudo" -> "privilege_escalation").
std::optional<std::string> destructive_class_of(const std::string& program);

}  // namespace sysintent::policy
