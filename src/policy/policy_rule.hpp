#pragma once

#include <optional>
#include <string>
#include <vector>
#include "command/command.hpp"

namespace sysintent::policy {

enum class Decision {
    Allow,
    Deny
};

// Narrows a rule to commands whose argument values match.
// `field` selects the value(s) inspected: name, signal, filter, unit, program
// or args. When unset the action's primary field is used (args for
// shell_query, where the rule matches if any single argument matches).
struct ArgumentMatcher {
    std::optional<std::string> field;
    std::vector<std::string> any_of;    // case-insensitive exact match
    std::optional<std::string> regex;   // ECMAScript, case-insensitive search
};

struct PolicyRule {
    std::string id;
    std::optional<command::ActionTag> action;  // nullopt matches every action
    Decision decision = Decision::Deny;
    std::string reason;
    std::optional<ArgumentMatcher> match;
};

struct Verdict {
    Decision decision = Decision::Deny;
    std::string reason;
    std::string matched_rule;

    bool allowed() const { return decision == Decision::Allow; }
};

inline std::string to_string(const Decision decision) {
    switch (decision) {
        case Decision::Allow:
            return "allow";
        case Decision::Deny:
            return "deny";
        default:
            return "unknown";
    }
}

}  // namespace sysintent::policy
