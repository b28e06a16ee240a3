#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "command/command.hpp"
#include "core/errors/pipeline_errors.hpp"

namespace sysintent::intent {

struct ParserLimits {
    std::size_t max_payload_bytes = 8192;
};

// Turns untrusted language-model output into a validated Command.
//
// Accepts either the flat shape
//     {"action": "kill_process", "name": "firefox"}
// or the envelope the model is prompted with
//     {"command": {...}, "error": null, "cannot_process": false}
// optionally wrapped in a markdown code fence or surrounded by chatter.
// Anything else is rejected with a Parse error; nothing is retried.
class IntentParser {
public:
    explicit IntentParser(ParserLimits limits = {});

    core::errors::Result<command::Command> parse(const std::string& raw_output) const;

    const ParserLimits& limits() const { return limits_; }

private:
    ParserLimits limits_;
};

// Returns the text between the first '{' and the last '}', if any.
std::optional<std::string> extract_json_object(const std::string& text);

}  // namespace sysintent::intent
