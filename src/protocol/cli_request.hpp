#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sysintent::protocol {

    enum class CliMode {
        Handle,       // run one model response through the pipeline
        CheckPolicy   // validate a policy file and exit
    };

    // Validated command-line input. Unset optionals fall back to the
    // settings file, the environment and finally the built-in defaults.
    struct CliRequest {
        CliMode mode = CliMode::Handle;
        std::optional<std::string> input_text;
        std::optional<std::filesystem::path> input_file;   // neither set: read stdin
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> policy_file;
        std::optional<std::filesystem::path> audit_log;
        std::optional<std::uint32_t> timeout_ms;
        bool dry_run = false;
        bool verbose = false;
    };

} // namespace sysintent::protocol
