#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/pipeline_errors.hpp"

namespace sysintent::core::config {

inline constexpr std::uint32_t kMinTimeoutMs = 1;
inline constexpr std::uint32_t kMaxTimeoutMs = 600000;
inline constexpr std::size_t kMinOutputBytes = 1024;
inline constexpr std::size_t kMaxOutputBytes = 16 * 1024 * 1024;

struct ProgramPaths {
    std::string pkill = "pkill";
    std::string ps = "ps";
    std::string grep = "grep";
    std::string systemctl = "systemctl";
};

// Everything the pipeline is configured with. Built once at startup from
// defaults, an optional JSON settings file, the environment and CLI flags,
// then passed by value into the components that need it.
struct Settings {
    std::optional<std::filesystem::path> policy_file;
    std::filesystem::path audit_log_path = "sysintent-audit.jsonl";
    std::uint32_t timeout_ms = 10000;
    std::size_t max_output_bytes = 64 * 1024;
    std::size_t max_output_lines = 100;
    std::size_t max_payload_bytes = 8192;
    bool dry_run = false;
    std::string log_level = "info";
    ProgramPaths programs;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
std::optional<std::string> process_environment(const std::string& name);

// Overlays the keys present in a JSON settings file onto `base`.
errors::Result<Settings> load_settings_file(const std::filesystem::path& path,
                                            Settings base);

// Overlays SYSINTENT_* environment variables onto `settings`.
errors::Status apply_environment(Settings& settings,
                                 const EnvLookup& lookup = process_environment);

errors::Status validate_settings(const Settings& settings);

errors::Result<std::uint64_t> parse_bounded_integer(const std::string& text,
                                                    std::uint64_t min_value,
                                                    std::uint64_t max_value,
                                                    const std::string& name);

}  // namespace sysintent::core::config
