#include "core/config/settings.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace sysintent::core::config {

using errors::ErrorCategory;
using errors::PipelineError;
using nlohmann::json;

namespace {

PipelineError config_error(const std::string& message, const std::string& code,
                           const std::string& hint = "") {
    return PipelineError{ErrorCategory::Config, message, code, hint};
}

errors::Status read_string(const json& object, const char* key, std::string& out) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return errors::ok();
    }
    if (!it->is_string()) {
        return config_error(std::string("Setting '") + key + "' must be a string.",
                            "invalid_setting");
    }
    out = it->get<std::string>();
    return errors::ok();
}

errors::Status read_unsigned(const json& object, const char* key, std::uint64_t& out) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return errors::ok();
    }
    if (!it->is_number_unsigned()) {
        return config_error(std::string("Setting '") + key +
                                "' must be a non-negative integer.",
                            "invalid_setting");
    }
    out = it->get<std::uint64_t>();
    return errors::ok();
}

bool parse_bool(const std::string& text, bool& out) {
    if (text == "1" || text == "true" || text == "TRUE" || text == "yes") {
        out = true;
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE" || text == "no" ||
        text.empty()) {
        out = false;
        return true;
    }
    return false;
}

}  // namespace

std::optional<std::string> process_environment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

errors::Result<std::uint64_t> parse_bounded_integer(const std::string& text,
                                                    const std::uint64_t min_value,
                                                    const std::uint64_t max_value,
                                                    const std::string& name) {
    // Exception-free integer parsing
    std::uint64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return config_error("Invalid number for " + name + ": '" + text + "'",
                            "invalid_integer", "Provide a positive integer.");
    }
    if (value < min_value || value > max_value) {
        return config_error(name + " out of bounds", "bounds_error",
                            "Must be between " + std::to_string(min_value) + " and " +
                                std::to_string(max_value) + ".");
    }
    return value;
}

errors::Result<Settings> load_settings_file(const std::filesystem::path& path,
                                            Settings base) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return config_error("Settings file does not exist: " + path.string(),
                            "settings_file_missing");
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return config_error("Unable to open settings file: " + path.string(),
                            "settings_file_unreadable");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return config_error("Settings file is not a JSON object: " + path.string(),
                            "invalid_settings_json");
    }

    std::string text;
    if (document.contains("policy_file")) {
        auto status = read_string(document, "policy_file", text);
        if (errors::is_error(status)) {
            return errors::get_error(status);
        }
        base.policy_file = std::filesystem::path(text);
    }
    if (document.contains("audit_log")) {
        auto status = read_string(document, "audit_log", text);
        if (errors::is_error(status)) {
            return errors::get_error(status);
        }
        base.audit_log_path = text;
    }
    {
        auto status = read_string(document, "log_level", base.log_level);
        if (errors::is_error(status)) {
            return errors::get_error(status);
        }
    }

    std::uint64_t number = base.timeout_ms;
    auto status = read_unsigned(document, "timeout_ms", number);
    if (errors::is_error(status)) {
        return errors::get_error(status);
    }
    if (number > kMaxTimeoutMs) {
        return config_error("timeout_ms out of bounds", "bounds_error");
    }
    base.timeout_ms = static_cast<std::uint32_t>(number);

    number = base.max_output_bytes;
    status = read_unsigned(document, "max_output_bytes", number);
    if (errors::is_error(status)) {
        return errors::get_error(status);
    }
    base.max_output_bytes = static_cast<std::size_t>(number);

    number = base.max_output_lines;
    status = read_unsigned(document, "max_output_lines", number);
    if (errors::is_error(status)) {
        return errors::get_error(status);
    }
    base.max_output_lines = static_cast<std::size_t>(number);

    number = base.max_payload_bytes;
    status = read_unsigned(document, "max_payload_bytes", number);
    if (errors::is_error(status)) {
        return errors::get_error(status);
    }
    base.max_payload_bytes = static_cast<std::size_t>(number);

    const auto dry_run = document.find("dry_run");
    if (dry_run != document.end()) {
        if (!dry_run->is_boolean()) {
            return config_error("Setting 'dry_run' must be a boolean.", "invalid_setting");
        }
        base.dry_run = dry_run->get<bool>();
    }

    const auto programs = document.find("programs");
    if (programs != document.end()) {
        if (!programs->is_object()) {
            return config_error("Setting 'programs' must be an object.", "invalid_setting");
        }
        for (auto it = programs->begin(); it != programs->end(); ++it) {
            std::string* slot = nullptr;
            if (it.key() == "pkill") {
                slot = &base.programs.pkill;
            } else if (it.key() == "ps") {
                slot = &base.programs.ps;
            } else if (it.key() == "grep") {
                slot = &base.programs.grep;
            } else if (it.key() == "systemctl") {
                slot = &base.programs.systemctl;
            } else {
                return config_error("Unknown program '" + it.key() + "' in settings.",
                                    "invalid_setting");
            }
            if (!it->is_string() || it->get<std::string>().empty()) {
                return config_error("Program path for '" + it.key() +
                                        "' must be a non-empty string.",
                                    "invalid_setting");
            }
            *slot = it->get<std::string>();
        }
    }

    auto valid = validate_settings(base);
    if (errors::is_error(valid)) {
        return errors::get_error(valid);
    }
    return base;
}

errors::Status apply_environment(Settings& settings, const EnvLookup& lookup) {
    if (auto value = lookup("SYSINTENT_POLICY_FILE"); value && !value->empty()) {
        settings.policy_file = std::filesystem::path(value.value());
    }
    if (auto value = lookup("SYSINTENT_AUDIT_LOG"); value && !value->empty()) {
        settings.audit_log_path = value.value();
    }
    if (auto value = lookup("SYSINTENT_TIMEOUT_MS"); value) {
        auto parsed = parse_bounded_integer(value.value(), kMinTimeoutMs, kMaxTimeoutMs,
                                            "SYSINTENT_TIMEOUT_MS");
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        settings.timeout_ms = static_cast<std::uint32_t>(errors::get_value(parsed));
    }
    if (auto value = lookup("SYSINTENT_DRY_RUN"); value) {
        bool dry_run = false;
        if (!parse_bool(value.value(), dry_run)) {
            return config_error("SYSINTENT_DRY_RUN must be true or false.",
                                "invalid_setting");
        }
        settings.dry_run = dry_run;
    }
    if (auto value = lookup("SYSINTENT_LOG_LEVEL"); value && !value->empty()) {
        settings.log_level = value.value();
    }
    return validate_settings(settings);
}

errors::Status validate_settings(const Settings& settings) {
    if (settings.timeout_ms < kMinTimeoutMs || settings.timeout_ms > kMaxTimeoutMs) {
        return config_error("timeout_ms out of bounds", "bounds_error",
                            "Must be between 1 and 600000.");
    }
    if (settings.max_output_bytes < kMinOutputBytes ||
        settings.max_output_bytes > kMaxOutputBytes) {
        return config_error("max_output_bytes out of bounds", "bounds_error",
                            "Must be between 1024 and 16777216.");
    }
    if (settings.max_payload_bytes == 0) {
        return config_error("max_payload_bytes must be greater than zero.",
                            "bounds_error");
    }
    if (settings.audit_log_path.empty()) {
        return config_error("Audit log path cannot be empty.", "invalid_setting");
    }
    logging::LogLevel level = logging::LogLevel::INFO;
    if (!logging::Logger::parse_level(settings.log_level, level)) {
        return config_error("Unknown log level: " + settings.log_level,
                            "invalid_setting", "Use debug, info, warn or error.");
    }
    return errors::ok();
}

}  // namespace sysintent::core::config
