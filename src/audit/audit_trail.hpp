#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "audit/audit_entry.hpp"
#include "audit/audit_sink.hpp"
#include "core/errors/pipeline_errors.hpp"

namespace sysintent::audit {

inline constexpr std::size_t kMaxAuditRawInputBytes = 1024;
inline constexpr std::size_t kMaxAuditOutputBytes = 4096;

class AuditTrail {
public:
    explicit AuditTrail(std::shared_ptr<AuditSink> sink);

    // Appends one entry. Failures come back as ErrorCategory::Audit and are
    // never swallowed here.
    core::errors::Status record(const AuditEntry& entry) const;

    core::errors::Status ready() const;

private:
    std::shared_ptr<AuditSink> sink_;
};

nlohmann::json command_to_json(const command::Command& command);
nlohmann::json to_json(const AuditEntry& entry);

// Cuts `text` to at most `limit` bytes and notes how much was dropped.
std::string truncate_for_audit(const std::string& text, std::size_t limit);

}  // namespace sysintent::audit
