#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "core/errors/pipeline_errors.hpp"

namespace sysintent::audit {

// Destination for serialized audit lines.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    // Appends exactly one line. Must not interleave with concurrent appends.
    virtual core::errors::Status append(const std::string& line) = 0;

    // Reports whether an append is currently expected to succeed.
    virtual core::errors::Status ready() = 0;
};

// JSON Lines file opened with O_APPEND for every record. Appends are
// serialized in-process by a mutex and across processes by flock(2), and each
// line is flushed with fdatasync before append() returns.
class JsonlFileSink : public AuditSink {
public:
    explicit JsonlFileSink(std::filesystem::path path);

    core::errors::Status append(const std::string& line) override;
    core::errors::Status ready() override;

    const std::filesystem::path& path() const { return path_; }

private:
    core::errors::Result<int> open_for_append();

    std::filesystem::path path_;
    std::mutex mutex_;
};

}  // namespace sysintent::audit
