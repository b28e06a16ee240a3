#include "audit/audit_sink.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace sysintent::audit {

using core::errors::ErrorCategory;
using core::errors::PipelineError;

namespace {

PipelineError audit_error(const std::string& message) {
    return PipelineError{ErrorCategory::Audit, message, "audit_write_failed",
                         "Check that the audit log location is writable."};
}

}  // namespace

JsonlFileSink::JsonlFileSink(std::filesystem::path path) : path_(std::move(path)) {}

core::errors::Result<int> JsonlFileSink::open_for_append() {
    if (path_.empty()) {
        return audit_error("Audit log path is empty.");
    }

    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return audit_error("Unable to create audit log directory: " +
                               parent.string() + ": " + ec.message());
        }
    }

    const int fd = open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0640);
    if (fd < 0) {
        return audit_error("Unable to open audit log " + path_.string() + ": " +
                           std::strerror(errno));
    }
    return fd;
}

core::errors::Status JsonlFileSink::ready() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto opened = open_for_append();
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    static_cast<void>(close(core::errors::get_value(opened)));
    return core::errors::ok();
}

core::errors::Status JsonlFileSink::append(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto opened = open_for_append();
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    const int fd = core::errors::get_value(opened);

    if (flock(fd, LOCK_EX) != 0) {
        const std::string reason = std::strerror(errno);
        static_cast<void>(close(fd));
        return audit_error("Unable to lock audit log " + path_.string() + ": " + reason);
    }

    const std::string record = line + "\n";
    std::size_t written = 0;
    while (written < record.size()) {
        const ssize_t n = write(fd, record.data() + written, record.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        const std::string reason = n < 0 ? std::strerror(errno) : "short write";
        static_cast<void>(close(fd));
        return audit_error("Unable to write audit log " + path_.string() + ": " + reason);
    }

    if (fdatasync(fd) != 0) {
        const std::string reason = std::strerror(errno);
        static_cast<void>(close(fd));
        return audit_error("Unable to sync audit log " + path_.string() + ": " + reason);
    }

    // Closing the descriptor releases the flock.
    if (close(fd) != 0) {
        return audit_error("Unable to close audit log " + path_.string() + ": " +
                           std::strerror(errno));
    }
    return core::errors::ok();
}

}  // namespace sysintent::audit
