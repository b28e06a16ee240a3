#include "runtime/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <initializer_list>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sysintent::runtime {

using core::errors::ErrorCategory;
using core::errors::PipelineError;

namespace {

constexpr std::int64_t kReapGraceMs = 500;

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(int& fd, std::string& out, bool& truncated, const std::size_t limit) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const std::size_t room = out.size() < limit ? limit - out.size() : 0;
            const std::size_t take = std::min(room, static_cast<std::size_t>(n));
            out.append(buffer, take);
            if (take < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        close_fd(fd);
        return;
    }
}

std::vector<char*> to_c_argv(const std::vector<std::string>& argv) {
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);
    return c_argv;
}

// Reads the errno an exec'ing child reports over a close-on-exec pipe.
// EOF without data means exec succeeded.
std::optional<int> read_exec_errno(const int fd) {
    int child_errno = 0;
    std::size_t received = 0;
    char* bytes = static_cast<char*>(static_cast<void*>(&child_errno));
    while (received < sizeof(child_errno)) {
        const ssize_t n = read(fd, bytes + received, sizeof(child_errno) - received);
        if (n > 0) {
            received += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    if (received == sizeof(child_errno)) {
        return child_errno;
    }
    return std::nullopt;
}

[[noreturn]] void exec_child(const std::vector<char*>& c_argv, const int error_fd) {
    execvp(c_argv[0], c_argv.data());
    const int exec_errno = errno;
    static_cast<void>(write(error_fd, &exec_errno, sizeof(exec_errno)));
    _exit(127);
}

void redirect_to_dev_null(const int target_fd) {
    const int null_fd = open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
        static_cast<void>(dup2(null_fd, target_fd));
        if (null_fd != target_fd) {
            static_cast<void>(close(null_fd));
        }
    }
}

std::int64_t elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - started)
        .count();
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const std::vector<std::string>& argv,
                                                 const ProcessLimits& limits) {
    if (argv.empty() || argv.front().empty()) {
        return PipelineError{ErrorCategory::Internal, "Cannot run an empty argv.",
                             "empty_argv"};
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    // All close-on-exec so children spawned concurrently by other threads
    // never inherit them; dup2 clears the flag on the child's stdout/stderr.
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        for (int* fds : {stdout_pipe, stderr_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return PipelineError{ErrorCategory::Internal, "Failed to create process pipes.",
                             "pipe_creation_failed"};
    }

    // Built before fork: only async-signal-safe calls are made in the child.
    const std::vector<char*> c_argv = to_c_argv(argv);

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fds : {stdout_pipe, stderr_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return PipelineError{ErrorCategory::Internal, "Failed to fork process.",
                             "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        redirect_to_dev_null(STDIN_FILENO);
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        exec_child(c_argv, exec_pipe[1]);
    }

    // Also set from the parent so the group exists before any kill below.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    ProcessCapture capture;
    const auto exec_errno = read_exec_errno(exec_pipe[0]);
    close_fd(exec_pipe[0]);
    if (exec_errno.has_value()) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        capture.launch_failed = true;
        capture.launch_error =
            "Failed to launch '" + argv.front() + "': " + std::strerror(exec_errno.value());
        capture.duration_ms = elapsed_ms(started);
        return capture;
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    int stdout_fd = stdout_pipe[0];
    int stderr_fd = stderr_pipe[0];
    bool child_reaped = false;
    std::int64_t reaped_at_ms = 0;
    int status = 0;
    bool status_lost = false;

    while (stdout_fd >= 0 || stderr_fd >= 0 || !child_reaped) {
        const std::int64_t elapsed = elapsed_ms(started);
        if (!child_reaped && !capture.timed_out && limits.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(limits.timeout_ms)) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_fd >= 0) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_fd >= 0) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        static_cast<void>(poll(fds, nfds, 50));

        drain_pipe(stdout_fd, capture.stdout_text, capture.stdout_truncated,
                   limits.max_output_bytes);
        drain_pipe(stderr_fd, capture.stderr_text, capture.stderr_truncated,
                   limits.max_output_bytes);

        if (!child_reaped) {
            // Observe the exit without reaping so the pgid cannot be recycled
            // before the rest of the group is killed.
            siginfo_t info{};
            const int waited =
                waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
            if (waited == 0 && info.si_pid == pid) {
                static_cast<void>(kill(-pid, SIGKILL));
                static_cast<void>(waitpid(pid, &status, 0));
                child_reaped = true;
                reaped_at_ms = elapsed_ms(started);
            } else if (waited == -1 && errno == ECHILD) {
                // Reaped elsewhere (SIGCHLD ignored); the status is lost.
                status_lost = true;
                child_reaped = true;
                reaped_at_ms = elapsed_ms(started);
            }
        } else if (elapsed_ms(started) - reaped_at_ms > kReapGraceMs) {
            // A process that left the group still holds the pipes.
            close_fd(stdout_fd);
            close_fd(stderr_fd);
        }
    }

    if (status_lost) {
        capture.error_message =
            "Exit status of '" + argv.front() + "' was lost; the child was reaped elsewhere.";
    } else if (WIFEXITED(status) && !capture.timed_out) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.term_signal = WTERMSIG(status);
    }

    capture.duration_ms = elapsed_ms(started);
    return capture;
}

core::errors::Result<DetachedSpawn> spawn_detached(const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        return PipelineError{ErrorCategory::Internal, "Cannot run an empty argv.",
                             "empty_argv"};
    }

    // pid_pipe carries the grandchild pid, exec_pipe its exec errno.
    int pid_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(pid_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        for (int* fds : {pid_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return PipelineError{ErrorCategory::Internal, "Failed to create process pipes.",
                             "pipe_creation_failed"};
    }

    const std::vector<char*> c_argv = to_c_argv(argv);

    const pid_t intermediate = fork();
    if (intermediate < 0) {
        for (int* fds : {pid_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return PipelineError{ErrorCategory::Internal, "Failed to fork process.",
                             "fork_failed"};
    }

    if (intermediate == 0) {
        static_cast<void>(close(pid_pipe[0]));
        static_cast<void>(close(exec_pipe[0]));
        static_cast<void>(setsid());
        const pid_t grandchild = fork();
        if (grandchild < 0) {
            _exit(1);
        }
        if (grandchild == 0) {
            static_cast<void>(close(pid_pipe[1]));
            redirect_to_dev_null(STDIN_FILENO);
            redirect_to_dev_null(STDOUT_FILENO);
            redirect_to_dev_null(STDERR_FILENO);
            exec_child(c_argv, exec_pipe[1]);
        }
        static_cast<void>(write(pid_pipe[1], &grandchild, sizeof(grandchild)));
        _exit(0);
    }

    close_fd(pid_pipe[1]);
    close_fd(exec_pipe[1]);
    int status = 0;
    static_cast<void>(waitpid(intermediate, &status, 0));

    DetachedSpawn spawn;
    pid_t grandchild = -1;
    std::size_t received = 0;
    char* bytes = static_cast<char*>(static_cast<void*>(&grandchild));
    while (received < sizeof(grandchild)) {
        const ssize_t n = read(pid_pipe[0], bytes + received, sizeof(grandchild) - received);
        if (n > 0) {
            received += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    close_fd(pid_pipe[0]);
    if (received != sizeof(grandchild)) {
        close_fd(exec_pipe[0]);
        spawn.launch_failed = true;
        spawn.launch_error = "Failed to fork detached process for '" + argv.front() + "'.";
        return spawn;
    }
    spawn.pid = grandchild;

    const auto exec_errno = read_exec_errno(exec_pipe[0]);
    close_fd(exec_pipe[0]);
    if (exec_errno.has_value()) {
        spawn.launch_failed = true;
        spawn.launch_error =
            "Failed to launch '" + argv.front() + "': " + std::strerror(exec_errno.value());
    }
    return spawn;
}

}  // namespace sysintent::runtime
