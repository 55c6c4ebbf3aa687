#include "process/process_runner.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "process/inactivity_watchdog.hpp"

extern char** environ;

namespace ralph::process {

using core::errors::ErrorCategory;
using core::errors::LoopError;

namespace {

// Written by the child to the close-on-exec status pipe when it cannot start.
struct SpawnFailure {
    int stage = 0;  // 1 = chdir, 2 = exec
    int error_number = 0;
};

// Output still arriving on inherited pipes after the child exits is read for
// at most this long, so a lingering grandchild cannot hold the loop open.
constexpr std::chrono::milliseconds kPipeDrainGrace{500};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

// Returns true when any bytes were read.
bool drain_pipe(int& fd, bool& is_open, std::string& out, std::ostream* echo) {
    if (!is_open) {
        return false;
    }

    bool read_any = false;
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            if (echo != nullptr) {
                echo->write(buffer, n);
                echo->flush();
            }
            read_any = true;
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return read_any;
        }
        is_open = false;
        close_fd(fd);
        return read_any;
    }
}

void kill_group(const pid_t pid) {
    static_cast<void>(kill(-pid, SIGKILL));
    static_cast<void>(kill(pid, SIGKILL));
}

// Checks for exit without reaping, keeping the pid reserved for the watchdog.
bool child_has_exited(const pid_t pid) {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    const int rc = waitid(P_PID, static_cast<id_t>(pid), &info,
                          WEXITED | WNOHANG | WNOWAIT);
    return rc == 0 && info.si_pid == pid;
}

std::vector<std::string> build_environment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string item(*entry);
        const auto eq = item.find('=');
        const std::string key = eq == std::string::npos ? item : item.substr(0, eq);
        if (overrides.find(key) == overrides.end()) {
            env.push_back(item);
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& value : values) {
        out.push_back(value.data());
    }
    out.push_back(nullptr);
    return out;
}

}  // namespace

ProcessRequest shell_request(const std::string& command,
                             const std::filesystem::path& working_directory,
                             const std::chrono::milliseconds total_timeout,
                             std::shared_ptr<std::atomic_bool> cancel_token) {
    ProcessRequest request;
    request.program = "sh";
    request.args = {"-c", command};
    request.working_directory = working_directory;
    request.total_timeout = total_timeout;
    request.cancel_token = std::move(cancel_token);
    return request;
}

std::string describe_command(const ProcessRequest& request) {
    std::string out = request.program;
    for (const auto& arg : request.args) {
        out += " ";
        if (arg.find_first_of(" \t\n'\"") != std::string::npos) {
            out += "'" + arg.substr(0, 60) + (arg.size() > 60 ? "..." : "") + "'";
        } else {
            out += arg;
        }
    }
    return out;
}

core::errors::Result<ProcessCapture> SystemProcessRunner::run(
    const ProcessRequest& request) const {
    if (request.program.empty()) {
        return LoopError{ErrorCategory::Input, "Process program cannot be empty.",
                         "empty_program"};
    }
    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Process cancelled before start.";
        return capture;
    }

    // Everything the child needs is allocated before fork().
    std::vector<std::string> argv_storage;
    argv_storage.push_back(request.program);
    argv_storage.insert(argv_storage.end(), request.args.begin(), request.args.end());
    std::vector<std::string> env_storage = build_environment(request.env);
    std::vector<char*> argv = to_c_array(argv_storage);
    std::vector<char*> envp = to_c_array(env_storage);
    const std::string cwd = request.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        return LoopError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        return LoopError{ErrorCategory::Internal, "Failed to fork process.",
                         "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so a kill reaches the agent's children as well.
        static_cast<void>(setpgid(0, 0));
        SpawnFailure failure;
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            failure.stage = 1;
            failure.error_number = errno;
            static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(status_pipe[0]));
        execvpe(argv[0], argv.data(), envp.data());
        failure.stage = 2;
        failure.error_number = errno;
        static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
        _exit(127);
    }

    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // Blocks until exec succeeds (EOF from close-on-exec) or the child reports failure.
    SpawnFailure failure;
    ssize_t status_bytes = 0;
    do {
        status_bytes = read(status_pipe[0], &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int ignored_status = 0;
        static_cast<void>(waitpid(pid, &ignored_status, 0));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        if (failure.stage == 1) {
            return LoopError{ErrorCategory::Execution,
                             "Failed to enter working directory " + cwd + ": " +
                                 std::strerror(failure.error_number),
                             "spawn_failed"};
        }
        return LoopError{ErrorCategory::Execution,
                         "Failed to spawn " + request.program + ": " +
                             std::strerror(failure.error_number),
                         "spawn_failed",
                         "Check that '" + request.program + "' is installed and on PATH."};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    InactivityWatchdog watchdog(pid, request.inactivity_timeout);
    watchdog.start();

    std::ostream* stdout_echo = request.stream_output ? &std::cout : nullptr;
    std::ostream* stderr_echo = request.stream_output ? &std::cerr : nullptr;

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    std::chrono::steady_clock::time_point exited_at;

    while (stdout_open || stderr_open || !child_exited) {
        if (request.cancel_token && request.cancel_token->load() && !child_exited &&
            !capture.cancelled) {
            capture.cancelled = true;
            kill_group(pid);
        }

        const auto now = std::chrono::steady_clock::now();
        if (!capture.timed_out && request.total_timeout.count() > 0 && !child_exited &&
            now - started > request.total_timeout) {
            capture.timed_out = true;
            kill_group(pid);
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 50));
        }

        const bool out_read =
            drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text, stdout_echo);
        const bool err_read =
            drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text, stderr_echo);
        if (out_read || err_read) {
            watchdog.touch();
        }

        if (!child_exited && child_has_exited(pid)) {
            child_exited = true;
            exited_at = std::chrono::steady_clock::now();
            watchdog.mark_finished();
        }

        if (child_exited && (stdout_open || stderr_open) &&
            std::chrono::steady_clock::now() - exited_at > kPipeDrainGrace) {
            LOG_DEBUG("Process " + std::to_string(pid) +
                      " exited but its output pipes are still open; stop reading.");
            break;
        }
    }

    watchdog.mark_finished();
    watchdog.join();
    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited != pid) {
        capture.exit_code = -1;
    } else if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }
    if (watchdog.fired()) {
        capture.timed_out = true;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace ralph::process
