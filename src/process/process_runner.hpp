#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"

namespace ralph::process {

struct ProcessRequest {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path working_directory = ".";
    std::map<std::string, std::string> env;
    // Zero disables the respective timeout.
    std::chrono::milliseconds inactivity_timeout{0};
    std::chrono::milliseconds total_timeout{0};
    // Echo output to this process's stdout/stderr while capturing it.
    bool stream_output = false;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Spawn failures (missing binary, bad working directory) are errors; a
    // process that starts and fails is a capture with a non-zero exit code.
    virtual core::errors::Result<ProcessCapture> run(
        const ProcessRequest& request) const = 0;
};

class SystemProcessRunner final : public ProcessRunner {
public:
    core::errors::Result<ProcessCapture> run(
        const ProcessRequest& request) const override;
};

// `sh -c <command>` with an overall timeout; used for validation commands.
ProcessRequest shell_request(const std::string& command,
                             const std::filesystem::path& working_directory,
                             std::chrono::milliseconds total_timeout,
                             std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

std::string describe_command(const ProcessRequest& request);

}  // namespace ralph::process
