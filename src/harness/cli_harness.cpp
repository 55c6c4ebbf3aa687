#include "harness/cli_harness.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace ralph::harness {

using protocol::HarnessRunConfig;
using protocol::HarnessRunResult;

CliHarness::CliHarness(std::shared_ptr<const process::ProcessRunner> runner)
    : runner_(std::move(runner)) {}

core::errors::Result<HarnessRunResult> CliHarness::run(
    const HarnessRunConfig& config) {
    process::ProcessRequest request;
    request.program = binary();
    request.args = build_args(config);
    request.working_directory = config.working_directory;
    request.inactivity_timeout = config.inactivity_timeout;
    request.stream_output = streams_output();
    request.cancel_token = config.cancel_token
                               ? config.cancel_token
                               : std::make_shared<std::atomic_bool>(false);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_cancel_ = request.cancel_token;
    }

    LOG_DEBUG("Harness " + protocol::to_string(name()) + ": " +
              process::describe_command(request) + " (cwd " +
              config.working_directory.string() + ")");
    auto capture_result = runner_->run(request);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_cancel_.reset();
    }
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    HarnessRunResult result;
    result.exit_code = capture.exit_code;
    result.stdout_text = capture.stdout_text;
    result.stderr_text = capture.stderr_text;
    result.duration_ms = capture.duration_ms;
    result.timed_out = capture.timed_out;
    result.cancelled = capture.cancelled;
    return result;
}

void CliHarness::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_cancel_) {
        active_cancel_->store(true);
    }
}

std::vector<std::string> ClaudeCodeHarness::build_args(
    const HarnessRunConfig& config) const {
    std::vector<std::string> args;
    if (config.model.has_value()) {
        args.push_back("--model");
        args.push_back(config.model.value());
    }
    if (config.allow_all) {
        args.push_back("--dangerously-skip-permissions");
    }
    args.push_back("-p");
    args.push_back(config.prompt);
    return args;
}

std::vector<std::string> CodexHarness::build_args(
    const HarnessRunConfig& config) const {
    std::vector<std::string> args{"exec"};
    if (config.model.has_value()) {
        args.push_back("--model");
        args.push_back(config.model.value());
    }
    if (config.allow_all) {
        args.push_back("--yolo");
    }
    args.push_back(config.prompt);
    return args;
}

std::vector<std::string> GithubCopilotHarness::build_args(
    const HarnessRunConfig& config) const {
    std::vector<std::string> args;
    if (config.model.has_value()) {
        args.push_back("--model");
        args.push_back(config.model.value());
    }
    if (config.allow_all) {
        args.push_back("--yolo");
    }
    args.push_back("-p");
    args.push_back(config.prompt);
    return args;
}

std::vector<std::string> OpencodeHarness::build_args(
    const HarnessRunConfig& config) const {
    std::vector<std::string> args{"run"};
    if (config.model.has_value()) {
        args.push_back("-m");
        args.push_back(config.model.value());
    }
    args.push_back(config.prompt);
    return args;
}

}  // namespace ralph::harness
