#include "loop/iteration_committer.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace ralph::loop {

using core::errors::ErrorCategory;
using core::errors::LoopError;

namespace {

constexpr std::chrono::milliseconds kGitTimeout{60000};

}  // namespace

IterationCommitter::IterationCommitter(const process::ProcessRunner& runner,
                                       std::shared_ptr<std::atomic_bool> cancel_token)
    : runner_(runner), cancel_token_(std::move(cancel_token)) {}

core::errors::Result<process::ProcessCapture> IterationCommitter::git(
    const std::filesystem::path& working_directory, std::vector<std::string> args) const {
    process::ProcessRequest request;
    request.program = "git";
    request.args = std::move(args);
    request.working_directory = working_directory;
    request.total_timeout = kGitTimeout;
    request.cancel_token = cancel_token_;
    return runner_.run(request);
}

core::errors::Result<std::size_t> IterationCommitter::count_changes(
    const std::filesystem::path& working_directory) const {
    auto status = git(working_directory, {"status", "--porcelain"});
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    const auto& capture = core::errors::get_value(status);
    if (capture.exit_code != 0) {
        return LoopError{ErrorCategory::Execution,
                         "Not a git work tree: " + working_directory.string(),
                         "not_a_git_repo"};
    }

    std::size_t count = 0;
    std::istringstream in(capture.stdout_text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            ++count;
        }
    }
    return count;
}

core::errors::Result<bool> IterationCommitter::commit(
    const std::filesystem::path& working_directory, const std::uint32_t iteration) const {
    auto changes = count_changes(working_directory);
    if (core::errors::is_error(changes)) {
        const auto& err = core::errors::get_error(changes);
        if (err.code == "not_a_git_repo") {
            LOG_DEBUG("Skipping commit: " + err.message);
            return false;
        }
        return err;
    }
    if (core::errors::get_value(changes) == 0) {
        LOG_DEBUG("Skipping commit: no changes in iteration " + std::to_string(iteration));
        return false;
    }

    auto added = git(working_directory, {"add", "-A"});
    if (core::errors::is_error(added)) {
        return core::errors::get_error(added);
    }
    if (core::errors::get_value(added).exit_code != 0) {
        return LoopError{ErrorCategory::Execution,
                         "git add failed: " + core::errors::get_value(added).stderr_text,
                         "git_commit_failed"};
    }

    const std::string message = "Ralph loop iteration " + std::to_string(iteration);
    auto committed = git(working_directory, {"commit", "-m", message});
    if (core::errors::is_error(committed)) {
        return core::errors::get_error(committed);
    }
    if (core::errors::get_value(committed).exit_code != 0) {
        return LoopError{ErrorCategory::Execution,
                         "git commit failed: " +
                             core::errors::get_value(committed).stderr_text,
                         "git_commit_failed",
                         "Use --no-commit to leave commits to the agent."};
    }
    LOG_INFO("Committed: " + message);
    return true;
}

}  // namespace ralph::loop
