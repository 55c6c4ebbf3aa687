#include "work/worktree_resolver.hpp"

#include <chrono>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace ralph::work {

using core::errors::ErrorCategory;
using core::errors::LoopError;

namespace {

constexpr std::chrono::milliseconds kGitTimeout{30000};
const std::string kBranchPrefix = "refs/heads/";

}  // namespace

std::vector<WorktreeEntry> parse_worktree_porcelain(const std::string& output) {
    std::vector<WorktreeEntry> entries;
    std::optional<WorktreeEntry> current;

    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            if (current.has_value()) {
                entries.push_back(std::move(current.value()));
                current.reset();
            }
            continue;
        }

        if (line.rfind("worktree ", 0) == 0) {
            if (current.has_value()) {
                entries.push_back(std::move(current.value()));
            }
            current = WorktreeEntry{};
            current->path = line.substr(9);
            continue;
        }
        if (!current.has_value()) {
            continue;
        }
        if (line == "bare") {
            current->is_bare = true;
        } else if (line.rfind("branch ", 0) == 0) {
            std::string ref = line.substr(7);
            if (ref.rfind(kBranchPrefix, 0) == 0) {
                ref = ref.substr(kBranchPrefix.size());
            }
            current->branch = ref;
        }
    }
    if (current.has_value()) {
        entries.push_back(std::move(current.value()));
    }
    return entries;
}

GitWorktreeSource::GitWorktreeSource(std::shared_ptr<const process::ProcessRunner> runner,
                                     std::filesystem::path repo_dir)
    : runner_(std::move(runner)), repo_dir_(std::move(repo_dir)) {}

core::errors::Result<std::vector<WorktreeEntry>> GitWorktreeSource::list_worktrees() const {
    process::ProcessRequest request;
    request.program = "git";
    request.args = {"worktree", "list", "--porcelain"};
    request.working_directory = repo_dir_;
    request.total_timeout = kGitTimeout;

    auto capture_result = runner_->run(request);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);
    if (capture.exit_code != 0) {
        return LoopError{ErrorCategory::Execution,
                         "git worktree list failed: " + capture.stderr_text,
                         "git_worktree_failed"};
    }
    return parse_worktree_porcelain(capture.stdout_text);
}

WorktreeResolver::WorktreeResolver(const WorktreeSource& source, const bool enabled,
                                   std::filesystem::path fallback)
    : source_(source), enabled_(enabled), fallback_(std::move(fallback)) {}

EffectiveWorkingDirectory WorktreeResolver::resolve(
    const std::optional<std::string>& change_id) const {
    EffectiveWorkingDirectory fallback{fallback_, false};
    if (!enabled_ || !change_id.has_value() || change_id->empty()) {
        return fallback;
    }

    auto listed = source_.list_worktrees();
    if (core::errors::is_error(listed)) {
        LOG_DEBUG("Worktree lookup failed, using " + fallback_.string() + ": " +
                  core::errors::get_error(listed).message);
        return fallback;
    }

    for (const auto& entry : core::errors::get_value(listed)) {
        if (entry.is_bare || !entry.branch.has_value()) {
            continue;
        }
        if (entry.branch.value() == change_id.value()) {
            LOG_DEBUG("Resolved worktree for " + change_id.value() + ": " +
                      entry.path.string());
            return EffectiveWorkingDirectory{entry.path, true};
        }
    }

    LOG_DEBUG("No worktree with branch " + change_id.value() + ", using " +
              fallback_.string());
    return fallback;
}

}  // namespace ralph::work
