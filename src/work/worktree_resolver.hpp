#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"
#include "process/process_runner.hpp"

namespace ralph::work {

struct WorktreeEntry {
    std::filesystem::path path;
    std::optional<std::string> branch;  // short name, without refs/heads/
    bool is_bare = false;
};

struct EffectiveWorkingDirectory {
    std::filesystem::path path;
    bool from_worktree = false;
};

class WorktreeSource {
public:
    virtual ~WorktreeSource() = default;

    virtual core::errors::Result<std::vector<WorktreeEntry>> list_worktrees() const = 0;
};

// Parses `git worktree list --porcelain`.
std::vector<WorktreeEntry> parse_worktree_porcelain(const std::string& output);

class GitWorktreeSource final : public WorktreeSource {
public:
    GitWorktreeSource(std::shared_ptr<const process::ProcessRunner> runner,
                      std::filesystem::path repo_dir);

    core::errors::Result<std::vector<WorktreeEntry>> list_worktrees() const override;

private:
    std::shared_ptr<const process::ProcessRunner> runner_;
    std::filesystem::path repo_dir_;
};

// Picks the worktree whose branch equals the targeted change id, otherwise
// the fallback directory. Never fails.
class WorktreeResolver {
public:
    WorktreeResolver(const WorktreeSource& source, bool enabled,
                     std::filesystem::path fallback);

    EffectiveWorkingDirectory resolve(const std::optional<std::string>& change_id) const;

private:
    const WorktreeSource& source_;
    bool enabled_;
    std::filesystem::path fallback_;
};

}  // namespace ralph::work
