#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/workspace_paths.hpp"
#include "core/errors/loop_errors.hpp"
#include "protocol/work_item.hpp"

namespace ralph::work {

class WorkStatusQuery {
public:
    virtual ~WorkStatusQuery() = default;

    // Every item in scope, sorted by change id.
    virtual core::errors::Result<std::vector<protocol::WorkItem>> list_items(
        const protocol::WorkScope& scope) const = 0;
    virtual core::errors::Result<protocol::WorkStatus> get_status(
        const std::string& change_id) const = 0;
};

class TaskQuery {
public:
    virtual ~TaskQuery() = default;

    virtual core::errors::Result<protocol::TaskProgress> task_progress(
        const std::string& change_id) const = 0;
};

// Documents folded into the prompt. Missing documents are not errors.
class ChangeDocuments {
public:
    virtual ~ChangeDocuments() = default;

    virtual std::optional<std::string> change_proposal(const std::string& change_id) const = 0;
    virtual std::optional<std::string> module_overview(const std::string& module_id) const = 0;
};

// "003-05_add-login" belongs to module "003".
std::string module_of(const std::string& change_id);

protocol::TaskProgress parse_tasks(const std::string& markdown);

protocol::WorkStatus derive_status(bool has_proposal, bool has_tasks,
                                   const protocol::TaskProgress& progress);

// Change directories under .ralph/changes.
class FsWorkRepository final : public WorkStatusQuery,
                               public TaskQuery,
                               public ChangeDocuments {
public:
    explicit FsWorkRepository(core::config::WorkspacePaths paths);

    core::errors::Result<std::vector<protocol::WorkItem>> list_items(
        const protocol::WorkScope& scope) const override;
    core::errors::Result<protocol::WorkStatus> get_status(
        const std::string& change_id) const override;
    core::errors::Result<protocol::TaskProgress> task_progress(
        const std::string& change_id) const override;
    std::optional<std::string> change_proposal(const std::string& change_id) const override;
    std::optional<std::string> module_overview(const std::string& module_id) const override;

private:
    core::errors::Result<std::filesystem::path> change_dir(const std::string& change_id) const;

    core::config::WorkspacePaths paths_;
};

}  // namespace ralph::work
