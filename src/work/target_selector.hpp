#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"
#include "protocol/loop_request.hpp"
#include "protocol/work_item.hpp"
#include "work/work_repository.hpp"

namespace ralph::work {

enum class ContinuationMode {
    Unscoped,        // no change targeted
    SingleChange,    // --change
    ModuleOnce,      // --module without continuation: lowest eligible change, once
    ContinueModule,  // --module --continue-module
    ContinueReady    // --continue-ready
};

enum class SelectionKind {
    Selected,
    AllComplete,
    Blocked
};

struct Selection {
    SelectionKind kind = SelectionKind::Selected;
    std::optional<std::string> change_id;
    // Every non-complete item in scope when nothing is eligible.
    std::vector<protocol::WorkItem> blocking;
};

// Rejects flag combinations that name more than one continuation mode.
core::errors::Result<ContinuationMode> resolve_mode(const protocol::LoopRequest& request);

bool is_continuation(ContinuationMode mode);

std::string to_string(ContinuationMode mode);

// Ready or InProgress items in scope, lowest id first.
core::errors::Result<std::vector<protocol::WorkItem>> list_eligible(
    const WorkStatusQuery& query, const protocol::WorkScope& scope);

std::string describe_blocking(const std::vector<protocol::WorkItem>& items);

// Re-queried before every iteration, so external status changes are picked up.
class TargetSelector {
public:
    TargetSelector(const WorkStatusQuery& query, ContinuationMode mode,
                   std::optional<std::string> change_id,
                   std::optional<std::string> module_id);

    // Changes in `exclude` had their completion accepted during this run and
    // are never picked again.
    core::errors::Result<Selection> select_next(const std::set<std::string>& exclude);

    ContinuationMode mode() const { return mode_; }

private:
    core::errors::Result<Selection> select_lowest(const std::set<std::string>& exclude) const;

    const WorkStatusQuery& query_;
    ContinuationMode mode_;
    std::optional<std::string> change_id_;
    std::optional<std::string> module_id_;
    std::optional<std::string> pinned_;
};

}  // namespace ralph::work
