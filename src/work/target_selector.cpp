#include "work/target_selector.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace ralph::work {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using protocol::WorkItem;
using protocol::WorkStatus;

core::errors::Result<ContinuationMode> resolve_mode(const protocol::LoopRequest& request) {
    if (request.continue_ready && request.change_id.has_value()) {
        return LoopError{ErrorCategory::Input,
                         "--continue-ready cannot be combined with --change",
                         "conflicting_flags"};
    }
    if (request.continue_ready && request.module_id.has_value()) {
        return LoopError{ErrorCategory::Input,
                         "--continue-ready cannot be combined with --module",
                         "conflicting_flags"};
    }
    if (request.continue_ready && request.continue_module) {
        return LoopError{ErrorCategory::Input,
                         "--continue-ready cannot be combined with --continue-module",
                         "conflicting_flags"};
    }
    if (request.continue_module && !request.module_id.has_value()) {
        return LoopError{ErrorCategory::Input, "--continue-module requires --module",
                         "missing_required_flag"};
    }
    if (request.continue_module && request.change_id.has_value()) {
        return LoopError{ErrorCategory::Input,
                         "--continue-module cannot be combined with --change",
                         "conflicting_flags"};
    }

    if (request.continue_ready) {
        return ContinuationMode::ContinueReady;
    }
    if (request.continue_module) {
        return ContinuationMode::ContinueModule;
    }
    if (request.change_id.has_value()) {
        return ContinuationMode::SingleChange;
    }
    if (request.module_id.has_value()) {
        return ContinuationMode::ModuleOnce;
    }
    return ContinuationMode::Unscoped;
}

bool is_continuation(const ContinuationMode mode) {
    return mode == ContinuationMode::ContinueModule || mode == ContinuationMode::ContinueReady;
}

std::string to_string(const ContinuationMode mode) {
    switch (mode) {
        case ContinuationMode::Unscoped:
            return "unscoped";
        case ContinuationMode::SingleChange:
            return "single-change";
        case ContinuationMode::ModuleOnce:
            return "module";
        case ContinuationMode::ContinueModule:
            return "continue-module";
        case ContinuationMode::ContinueReady:
            return "continue-ready";
        default:
            return "unknown";
    }
}

core::errors::Result<std::vector<WorkItem>> list_eligible(const WorkStatusQuery& query,
                                                          const protocol::WorkScope& scope) {
    auto listed = query.list_items(scope);
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    std::vector<WorkItem> eligible;
    for (const auto& item : core::errors::get_value(listed)) {
        if (protocol::is_eligible(item.status)) {
            eligible.push_back(item);
        }
    }
    std::sort(eligible.begin(), eligible.end(),
              [](const WorkItem& a, const WorkItem& b) { return a.change_id < b.change_id; });
    return eligible;
}

std::string describe_blocking(const std::vector<WorkItem>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item.change_id + " (" + protocol::to_string(item.status) + ")";
    }
    return out;
}

TargetSelector::TargetSelector(const WorkStatusQuery& query, const ContinuationMode mode,
                               std::optional<std::string> change_id,
                               std::optional<std::string> module_id)
    : query_(query),
      mode_(mode),
      change_id_(std::move(change_id)),
      module_id_(std::move(module_id)) {}

core::errors::Result<Selection> TargetSelector::select_next(
    const std::set<std::string>& exclude) {
    switch (mode_) {
        case ContinuationMode::Unscoped:
            return Selection{SelectionKind::Selected, std::nullopt, {}};
        case ContinuationMode::SingleChange: {
            auto status = query_.get_status(change_id_.value_or(""));
            if (core::errors::is_error(status)) {
                return core::errors::get_error(status);
            }
            return Selection{SelectionKind::Selected, change_id_, {}};
        }
        case ContinuationMode::ModuleOnce: {
            if (pinned_.has_value()) {
                return Selection{SelectionKind::Selected, pinned_, {}};
            }
            auto selection = select_lowest(exclude);
            if (!core::errors::is_error(selection)) {
                pinned_ = core::errors::get_value(selection).change_id;
            }
            return selection;
        }
        case ContinuationMode::ContinueModule:
        case ContinuationMode::ContinueReady:
            return select_lowest(exclude);
    }
    return LoopError{ErrorCategory::Internal, "Unhandled continuation mode.",
                     "invalid_mode"};
}

core::errors::Result<Selection> TargetSelector::select_lowest(
    const std::set<std::string>& exclude) const {
    protocol::WorkScope scope;
    if (mode_ != ContinuationMode::ContinueReady) {
        scope.module_id = module_id_;
    }

    auto listed = query_.list_items(scope);
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    std::vector<WorkItem> items = core::errors::get_value(listed);
    std::sort(items.begin(), items.end(),
              [](const WorkItem& a, const WorkItem& b) { return a.change_id < b.change_id; });

    if (items.empty() && scope.module_id.has_value()) {
        return LoopError{ErrorCategory::Input,
                         "No changes found for module " + scope.module_id.value(),
                         "module_empty"};
    }

    for (const auto& item : items) {
        if (protocol::is_eligible(item.status) && exclude.count(item.change_id) == 0) {
            LOG_DEBUG("Selected " + item.change_id + " (" +
                      protocol::to_string(item.status) + ")");
            return Selection{SelectionKind::Selected, item.change_id, {}};
        }
    }

    Selection selection;
    for (const auto& item : items) {
        if (item.status != WorkStatus::Complete) {
            selection.blocking.push_back(item);
        }
    }
    selection.kind = selection.blocking.empty() ? SelectionKind::AllComplete
                                                : SelectionKind::Blocked;
    return selection;
}

}  // namespace ralph::work
