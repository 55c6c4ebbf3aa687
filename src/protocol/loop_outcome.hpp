#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/exit_codes.hpp"
#include "protocol/work_item.hpp"

namespace ralph::protocol {

enum class LoopStatus {
    Completed,
    MaxIterationsReached,
    Blocked,
    Aborted,
    Cancelled
};

struct LoopOutcome {
    LoopStatus status = LoopStatus::Completed;
    std::string message;
    std::vector<WorkItem> blocking;
    std::uint32_t iterations_run = 0;
    std::vector<std::string> completed_changes;
};

inline std::string to_string(const LoopStatus status) {
    switch (status) {
        case LoopStatus::Completed:
            return "completed";
        case LoopStatus::MaxIterationsReached:
            return "max_iterations";
        case LoopStatus::Blocked:
            return "blocked";
        case LoopStatus::Aborted:
            return "aborted";
        case LoopStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

inline core::errors::ExitCode exit_code_for(const LoopStatus status) {
    switch (status) {
        case LoopStatus::Completed:
        case LoopStatus::MaxIterationsReached:
            return core::errors::ExitCode::Success;
        case LoopStatus::Blocked:
            return core::errors::ExitCode::Blocked;
        case LoopStatus::Aborted:
            return core::errors::ExitCode::Aborted;
        case LoopStatus::Cancelled:
            return core::errors::ExitCode::Cancelled;
        default:
            return core::errors::ExitCode::Fatal;
    }
}

}  // namespace ralph::protocol
