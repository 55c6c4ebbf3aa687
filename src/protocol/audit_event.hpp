#pragma once

#include <map>
#include <string>

namespace ralph::protocol {

enum class AuditEventType {
    LoopStarted,
    TargetSelected,
    IterationCompleted,
    HarnessCrashed,
    CompletionRejected,
    CompletionAccepted,
    LoopFinished
};

struct AuditEvent {
    AuditEventType type = AuditEventType::LoopStarted;
    std::string change_id;
    std::map<std::string, std::string> fields;
};

inline std::string to_string(const AuditEventType type) {
    switch (type) {
        case AuditEventType::LoopStarted:
            return "loop_started";
        case AuditEventType::TargetSelected:
            return "target_selected";
        case AuditEventType::IterationCompleted:
            return "iteration_completed";
        case AuditEventType::HarnessCrashed:
            return "harness_crashed";
        case AuditEventType::CompletionRejected:
            return "completion_rejected";
        case AuditEventType::CompletionAccepted:
            return "completion_accepted";
        case AuditEventType::LoopFinished:
            return "loop_finished";
        default:
            return "unknown";
    }
}

}  // namespace ralph::protocol
