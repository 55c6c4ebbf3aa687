#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ralph::protocol {

enum class WorkStatus {
    Draft,
    Ready,
    InProgress,
    Paused,
    Complete
};

struct WorkItem {
    std::string change_id;
    WorkStatus status = WorkStatus::Draft;
    std::string module_id;
};

// Restricts a work query to one module; empty means the whole repository.
struct WorkScope {
    std::optional<std::string> module_id;
};

enum class TaskStatus {
    Pending,
    InProgress,
    Complete,
    Shelved
};

struct TaskEntry {
    std::string id;
    std::string name;
    TaskStatus status = TaskStatus::Pending;
};

struct TaskProgress {
    std::vector<TaskEntry> tasks;

    std::size_t count(const TaskStatus status) const {
        std::size_t n = 0;
        for (const auto& task : tasks) {
            if (task.status == status) {
                ++n;
            }
        }
        return n;
    }

    // Pending or in-progress tasks; shelved tasks do not block completion.
    std::vector<TaskEntry> incomplete() const {
        std::vector<TaskEntry> out;
        for (const auto& task : tasks) {
            if (task.status == TaskStatus::Pending ||
                task.status == TaskStatus::InProgress) {
                out.push_back(task);
            }
        }
        return out;
    }
};

inline bool is_eligible(const WorkStatus status) {
    return status == WorkStatus::Ready || status == WorkStatus::InProgress;
}

inline std::string to_string(const WorkStatus status) {
    switch (status) {
        case WorkStatus::Draft:
            return "draft";
        case WorkStatus::Ready:
            return "ready";
        case WorkStatus::InProgress:
            return "in-progress";
        case WorkStatus::Paused:
            return "paused";
        case WorkStatus::Complete:
            return "complete";
        default:
            return "unknown";
    }
}

inline std::string to_string(const TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:
            return "pending";
        case TaskStatus::InProgress:
            return "in-progress";
        case TaskStatus::Complete:
            return "complete";
        case TaskStatus::Shelved:
            return "shelved";
        default:
            return "unknown";
    }
}

}  // namespace ralph::protocol
