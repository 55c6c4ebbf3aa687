#include "work/work_repository.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace ralph::work {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using protocol::TaskEntry;
using protocol::TaskProgress;
using protocol::TaskStatus;
using protocol::WorkItem;
using protocol::WorkStatus;

namespace {

std::optional<std::string> read_text(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool is_task_id(const std::string& token) {
    if (token.empty() || !std::isdigit(static_cast<unsigned char>(token.front()))) {
        return false;
    }
    return std::all_of(token.begin(), token.end(), [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c)) || c == '.';
    });
}

std::optional<TaskStatus> marker_status(const char marker) {
    switch (marker) {
        case ' ':
            return TaskStatus::Pending;
        case 'x':
        case 'X':
            return TaskStatus::Complete;
        case '~':
        case '>':
            return TaskStatus::InProgress;
        case '-':
            return TaskStatus::Shelved;
        default:
            return std::nullopt;
    }
}

}  // namespace

std::string module_of(const std::string& change_id) {
    const auto dash = change_id.find('-');
    return dash == std::string::npos ? change_id : change_id.substr(0, dash);
}

TaskProgress parse_tasks(const std::string& markdown) {
    TaskProgress progress;
    std::istringstream in(markdown);
    std::string line;
    std::size_t sequence = 0;
    while (std::getline(in, line)) {
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        // "- [x] 1.2 Name", "* [ ] Name"
        const std::string body = line.substr(first);
        if (body.size() < 5 || (body[0] != '-' && body[0] != '*') || body[1] != ' ' ||
            body[2] != '[' || body[4] != ']') {
            continue;
        }
        const auto status = marker_status(body[3]);
        if (!status.has_value()) {
            continue;
        }

        std::string text = body.size() > 5 ? body.substr(5) : "";
        const auto text_start = text.find_first_not_of(" \t");
        text = text_start == std::string::npos ? "" : text.substr(text_start);
        while (!text.empty() && (text.back() == '\r' || text.back() == ' ')) {
            text.pop_back();
        }

        ++sequence;
        TaskEntry entry;
        entry.status = status.value();
        const auto space = text.find(' ');
        std::string first_token = text.substr(0, space);
        if (!first_token.empty() && first_token.back() == ':') {
            first_token.pop_back();
        }
        if (is_task_id(first_token)) {
            entry.id = first_token;
            entry.name = space == std::string::npos ? "" : text.substr(space + 1);
        } else {
            entry.id = std::to_string(sequence);
            entry.name = text;
        }
        progress.tasks.push_back(std::move(entry));
    }
    return progress;
}

WorkStatus derive_status(const bool has_proposal, const bool has_tasks,
                         const TaskProgress& progress) {
    if (!has_proposal || !has_tasks || progress.tasks.empty()) {
        return WorkStatus::Draft;
    }
    const std::size_t remaining = progress.incomplete().size();
    if (remaining == 0 && progress.count(TaskStatus::Shelved) > 0) {
        return WorkStatus::Paused;
    }
    if (remaining == 0) {
        return WorkStatus::Complete;
    }
    if (progress.count(TaskStatus::Complete) > 0 ||
        progress.count(TaskStatus::InProgress) > 0) {
        return WorkStatus::InProgress;
    }
    return WorkStatus::Ready;
}

FsWorkRepository::FsWorkRepository(core::config::WorkspacePaths paths)
    : paths_(std::move(paths)) {}

core::errors::Result<std::filesystem::path> FsWorkRepository::change_dir(
    const std::string& change_id) const {
    if (change_id.empty() || change_id.find('/') != std::string::npos ||
        change_id.find('\\') != std::string::npos || change_id.find("..") != std::string::npos) {
        return LoopError{ErrorCategory::Input, "Invalid change id: '" + change_id + "'",
                         "invalid_change_id"};
    }
    const auto dir = paths_.changes_dir() / change_id;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return LoopError{ErrorCategory::Input, "Change not found: " + change_id,
                         "change_not_found",
                         "Expected a directory at " + dir.string()};
    }
    return dir;
}

core::errors::Result<std::vector<WorkItem>> FsWorkRepository::list_items(
    const protocol::WorkScope& scope) const {
    std::vector<WorkItem> items;
    std::error_code ec;
    const auto root = paths_.changes_dir();
    if (!std::filesystem::exists(root, ec) || ec) {
        return items;
    }

    std::vector<std::string> ids;
    for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec) && !entry_ec) {
            ids.push_back(entry.path().filename().string());
        }
    }
    if (ec) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to list changes under " + root.string(),
                         "work_list_failed"};
    }
    std::sort(ids.begin(), ids.end());

    for (const auto& id : ids) {
        const std::string module = module_of(id);
        if (scope.module_id.has_value() && module != scope.module_id.value()) {
            continue;
        }
        auto status = get_status(id);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
        items.push_back(WorkItem{id, core::errors::get_value(status), module});
    }
    return items;
}

core::errors::Result<WorkStatus> FsWorkRepository::get_status(
    const std::string& change_id) const {
    auto dir_result = change_dir(change_id);
    if (core::errors::is_error(dir_result)) {
        return core::errors::get_error(dir_result);
    }
    const auto& dir = core::errors::get_value(dir_result);

    std::error_code ec;
    const bool has_proposal = std::filesystem::is_regular_file(dir / "proposal.md", ec);
    const auto tasks_text = read_text(dir / "tasks.md");
    const TaskProgress progress =
        tasks_text.has_value() ? parse_tasks(tasks_text.value()) : TaskProgress{};
    return derive_status(has_proposal, tasks_text.has_value(), progress);
}

core::errors::Result<TaskProgress> FsWorkRepository::task_progress(
    const std::string& change_id) const {
    auto dir_result = change_dir(change_id);
    if (core::errors::is_error(dir_result)) {
        return core::errors::get_error(dir_result);
    }
    const auto tasks_text = read_text(core::errors::get_value(dir_result) / "tasks.md");
    if (!tasks_text.has_value()) {
        return TaskProgress{};
    }
    return parse_tasks(tasks_text.value());
}

std::optional<std::string> FsWorkRepository::change_proposal(
    const std::string& change_id) const {
    auto dir_result = change_dir(change_id);
    if (core::errors::is_error(dir_result)) {
        return std::nullopt;
    }
    return read_text(core::errors::get_value(dir_result) / "proposal.md");
}

std::optional<std::string> FsWorkRepository::module_overview(
    const std::string& module_id) const {
    if (module_id.empty() || module_id.find('/') != std::string::npos ||
        module_id.find("..") != std::string::npos) {
        return std::nullopt;
    }
    return read_text(paths_.modules_dir() / module_id / "module.md");
}

}  // namespace ralph::work
