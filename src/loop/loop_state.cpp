#include "loop/loop_state.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace ralph::loop {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxChangeIdLength = 256;

json record_to_json(const IterationRecord& record) {
    json payload;
    payload["iteration"] = record.iteration;
    payload["timestamp_ms"] = record.timestamp_ms;
    payload["duration_ms"] = record.duration_ms;
    payload["exit_code"] = record.exit_code;
    payload["completion_promise_found"] = record.completion_promise_found;
    payload["file_changes"] = record.file_changes;
    return payload;
}

IterationRecord record_from_json(const json& payload) {
    IterationRecord record;
    record.iteration = payload.value("iteration", 0u);
    record.timestamp_ms = payload.value("timestamp_ms", static_cast<std::int64_t>(0));
    record.duration_ms = payload.value("duration_ms", 0.0);
    record.exit_code = payload.value("exit_code", 0);
    record.completion_promise_found = payload.value("completion_promise_found", false);
    record.file_changes = payload.value("file_changes", static_cast<std::size_t>(0));
    return record;
}

}  // namespace

StateStore::StateStore(core::config::WorkspacePaths paths) : paths_(std::move(paths)) {}

std::string StateStore::safe_segment(const std::string& change_id) {
    if (change_id.empty() || change_id.size() > kMaxChangeIdLength ||
        change_id.find('/') != std::string::npos ||
        change_id.find('\\') != std::string::npos ||
        change_id.find("..") != std::string::npos) {
        return kInvalidStateId;
    }
    return change_id;
}

std::filesystem::path StateStore::state_dir(const std::string& change_id) const {
    return paths_.state_dir() / safe_segment(change_id);
}

core::errors::Result<LoopState> StateStore::load(const std::string& change_id) const {
    LoopState state;
    state.change_id = change_id;

    const auto path = state_dir(change_id) / "state.json";
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return state;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to open loop state: " + path.string(),
                         "state_read_failed"};
    }

    try {
        const json doc = json::parse(in);
        state.iteration_count = doc.value("iteration_count", 0u);
        state.consecutive_retriable_retries = doc.value("consecutive_retriable_retries", 0u);
        state.error_count = doc.value("error_count", 0u);
        if (doc.contains("pending_context") && doc["pending_context"].is_array()) {
            for (const auto& item : doc["pending_context"]) {
                state.pending_context.push_back(item.get<std::string>());
            }
        }
        if (doc.contains("history") && doc["history"].is_array()) {
            for (const auto& item : doc["history"]) {
                state.history.push_back(record_from_json(item));
            }
        }
    } catch (const json::exception& e) {
        return LoopError{ErrorCategory::Workspace,
                         "Loop state is corrupt: " + path.string() + " (" + e.what() + ")",
                         "state_corrupt",
                         "Delete the file to start the change from a fresh state."};
    }
    return state;
}

core::errors::Result<std::filesystem::path> StateStore::save(const LoopState& state) const {
    const auto dir = state_dir(state.change_id);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to create state directory: " + dir.string(),
                         "state_dir_create_failed"};
    }

    json doc;
    doc["change_id"] = state.change_id;
    doc["iteration_count"] = state.iteration_count;
    doc["consecutive_retriable_retries"] = state.consecutive_retriable_retries;
    doc["error_count"] = state.error_count;
    doc["pending_context"] = state.pending_context;
    doc["history"] = json::array();
    for (const auto& record : state.history) {
        doc["history"].push_back(record_to_json(record));
    }

    // Write-then-rename so an interrupted save never truncates the previous state.
    const auto path = dir / "state.json";
    const auto tmp_path = dir / "state.json.tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            return LoopError{ErrorCategory::Workspace,
                             "Unable to open state file: " + tmp_path.string(),
                             "state_write_failed"};
        }
        out << doc.dump(2) << "\n";
        if (!out.good()) {
            return LoopError{ErrorCategory::Workspace,
                             "Unable to write state file: " + tmp_path.string(),
                             "state_write_failed"};
        }
    }
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to replace state file: " + path.string(),
                         "state_write_failed"};
    }
    return path;
}

std::optional<std::string> StateStore::load_user_context(const std::string& change_id) const {
    const auto path = state_dir(change_id) / "context.md";
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const std::string text = buffer.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }
    return text;
}

core::errors::Result<std::filesystem::path> StateStore::append_user_context(
    const std::string& change_id, const std::string& text) const {
    const auto dir = state_dir(change_id);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to create state directory: " + dir.string(),
                         "state_dir_create_failed"};
    }

    const auto path = dir / "context.md";
    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to open context file: " + path.string(),
                         "context_write_failed"};
    }
    out << text << "\n\n";
    if (!out.good()) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to write context file: " + path.string(),
                         "context_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> StateStore::clear_user_context(
    const std::string& change_id) const {
    const auto path = state_dir(change_id) / "context.md";
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to remove context file: " + path.string(),
                         "context_clear_failed"};
    }
    return path;
}

}  // namespace ralph::loop
