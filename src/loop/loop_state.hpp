#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/workspace_paths.hpp"
#include "core/errors/loop_errors.hpp"

namespace ralph::loop {

struct IterationRecord {
    std::uint32_t iteration = 0;
    std::int64_t timestamp_ms = 0;
    double duration_ms = 0.0;
    int exit_code = 0;
    bool completion_promise_found = false;
    std::size_t file_changes = 0;
};

// Persisted per targeted change. The two counters are independent:
// crashes touch only consecutive_retriable_retries, failures only error_count.
struct LoopState {
    std::string change_id;
    std::uint32_t iteration_count = 0;
    std::uint32_t consecutive_retriable_retries = 0;
    std::uint32_t error_count = 0;
    std::vector<std::string> pending_context;
    std::vector<IterationRecord> history;
};

constexpr const char* kUnscopedStateId = "unscoped";
constexpr const char* kInvalidStateId = "invalid-change-id";

class StateStore {
public:
    explicit StateStore(core::config::WorkspacePaths paths);

    // A missing state file yields a fresh state.
    core::errors::Result<LoopState> load(const std::string& change_id) const;
    core::errors::Result<std::filesystem::path> save(const LoopState& state) const;

    // User-supplied context included in every prompt until cleared.
    std::optional<std::string> load_user_context(const std::string& change_id) const;
    core::errors::Result<std::filesystem::path> append_user_context(
        const std::string& change_id, const std::string& text) const;
    core::errors::Result<std::filesystem::path> clear_user_context(
        const std::string& change_id) const;

    std::filesystem::path state_dir(const std::string& change_id) const;

    // Directory name for a change id; ids that could escape the state root
    // collapse to kInvalidStateId.
    static std::string safe_segment(const std::string& change_id);

private:
    core::config::WorkspacePaths paths_;
};

}  // namespace ralph::loop
