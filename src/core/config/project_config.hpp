#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/workspace_paths.hpp"
#include "core/errors/loop_errors.hpp"

namespace ralph::core::config {

struct ProjectConfig {
    std::vector<std::string> validation_commands;
    bool worktrees_enabled = false;
    std::optional<std::string> harness;
    std::optional<std::uint32_t> error_threshold;
    std::optional<std::chrono::seconds> inactivity_timeout;
    std::chrono::seconds validation_timeout{300};
    // File the values were read from, if any.
    std::optional<std::filesystem::path> source;
};

// Reads ralph.json, then .ralph/config.json; the first file present wins.
// Validation commands fall back to `make check` / `make test` lines in
// AGENTS.md or CLAUDE.md when no JSON source names any.
core::errors::Result<ProjectConfig> load_project_config(const WorkspacePaths& paths);

core::errors::Result<ProjectConfig> parse_project_config(const std::string& json_text);

std::vector<std::string> discover_markdown_validation_commands(
    const std::filesystem::path& root);

}  // namespace ralph::core::config
