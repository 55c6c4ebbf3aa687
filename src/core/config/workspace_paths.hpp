#pragma once
#include <filesystem>
#include <string>
#include <utility>

namespace ralph::core::config {

    // On-disk layout under the workspace root:
    //   .ralph/changes/<change-id>/{proposal.md,tasks.md}
    //   .ralph/modules/<module-id>/module.md
    //   .ralph/state/<change-id>/{state.json,context.md}
    //   .ralph/audit/events.jsonl
    //   .ralph/config.json
    class WorkspacePaths {
    public:
        explicit WorkspacePaths(std::filesystem::path root) : root_(std::move(root)) {}

        const std::filesystem::path& root() const { return root_; }
        std::filesystem::path data_dir() const { return root_ / ".ralph"; }
        std::filesystem::path changes_dir() const { return data_dir() / "changes"; }
        std::filesystem::path modules_dir() const { return data_dir() / "modules"; }
        std::filesystem::path state_dir() const { return data_dir() / "state"; }
        std::filesystem::path audit_dir() const { return data_dir() / "audit"; }
        std::filesystem::path config_file() const { return data_dir() / "config.json"; }
        std::filesystem::path root_config_file() const { return root_ / "ralph.json"; }

    private:
        std::filesystem::path root_;
    };

} // namespace ralph::core::config
