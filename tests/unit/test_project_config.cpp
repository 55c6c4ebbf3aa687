#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/project_config.hpp"
#include "core/config/run_id.hpp"

namespace {

using ralph::core::config::WorkspacePaths;
using ralph::core::errors::get_error;
using ralph::core::errors::get_value;
using ralph::core::errors::is_error;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_config_" + ralph::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(ProjectConfigTest, ParsesRalphSection) {
    auto parsed = ralph::core::config::parse_project_config(R"({
        "ralph": {
            "validationCommands": ["make lint", "make test"],
            "worktrees": {"enabled": true},
            "harness": "codex",
            "errorThreshold": 4,
            "inactivityTimeoutSeconds": 120
        }
    })");
    ASSERT_FALSE(is_error(parsed));
    const auto& config = get_value(parsed);
    EXPECT_EQ(config.validation_commands,
              (std::vector<std::string>{"make lint", "make test"}));
    EXPECT_TRUE(config.worktrees_enabled);
    EXPECT_EQ(config.harness.value_or(""), "codex");
    EXPECT_EQ(config.error_threshold.value_or(0), 4u);
    EXPECT_EQ(config.inactivity_timeout.value_or(std::chrono::seconds(0)).count(), 120);
}

TEST(ProjectConfigTest, AcceptsSingleTopLevelCommand) {
    auto parsed = ralph::core::config::parse_project_config(R"({"validationCommand": "make check"})");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).validation_commands, (std::vector<std::string>{"make check"}));
    EXPECT_FALSE(get_value(parsed).worktrees_enabled);
}

TEST(ProjectConfigTest, RejectsInvalidJsonAndBadValues) {
    auto broken = ralph::core::config::parse_project_config("{");
    ASSERT_TRUE(is_error(broken));
    EXPECT_EQ(get_error(broken).code, "invalid_config");

    auto zero = ralph::core::config::parse_project_config(R"({"errorThreshold": 0})");
    ASSERT_TRUE(is_error(zero));

    auto wrong_type = ralph::core::config::parse_project_config(R"({"harness": 3})");
    ASSERT_TRUE(is_error(wrong_type));
    EXPECT_EQ(get_error(wrong_type).code, "invalid_config");
}

TEST(ProjectConfigTest, RejectsOutOfRangeNumbers) {
    auto huge = ralph::core::config::parse_project_config(R"({"errorThreshold": 4294967297})");
    ASSERT_TRUE(is_error(huge));
    EXPECT_EQ(get_error(huge).code, "invalid_config");

    auto unsigned_max = ralph::core::config::parse_project_config(
        R"({"ralph": {"errorThreshold": 18446744073709551615}})");
    ASSERT_TRUE(is_error(unsigned_max));

    auto long_timeout = ralph::core::config::parse_project_config(
        R"({"validationTimeoutSeconds": 9223372036854775807})");
    ASSERT_TRUE(is_error(long_timeout));
    EXPECT_EQ(get_error(long_timeout).code, "invalid_config");

    auto fractional = ralph::core::config::parse_project_config(
        R"({"inactivityTimeoutSeconds": 2.5})");
    ASSERT_TRUE(is_error(fractional));

    auto upper = ralph::core::config::parse_project_config(
        R"({"errorThreshold": 100000, "inactivityTimeoutSeconds": 604800})");
    ASSERT_FALSE(is_error(upper));
    EXPECT_EQ(get_value(upper).error_threshold.value_or(0), 100000u);
    EXPECT_EQ(get_value(upper).inactivity_timeout.value().count(), 604800);
}

TEST(ProjectConfigTest, RootFileWinsOverDataDir) {
    TempWorkspace workspace;
    write_file(workspace.root() / "ralph.json", R"({"harness": "claude"})");
    write_file(workspace.root() / ".ralph" / "config.json", R"({"harness": "codex"})");

    auto loaded = ralph::core::config::load_project_config(WorkspacePaths(workspace.root()));
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).harness.value_or(""), "claude");
    EXPECT_EQ(get_value(loaded).source.value().string(),
              (workspace.root() / "ralph.json").string());
}

TEST(ProjectConfigTest, FallsBackToAgentsMarkdown) {
    TempWorkspace workspace;
    write_file(workspace.root() / "AGENTS.md", "# Notes\n\nRun:\n\n  make check\n");

    auto loaded = ralph::core::config::load_project_config(WorkspacePaths(workspace.root()));
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).validation_commands, (std::vector<std::string>{"make check"}));
    EXPECT_FALSE(get_value(loaded).source.has_value());
}

TEST(ProjectConfigTest, EmptyWorkspaceHasDefaults) {
    TempWorkspace workspace;
    auto loaded = ralph::core::config::load_project_config(WorkspacePaths(workspace.root()));
    ASSERT_FALSE(is_error(loaded));
    EXPECT_TRUE(get_value(loaded).validation_commands.empty());
    EXPECT_EQ(get_value(loaded).validation_timeout.count(), 300);
}

}  // namespace
