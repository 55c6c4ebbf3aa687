#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "work/work_repository.hpp"

namespace {

using ralph::core::config::WorkspacePaths;
using ralph::core::errors::get_error;
using ralph::core::errors::get_value;
using ralph::core::errors::is_error;
using ralph::protocol::TaskStatus;
using ralph::protocol::WorkStatus;
using ralph::work::FsWorkRepository;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_work_repo_" + ralph::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    void add_change(const std::string& id, const std::string& tasks, bool proposal = true) {
        const auto dir = root_ / ".ralph" / "changes" / id;
        std::filesystem::create_directories(dir);
        if (proposal) {
            std::ofstream(dir / "proposal.md") << "# " << id << "\n";
        }
        if (!tasks.empty()) {
            std::ofstream(dir / "tasks.md") << tasks;
        }
    }

private:
    std::filesystem::path root_;
};

TEST(TaskParserTest, ReadsMarkersAndIds) {
    const auto progress = ralph::work::parse_tasks(
        "# Tasks\n"
        "- [x] 1.1 Create schema\n"
        "- [ ] 1.2: Add migration\n"
        "- [~] Wire endpoint\n"
        "  * [>] Nested in progress\n"
        "- [-] 2.1 Later\n"
        "- [?] not a task\n"
        "plain text\n");
    ASSERT_EQ(progress.tasks.size(), 5u);
    EXPECT_EQ(progress.tasks[0].id, "1.1");
    EXPECT_EQ(progress.tasks[0].name, "Create schema");
    EXPECT_EQ(progress.tasks[0].status, TaskStatus::Complete);
    EXPECT_EQ(progress.tasks[1].id, "1.2");
    EXPECT_EQ(progress.tasks[1].status, TaskStatus::Pending);
    EXPECT_EQ(progress.tasks[2].id, "3");
    EXPECT_EQ(progress.tasks[2].status, TaskStatus::InProgress);
    EXPECT_EQ(progress.tasks[3].status, TaskStatus::InProgress);
    EXPECT_EQ(progress.tasks[4].status, TaskStatus::Shelved);
    EXPECT_EQ(progress.incomplete().size(), 3u);
}

TEST(TaskParserTest, DerivesStatus) {
    using ralph::work::derive_status;
    using ralph::work::parse_tasks;

    EXPECT_EQ(derive_status(false, true, parse_tasks("- [ ] a\n")), WorkStatus::Draft);
    EXPECT_EQ(derive_status(true, false, {}), WorkStatus::Draft);
    EXPECT_EQ(derive_status(true, true, parse_tasks("- [ ] a\n- [ ] b\n")), WorkStatus::Ready);
    EXPECT_EQ(derive_status(true, true, parse_tasks("- [x] a\n- [ ] b\n")),
              WorkStatus::InProgress);
    EXPECT_EQ(derive_status(true, true, parse_tasks("- [x] a\n- [x] b\n")),
              WorkStatus::Complete);
    EXPECT_EQ(derive_status(true, true, parse_tasks("- [x] a\n- [-] b\n")), WorkStatus::Paused);
}

TEST(TaskParserTest, ModuleIsPrefixBeforeDash) {
    EXPECT_EQ(ralph::work::module_of("003-05_add-login"), "003");
    EXPECT_EQ(ralph::work::module_of("standalone"), "standalone");
}

TEST(FsWorkRepositoryTest, ListsItemsSortedAndScoped) {
    TempWorkspace workspace;
    workspace.add_change("002-01_beta", "- [ ] 1 todo\n");
    workspace.add_change("001-02_alpha", "- [x] 1 done\n");
    workspace.add_change("001-01_draft", "", false);

    FsWorkRepository repo{WorkspacePaths(workspace.root())};
    auto all = repo.list_items({});
    ASSERT_FALSE(is_error(all));
    const auto& items = get_value(all);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].change_id, "001-01_draft");
    EXPECT_EQ(items[0].status, WorkStatus::Draft);
    EXPECT_EQ(items[1].status, WorkStatus::Complete);
    EXPECT_EQ(items[2].status, WorkStatus::Ready);
    EXPECT_EQ(items[2].module_id, "002");

    ralph::protocol::WorkScope scope;
    scope.module_id = "001";
    auto scoped = repo.list_items(scope);
    ASSERT_FALSE(is_error(scoped));
    EXPECT_EQ(get_value(scoped).size(), 2u);
}

TEST(FsWorkRepositoryTest, EmptyWorkspaceHasNoItems) {
    TempWorkspace workspace;
    FsWorkRepository repo{WorkspacePaths(workspace.root())};
    auto all = repo.list_items({});
    ASSERT_FALSE(is_error(all));
    EXPECT_TRUE(get_value(all).empty());
}

TEST(FsWorkRepositoryTest, UnknownChangeIsError) {
    TempWorkspace workspace;
    FsWorkRepository repo{WorkspacePaths(workspace.root())};
    auto status = repo.get_status("404-01_missing");
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "change_not_found");

    auto escape = repo.get_status("../etc");
    ASSERT_TRUE(is_error(escape));
    EXPECT_EQ(get_error(escape).code, "invalid_change_id");
}

TEST(FsWorkRepositoryTest, ReadsDocuments) {
    TempWorkspace workspace;
    workspace.add_change("001-01_alpha", "- [ ] 1 todo\n");
    const auto module_dir = workspace.root() / ".ralph" / "modules" / "001";
    std::filesystem::create_directories(module_dir);
    std::ofstream(module_dir / "module.md") << "Auth module\n";

    FsWorkRepository repo{WorkspacePaths(workspace.root())};
    EXPECT_EQ(repo.change_proposal("001-01_alpha").value_or(""), "# 001-01_alpha\n");
    EXPECT_EQ(repo.module_overview("001").value_or(""), "Auth module\n");
    EXPECT_FALSE(repo.module_overview("999").has_value());

    auto progress = repo.task_progress("001-01_alpha");
    ASSERT_FALSE(is_error(progress));
    EXPECT_EQ(get_value(progress).tasks.size(), 1u);
}

}  // namespace
