#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "core/errors/loop_errors.hpp"
#include "loop/completion.hpp"

namespace {

using ralph::core::errors::LoopError;
using ralph::core::errors::Result;
using ralph::loop::detect_completion_promise;
using ralph::loop::ValidationGate;
using ralph::process::SystemProcessRunner;
using ralph::protocol::TaskEntry;
using ralph::protocol::TaskProgress;
using ralph::protocol::TaskStatus;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_completion_" + ralph::core::config::generate_run_id());
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

class FakeTasks final : public ralph::work::TaskQuery {
public:
    std::map<std::string, TaskProgress> progress;

    Result<TaskProgress> task_progress(const std::string& change_id) const override {
        auto it = progress.find(change_id);
        if (it == progress.end()) {
            return LoopError{ralph::core::errors::ErrorCategory::Input, "no such change",
                             "change_not_found"};
        }
        return it->second;
    }
};

TEST(CompletionPromiseTest, DetectsInlineMarker) {
    EXPECT_TRUE(detect_completion_promise("done <promise>COMPLETE</promise>", "COMPLETE").detected);
}

TEST(CompletionPromiseTest, ToleratesNewlinesAroundToken) {
    EXPECT_TRUE(
        detect_completion_promise("<promise>\nCOMPLETE\n</promise>\n", "COMPLETE").detected);
    EXPECT_TRUE(detect_completion_promise("<promise>  COMPLETE\t</promise>", "COMPLETE").detected);
}

TEST(CompletionPromiseTest, ScansPastNonMatchingPairs) {
    const std::string output =
        "<promise>NOT YET</promise>\nwork...\n<promise>COMPLETE</promise>";
    EXPECT_TRUE(detect_completion_promise(output, "COMPLETE").detected);
}

TEST(CompletionPromiseTest, RejectsWrongOrPartialMarkers) {
    EXPECT_FALSE(detect_completion_promise("<promise>DONE</promise>", "COMPLETE").detected);
    EXPECT_FALSE(detect_completion_promise("<promise>COMPLETE", "COMPLETE").detected);
    EXPECT_FALSE(detect_completion_promise("COMPLETE", "COMPLETE").detected);
    EXPECT_FALSE(
        detect_completion_promise("<promise>COMPLETE NOW</promise>", "COMPLETE").detected);
}

TEST(CompletionPromiseTest, HonorsCustomToken) {
    EXPECT_TRUE(detect_completion_promise("<promise>SHIP IT</promise>", "SHIP IT").detected);
}

TEST(TruncateOutputTest, KeepsShortOutput) {
    EXPECT_EQ(ralph::loop::truncate_output("short", 100), "short");
}

TEST(TruncateOutputTest, CutsOnCharacterBoundary) {
    // "é" is two bytes; a cut after byte 2 would split it.
    const std::string text = "ab\xC3\xA9xyz";
    const std::string truncated = ralph::loop::truncate_output(text, 3);
    EXPECT_EQ(truncated.substr(0, 2), "ab");
    EXPECT_EQ(truncated.find('\xC3'), std::string::npos);
    EXPECT_NE(truncated.find("(truncated)"), std::string::npos);
}

TEST(ValidationGateTest, IncompleteTaskRejectsWithItsId) {
    TempWorkspace workspace;
    FakeTasks tasks;
    tasks.progress["001-01_demo"] = TaskProgress{
        {TaskEntry{"1.1", "Scaffold", TaskStatus::Complete},
         TaskEntry{"1.2", "Wire config", TaskStatus::Pending}}};
    SystemProcessRunner runner;
    const ValidationGate gate(tasks, runner, {}, std::nullopt, std::chrono::seconds(10));

    const auto report = gate.evaluate(std::string("001-01_demo"), workspace.root());
    EXPECT_FALSE(report.passed);
    ASSERT_EQ(report.steps.size(), 1u);
    const std::string context = report.failure_context();
    EXPECT_NE(context.find("1.2"), std::string::npos);
    EXPECT_NE(context.find("Result: FAIL"), std::string::npos);
    EXPECT_EQ(context.find("1.1 Scaffold"), std::string::npos);
}

TEST(ValidationGateTest, ShelvedTasksDoNotBlock) {
    TempWorkspace workspace;
    FakeTasks tasks;
    tasks.progress["001-01_demo"] = TaskProgress{
        {TaskEntry{"1", "Done", TaskStatus::Complete},
         TaskEntry{"2", "Later", TaskStatus::Shelved}}};
    SystemProcessRunner runner;
    const ValidationGate gate(tasks, runner, {}, std::nullopt, std::chrono::seconds(10));

    EXPECT_TRUE(gate.evaluate(std::string("001-01_demo"), workspace.root()).passed);
}

TEST(ValidationGateTest, FailingProjectCommandRejectsWithOutput) {
    TempWorkspace workspace;
    FakeTasks tasks;
    SystemProcessRunner runner;
    const ValidationGate gate(tasks, runner, {"echo lint-broken; exit 3"}, std::nullopt,
                              std::chrono::seconds(10));

    const auto report = gate.evaluate(std::nullopt, workspace.root());
    EXPECT_FALSE(report.passed);
    const std::string context = report.failure_context();
    EXPECT_NE(context.find("lint-broken"), std::string::npos);
    EXPECT_NE(context.find("exit code 3"), std::string::npos);
}

TEST(ValidationGateTest, StopsAtFirstFailure) {
    TempWorkspace workspace;
    FakeTasks tasks;
    SystemProcessRunner runner;
    const ValidationGate gate(tasks, runner, {"false"}, std::string("touch extra-ran"),
                              std::chrono::seconds(10));

    EXPECT_FALSE(gate.evaluate(std::nullopt, workspace.root()).passed);
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "extra-ran"));
}

TEST(ValidationGateTest, RunsExtraCommandInWorkingDirectory) {
    TempWorkspace workspace;
    FakeTasks tasks;
    SystemProcessRunner runner;
    const ValidationGate gate(tasks, runner, {"true"}, std::string("touch extra-ran"),
                              std::chrono::seconds(10));

    const auto report = gate.evaluate(std::nullopt, workspace.root());
    EXPECT_TRUE(report.passed);
    EXPECT_EQ(report.steps.size(), 2u);
    EXPECT_TRUE(std::filesystem::exists(workspace.root() / "extra-ran"));
}

TEST(ValidationGateTest, CancelledGateRunsNoCommand) {
    TempWorkspace workspace;
    FakeTasks tasks;
    SystemProcessRunner runner;
    auto cancel = std::make_shared<std::atomic_bool>(true);
    const ValidationGate gate(tasks, runner, {"touch project-ran"}, std::nullopt,
                              std::chrono::seconds(10), cancel);

    const auto report = gate.evaluate(std::nullopt, workspace.root());
    EXPECT_FALSE(report.passed);
    ASSERT_EQ(report.steps.size(), 1u);
    EXPECT_NE(report.steps.front().summary.find("cancelled"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "project-ran"));
}

TEST(ValidationGateTest, UnreadableTasksFailTheGate) {
    TempWorkspace workspace;
    FakeTasks tasks;
    SystemProcessRunner runner;
    const ValidationGate gate(tasks, runner, {}, std::nullopt, std::chrono::seconds(10));

    EXPECT_FALSE(gate.evaluate(std::string("missing"), workspace.root()).passed);
}

}  // namespace
